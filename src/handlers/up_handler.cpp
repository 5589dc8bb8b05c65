#include "handlers/up_handler.hpp"

#include <memory>

#include "supervise/supervision_loop.hpp"

namespace revtun {

UpHandler::UpHandler(IoThread &io_thread,
                     provision::ProvisioningPipeline &pipeline,
                     tunnel::ILocalTunnelController &controller,
                     IRevtunConfigProvider &config_provider,
                     CancellationToken &token, CliCtx &cli_ctx,
                     customio::ConsoleOutput &output_hub)
    : io_thread_(io_thread), pipeline_(pipeline),
      controller_(controller), config_provider_(config_provider),
      token_(token), output_hub_(output_hub), cli_ctx_(cli_ctx),
      opt_desc_("up subcommand options") {
  opt_desc_.add_options()                                        //
      ("once", po::bool_switch(&options_.once)->default_value(false),
       "tear the tunnel down after verification instead of supervising it");
  po::parsed_options parsed = po::command_line_parser(cli_ctx_.unrecognized)
                                  .options(opt_desc_)
                                  .allow_unregistered()
                                  .run();
  po::store(parsed, cli_ctx_.vm);
  po::notify(cli_ctx_.vm);
  output_hub_.logger().trace()
      << "UpHandler initialized with options: " << opt_desc_;
}

void UpHandler::start() {
  auto outcome = pipeline_.run();
  if (outcome.status == provision::ProvisioningOutcome::Status::Cancelled) {
    output_hub_.logger().info() << "Provisioning cancelled; local tunnel "
                                   "torn down.";
    return;
  }

  if (options_.once) {
    output_hub_.logger().info() << "--once given; tearing down local tunnel.";
    outcome.lease->release();
    return;
  }

  const auto &config = config_provider_.get();
  auto loop = std::make_shared<supervise::SupervisionLoop>(
      io_thread_.ioc(), controller_, output_hub_.logger(),
      *outcome.local_config,
      std::chrono::seconds(config.supervision_interval_seconds));
  loop->start();
  output_hub_.logger().info() << "Client will keep running. Press Ctrl+C to "
                                 "stop.";

  token_.wait();

  output_hub_.logger().info() << "Stopping supervision...";
  loop->stop();
  // joins the I/O thread so no tick can race the teardown below
  io_thread_.stop();
  outcome.lease->release();
  output_hub_.logger().info() << "Local tunnel torn down after "
                              << loop->ticks() << " supervision check(s).";
}

} // namespace revtun
