#pragma once

#include <boost/program_options.hpp>
#include <string>

#include "conf/revtun_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "io/io_thread.hpp"
#include "provision/provisioning_pipeline.hpp"
#include "revtun_common.hpp"
#include "tunnel/local_tunnel_controller.hpp"
#include "util/cancellation.hpp"

namespace po = boost::program_options;

namespace revtun {

struct UpHandlerOptions {
  bool once{false};
};

// `revtun up` (also the default): converge both ends, then keep the local
// interface supervised until SIGINT/SIGTERM. With --once the tunnel is torn
// down right after verification.
class UpHandler : public revtun::IHandler {
  IoThread &io_thread_;
  provision::ProvisioningPipeline &pipeline_;
  tunnel::ILocalTunnelController &controller_;
  IRevtunConfigProvider &config_provider_;
  CancellationToken &token_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;

  po::options_description opt_desc_;
  UpHandlerOptions options_;

public:
  UpHandler(IoThread &io_thread,
            provision::ProvisioningPipeline &pipeline,
            tunnel::ILocalTunnelController &controller,
            IRevtunConfigProvider &config_provider, CancellationToken &token,
            CliCtx &cli_ctx, customio::ConsoleOutput &output_hub);

  std::string command() const override { return "up"; }

  void start() override;
};

} // namespace revtun
