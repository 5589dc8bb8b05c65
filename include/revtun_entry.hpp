#pragma once

#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>

#include "boost/di.hpp"
#include "conf/config_sources.hpp"
#include "conf/revtun_config.hpp"
#include "customio/console_output.hpp"
#include "exec/process_runner.hpp"
#include "handlers/conf_handler.hpp"
#include "handlers/down_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/render_handler.hpp"
#include "handlers/status_handler.hpp"
#include "handlers/up_handler.hpp"
#include "io/io_thread.hpp"
#include "my_error_codes.hpp"
#include "remote/remote_channel.hpp"
#include "revtun_common.hpp"
#include "revtun_errors.hpp"
#include "tunnel/local_tunnel_controller.hpp"
#include "tunnel/tunnel_cli.hpp"
#include "util/cancellation.hpp"

namespace di = boost::di;
namespace revtun {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

// Tools each subcommand shells out to.
inline std::vector<std::string> required_commands(const std::string &subcmd) {
  if (subcmd == "up" || subcmd == "status") {
    return {"wg", "wg-quick", "ssh", "scp"};
  }
  if (subcmd == "down") {
    return {"wg", "wg-quick"};
  }
  if (subcmd == "render") {
    return {"ssh"};
  }
  return {};
}

// Throws PreconditionError listing every missing tool.
inline void preflight(const std::string &subcmd) {
  std::vector<std::string> missing;
  for (const auto &cmd : required_commands(subcmd)) {
    if (!exec::command_exists(cmd)) {
      missing.push_back(cmd);
    }
  }
  if (missing.empty()) {
    return;
  }
  std::string list;
  for (size_t i = 0; i < missing.size(); ++i) {
    list += (i ? ", " : "") + missing[i];
  }
  throw PreconditionError(
      my_errors::CONFIG::MISSING_COMMAND,
      fmt::format("Required command(s) not found on PATH: {}", list),
      "preflight");
}

class App {
  revtun::CliCtx &cli_ctx_;
  ConfigSources &config_sources_;
  customio::ConsoleOutput *output_hub_{nullptr};
  IoThread *io_thread_{nullptr};
  std::unique_ptr<boost::asio::signal_set> signals_;
  std::once_flag shutdown_once_flag_;

public:
  App(ConfigSources &config_sources, revtun::CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), config_sources_(config_sources) {}

  void print_error(const Error &err) {
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else if (output_hub_) {
      output_hub_->logger().error() << err;
    } else {
      std::cerr << err << std::endl;
    }
  }

  // Returns the process exit code.
  int start() {
    static customio::ConsoleOutputWithColor output(
        cli_ctx_.verbosity_level());
    static render::RemoteScriptSynthesizer synthesizer;

    auto handler_module = []() {
      return di::make_injector(
          di::bind<revtun::UpHandler>().in(di::unique),
          di::bind<revtun::DownHandler>().in(di::unique),
          di::bind<revtun::StatusHandler>().in(di::unique),
          di::bind<revtun::RenderHandler>().in(di::unique),
          di::bind<revtun::ConfHandler>().in(di::unique),
          di::bind<revtun::IHandlerFactory>().to(
              [](const auto &inj) -> revtun::IHandlerFactory & {
                static revtun::HandlerFactoryImpl factory(
                    [&inj](const std::string &subcmd)
                        -> std::shared_ptr<revtun::IHandler> {
                      if (subcmd == "up") {
                        return inj.template create<
                            std::shared_ptr<revtun::UpHandler>>();
                      } else if (subcmd == "down") {
                        return inj.template create<
                            std::shared_ptr<revtun::DownHandler>>();
                      } else if (subcmd == "status") {
                        return inj.template create<
                            std::shared_ptr<revtun::StatusHandler>>();
                      } else if (subcmd == "render") {
                        return inj.template create<
                            std::shared_ptr<revtun::RenderHandler>>();
                      } else if (subcmd == "conf") {
                        return inj.template create<
                            std::shared_ptr<revtun::ConfHandler>>();
                      }
                      return nullptr;
                    });
                return factory;
              }));
    };

    auto injector = di::make_injector(
        handler_module(), di::bind<ConfigSources>().to(config_sources_),
        di::bind<revtun::IRevtunConfigProvider>()
            .to<revtun::RevtunConfigProviderFile>(),
        di::bind<exec::IProcessRunner>().to<exec::PosixProcessRunner>(),
        di::bind<remote::IRemoteChannel>().to<remote::SshRemoteChannel>(),
        di::bind<tunnel::ITunnelCli>().to<tunnel::WgQuickCli>(),
        di::bind<tunnel::ILocalTunnelController>()
            .to<tunnel::LocalTunnelController>(),
        di::bind<render::RemoteScriptSynthesizer>().to(synthesizer),
        di::bind<customio::IOutput>().to(output),
        di::bind<revtun::CliCtx>().to(cli_ctx_));

    output_hub_ = &injector.template create<customio::ConsoleOutput &>();
    io_thread_ = &injector.template create<IoThread &>();
    auto &token = injector.template create<CancellationToken &>();

    output_hub_->logger().debug() << "Config source directories:";
    for (const auto &source : config_sources_.paths()) {
      output_hub_->logger().debug() << " - " << source.string();
    }

    signals_ = std::make_unique<boost::asio::signal_set>(
        io_thread_->ioc(), SIGINT, SIGTERM);
    signals_->async_wait(
        [&token](const boost::system::error_code &error, int signal) {
          if (!error) {
            const char *signal_name = (signal == SIGINT) ? "SIGINT" : "SIGTERM";
            std::cerr << signal_name << " received. Shutting down..."
                      << std::endl;
            token.cancel();
          }
        });

    int exit_code = kExitOk;
    try {
      preflight(cli_ctx_.params.subcmd);
      auto &dispatcher =
          injector.template create<revtun::HandlerDispatcher &>();
      if (!dispatcher.dispatch_run(cli_ctx_.params.subcmd)) {
        output_hub_->logger().error()
            << "Unknown subcommand '" << cli_ctx_.params.subcmd
            << "'. Available: up, down, status, render, conf.";
        exit_code = kExitUsage;
      } else {
        output_hub_->logger().debug() << "Handler completed successfully.";
      }
    } catch (const OperationCancelled &e) {
      output_hub_->logger().info() << "Cancelled during " << e.step() << ".";
    } catch (const RevtunError &e) {
      print_error(e.to_error());
      if (e.code() == my_errors::CONFIG::MISSING_REQUIRED) {
        output_hub_->logger().info()
            << "Provide them with `revtun conf set <key> <value>` or in "
            << config_sources_.override_file().string();
      }
      exit_code = e.code() == my_errors::GENERAL::SHOW_OPT_DESC
                      ? kExitUsage
                      : kExitFailure;
    } catch (const std::exception &e) {
      print_error(Error{my_errors::GENERAL::UNEXPECTED_RESULT, e.what()});
      exit_code = kExitFailure;
    }
    shutdown();
    return exit_code;
  }

  void shutdown() {
    std::call_once(shutdown_once_flag_, [this] {
      output_hub_->logger().debug() << "Shutting down App...";
      if (signals_) {
        boost::system::error_code ec;
        signals_->cancel(ec);
        if (ec) {
          output_hub_->logger().debug()
              << "Shutdown: signal cancel failed: " << ec.message();
        }
      }
      // joins the I/O thread; the signal handler can no longer run after this
      io_thread_->stop();
      signals_.reset();
      output_hub_->logger().debug() << "App shutdown completed.";
    });
  }
};

inline int launch(ConfigSources &config, revtun::CliCtx &ctx) {
  auto app = std::make_shared<revtun::App>(config, ctx);
  return app->start();
}

} // namespace revtun
