#pragma once

#include <memory>
#include <string>

#include "customio/output.hpp"
#include "handlers/i_handler.hpp"
#include "revtun_common.hpp"

namespace revtun {

// Lifetime: instantiated via DI inside App::start and kept for the duration
// of the CLI session.
class HandlerDispatcher {
  customio::IOutput &output_;
  revtun::CliCtx &cli_ctx_;
  IHandlerFactory &handler_factory_;

public:
  HandlerDispatcher(customio::IOutput &out, //
                    revtun::CliCtx &ctx,    //
                    IHandlerFactory &handler_factory)
      : output_(out), cli_ctx_(ctx), handler_factory_(handler_factory) {}

  // Runs the handler for `subcmd`. Returns false when there is none; errors
  // raised by the handler propagate.
  bool dispatch_run(const std::string &subcmd) {
    auto handler = handler_factory_.create(subcmd);
    if (!handler) {
      return false;
    }
    output_.debug() << "Dispatching subcommand '" << handler->command()
                    << "' (" << cli_ctx_.positional_count()
                    << " positionals)";
    handler->start();
    return true;
  }
};

} // namespace revtun
