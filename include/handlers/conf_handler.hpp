#pragma once

#include <string>
#include <vector>

#include "conf/revtun_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "revtun_common.hpp"

namespace revtun {

// `revtun conf get <key>` / `revtun conf set <key> <value>`. Works against
// the raw merged configuration, so it can fill in a configuration that does
// not validate yet.
class ConfHandler : public revtun::IHandler {
  IRevtunConfigProvider &config_provider_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;

public:
  ConfHandler(IRevtunConfigProvider &config_provider, CliCtx &cli_ctx,
              customio::ConsoleOutput &output_hub)
      : config_provider_(config_provider), output_hub_(output_hub),
        cli_ctx_(cli_ctx) {}

  // IHandler
  std::string command() const override { return "conf"; }

  static const std::vector<std::string> &known_keys();
  static bool is_integer_key(const std::string &key);

  std::string print_opt_desc() const;

  void start() override;

private:
  [[noreturn]] void show_usage(const std::string &msg = "");
};

} // namespace revtun
