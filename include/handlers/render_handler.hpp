#pragma once

#include <string>

#include "conf/revtun_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "keys/key_material_manager.hpp"
#include "render/provisioning_parameters.hpp"
#include "render/remote_script_synthesizer.hpp"
#include "revtun_common.hpp"

namespace revtun {

// `revtun render local|remote|unit`: writes the artifact to stdout and its
// fingerprint to stderr, so the output can be piped or diffed as is. Reads
// existing key material only.
class RenderHandler : public revtun::IHandler {
  IRevtunConfigProvider &config_provider_;
  keys::KeyMaterialManager &keys_;
  render::RemoteScriptSynthesizer &synthesizer_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;

public:
  RenderHandler(IRevtunConfigProvider &config_provider,
                keys::KeyMaterialManager &keys,
                render::RemoteScriptSynthesizer &synthesizer,
                CliCtx &cli_ctx, customio::ConsoleOutput &output_hub)
      : config_provider_(config_provider), keys_(keys),
        synthesizer_(synthesizer), output_hub_(output_hub),
        cli_ctx_(cli_ctx) {}

  std::string command() const override { return "render"; }

  static std::string usage() {
    return "Usage:\n"
           "  revtun render local   client wg-quick configuration\n"
           "  revtun render remote  server control script\n"
           "  revtun render unit    server systemd unit\n";
  }

  void start() override;

private:
  render::ProvisioningParameters load_parameters();
  void emit(const std::string &text);
};

} // namespace revtun
