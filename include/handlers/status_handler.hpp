#pragma once

#include <string>

#include "conf/revtun_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "keys/key_material_manager.hpp"
#include "reconcile/drift_reconciler.hpp"
#include "render/remote_script_synthesizer.hpp"
#include "tunnel/local_tunnel_controller.hpp"

namespace revtun {

// `revtun status`: read-only report of both ends. Never generates keys and
// never changes the server.
class StatusHandler : public revtun::IHandler {
  IRevtunConfigProvider &config_provider_;
  keys::KeyMaterialManager &keys_;
  tunnel::ILocalTunnelController &controller_;
  render::RemoteScriptSynthesizer &synthesizer_;
  reconcile::DriftReconciler &reconciler_;
  customio::ConsoleOutput &output_hub_;

public:
  StatusHandler(IRevtunConfigProvider &config_provider,
                keys::KeyMaterialManager &keys,
                tunnel::ILocalTunnelController &controller,
                render::RemoteScriptSynthesizer &synthesizer,
                reconcile::DriftReconciler &reconciler,
                customio::ConsoleOutput &output_hub)
      : config_provider_(config_provider), keys_(keys),
        controller_(controller), synthesizer_(synthesizer),
        reconciler_(reconciler), output_hub_(output_hub) {}

  std::string command() const override { return "status"; }

  void start() override;

private:
  void print_local();
  void print_remote();
};

} // namespace revtun
