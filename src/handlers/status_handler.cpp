#include "handlers/status_handler.hpp"

#include <fmt/format.h>

#include "render/provisioning_parameters.hpp"

namespace revtun {

void StatusHandler::start() {
  print_local();
  print_remote();
}

void StatusHandler::print_local() {
  const auto &config = config_provider_.get();
  auto &out = output_hub_.logger();
  auto state = controller_.state();
  out.info() << fmt::format("Local interface {}: {}", config.interface_name,
                            state.interface_up ? "up" : "down");
  if (!state.interface_up) {
    return;
  }
  if (state.last_handshake_age) {
    out.info() << fmt::format("Latest handshake: {}s ago",
                              state.last_handshake_age->count());
  } else {
    out.info() << "Latest handshake: never";
  }
  out.debug() << controller_.status_text();
}

void StatusHandler::print_remote() {
  const auto &config = config_provider_.get();
  auto &out = output_hub_.logger();

  auto server_key = keys_.read_remote_public_key(config.server_wg_pubfile);
  auto client_keys = keys_.read_local_key_pair(config.client_keyfile_path(),
                                               config.client_pubfile_path());

  auto observed =
      reconciler_.observe(config.remote_script, config.remote_service);
  out.info() << fmt::format(
      "Remote {}: script {}, service {} ({})", config.server_ssh_ip,
      observed.script_fingerprint ? *observed.script_fingerprint : "absent",
      observed.service_installed ? "installed" : "not installed",
      observed.service_active ? "active" : "inactive");

  if (!server_key || !client_keys) {
    out.info() << fmt::format(
        "Key material not provisioned yet (server: {}, client: {}); the next "
        "`up` will generate it and deploy.",
        server_key ? "present" : "missing",
        client_keys ? "present" : "missing");
    return;
  }

  auto params = render::make_parameters(config, *server_key, *client_keys);
  auto artifact = synthesizer_.synthesize(params);
  const bool update = reconcile::needs_update(artifact, observed);
  out.info() << fmt::format("Next `up` would {}: {}",
                            update ? "redeploy" : "keep the server as is",
                            reconcile::explain(artifact, observed));
}

} // namespace revtun
