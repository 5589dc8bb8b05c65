#include "provision/provisioning_pipeline.hpp"

#include <chrono>

#include "render/provisioning_parameters.hpp"
#include "revtun_errors.hpp"

namespace revtun {
namespace provision {

void ProvisioningPipeline::wait_seconds(int seconds, const char *step,
                                        bool countdown) {
  for (int left = seconds; left > 0; --left) {
    if (countdown) {
      output_.debug() << "Waiting... " << left << " seconds";
    }
    if (!token_.sleep_for(std::chrono::seconds(1))) {
      throw OperationCancelled(step);
    }
  }
}

void ProvisioningPipeline::report_probe(const RevtunConfig &config,
                                        const verify::ProbeReport &report) {
  if (report.reachable) {
    output_.info() << "Tunnel is online!";
    output_.info() << "Traffic to " << config.additional_ip
                   << " will be forwarded to client at "
                   << config.client_tunnel_ip;
    return;
  }
  output_.warning() << "Tunnel connectivity test failed after "
                    << report.attempts_made << " attempt(s)";
  output_.warning() << "Diagnostics:\n" << report.diagnostics;
  output_.warning() << "Check server logs:\n  ssh " << config.ssh_user << "@"
                    << config.server_ssh_ip << " 'journalctl -u "
                    << config.remote_service << " -n 50'";
}

ProvisioningOutcome ProvisioningPipeline::run() {
  ProvisioningOutcome outcome;
  // Acquired before anything touches the interface so that every exit path
  // below tears it down exactly once.
  tunnel::TunnelLease lease(controller_);

  try {
    const auto &config = config_provider_.get();
    token_.throw_if_cancelled("start");

    output_.info() << "Getting server WireGuard public key...";
    const std::string server_pub = keys_.ensure_remote_key_pair(
        config.server_wg_keyfile, config.server_wg_pubfile);
    output_.info() << "Server public key: " << server_pub;
    token_.throw_if_cancelled("remote key material");

    const keys::KeyPair client_keys = keys_.ensure_local_key_pair(
        config.client_keyfile_path(), config.client_pubfile_path());
    output_.info() << "Client public key: " << client_keys.public_key;
    token_.throw_if_cancelled("local key material");

    const render::ProvisioningParameters params =
        render::make_parameters(config, server_pub, client_keys);
    auto local_config = render::render_config(render::Role::Local, params);
    token_.throw_if_cancelled("render");

    controller_.up(local_config);
    token_.throw_if_cancelled("local up");

    output_.info() << "Waiting for WireGuard handshake...";
    wait_seconds(config.handshake_wait_seconds, "handshake wait", false);

    output_.info() << "Generating server configuration...";
    const render::ScriptArtifact artifact = synthesizer_.synthesize(params);
    output_.debug() << "Server script fingerprint " << artifact.fingerprint;
    token_.throw_if_cancelled("synthesize");

    const auto remote_state =
        reconciler_.observe(config.remote_script, config.remote_service);
    output_.info() << reconcile::explain(artifact, remote_state);
    token_.throw_if_cancelled("observe remote state");

    if (reconcile::needs_update(artifact, remote_state)) {
      deployer_.deploy(artifact);
      outcome.deployed = true;
    } else {
      deployer_.ensure_running();
    }
    token_.throw_if_cancelled("deploy");

    output_.info() << "=== Deployment Complete ===";
    output_.info() << "Waiting " << config.stabilize_wait_seconds
                   << " seconds for tunnel to stabilize...";
    wait_seconds(config.stabilize_wait_seconds, "stabilize", true);

    output_.info() << "Client WireGuard status:\n" << controller_.status_text();

    auto report = verifier_.probe(
        config.server_tunnel_ip, config.probe_attempts,
        std::chrono::seconds(config.probe_timeout_seconds));
    report_probe(config, report);
    token_.throw_if_cancelled("verify");

    output_.info() << "=== Setup Summary ===\n"
                   << "- Client tunnel IP: " << config.client_tunnel_ip << "\n"
                   << "- Server tunnel IP: " << config.server_tunnel_ip << "\n"
                   << "- Additional IP: " << config.additional_ip << "\n"
                   << "- WireGuard port: " << config.wg_port;

    outcome.status = ProvisioningOutcome::Status::Converged;
    outcome.local_config = std::move(local_config);
    outcome.fingerprint = artifact.fingerprint;
    outcome.probe = std::move(report);
    outcome.lease.emplace(std::move(lease));
    return outcome;
  } catch (const OperationCancelled &e) {
    output_.info() << "Cancelled during " << e.step()
                   << "; tearing down local tunnel";
    lease.release();
    outcome.status = ProvisioningOutcome::Status::Cancelled;
    return outcome;
  }
}

} // namespace provision
} // namespace revtun
