#pragma once

#include <optional>
#include <string>

#include "conf/revtun_config.hpp"
#include "customio/output.hpp"
#include "keys/key_material_manager.hpp"
#include "reconcile/drift_reconciler.hpp"
#include "remote/remote_deployer.hpp"
#include "render/remote_script_synthesizer.hpp"
#include "render/tunnel_config_renderer.hpp"
#include "tunnel/local_tunnel_controller.hpp"
#include "util/cancellation.hpp"
#include "verify/connectivity_verifier.hpp"

namespace revtun {
namespace provision {

struct ProvisioningOutcome {
  enum class Status { Converged, Cancelled };

  Status status{Status::Cancelled};
  // Held only when converged; whoever keeps it owns the local interface.
  std::optional<tunnel::TunnelLease> lease;
  std::optional<render::RenderedConfig> local_config;
  std::string fingerprint;
  bool deployed{false};
  std::optional<verify::ProbeReport> probe;
};

// One sequential convergence pass:
//   remote key -> local key -> parameters -> local up -> synthesize ->
//   observe -> deploy | ensure running -> stabilize -> verify
// Cancellation is honoured at every step boundary and inside waits; the
// local interface is then torn down exactly once and Cancelled is returned.
// Any other failure propagates after the same teardown. Verification
// failures are reported in the outcome only.
class ProvisioningPipeline {
  IRevtunConfigProvider &config_provider_;
  keys::KeyMaterialManager &keys_;
  tunnel::ILocalTunnelController &controller_;
  render::RemoteScriptSynthesizer &synthesizer_;
  reconcile::DriftReconciler &reconciler_;
  remote::RemoteDeployer &deployer_;
  verify::ConnectivityVerifier &verifier_;
  customio::IOutput &output_;
  CancellationToken &token_;

public:
  ProvisioningPipeline(IRevtunConfigProvider &config_provider,
                       keys::KeyMaterialManager &keys,
                       tunnel::ILocalTunnelController &controller,
                       render::RemoteScriptSynthesizer &synthesizer,
                       reconcile::DriftReconciler &reconciler,
                       remote::RemoteDeployer &deployer,
                       verify::ConnectivityVerifier &verifier,
                       customio::IOutput &output, CancellationToken &token)
      : config_provider_(config_provider), keys_(keys),
        controller_(controller), synthesizer_(synthesizer),
        reconciler_(reconciler), deployer_(deployer), verifier_(verifier),
        output_(output), token_(token) {}

  ProvisioningOutcome run();

private:
  void wait_seconds(int seconds, const char *step, bool countdown);
  void report_probe(const RevtunConfig &config,
                    const verify::ProbeReport &report);
};

} // namespace provision
} // namespace revtun
