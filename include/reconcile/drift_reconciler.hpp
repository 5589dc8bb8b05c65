#pragma once

#include <optional>
#include <string>

#include "customio/output.hpp"
#include "remote/remote_channel.hpp"
#include "render/remote_script_synthesizer.hpp"

namespace revtun {
namespace reconcile {

// What the server currently has. Queried on demand, never cached.
struct RemoteDeploymentState {
  std::optional<std::string> script_fingerprint;
  bool service_installed{false};
  bool service_active{false};
};

// The drift decision:
//   fingerprint absent                    -> update
//   fingerprint differs                   -> update
//   fingerprint equal, service missing    -> update
//   fingerprint equal, service installed  -> no update
// Live NAT rules and the running interface are not inspected.
bool needs_update(const render::ScriptArtifact &local,
                  const RemoteDeploymentState &remote);

// Operator-facing reason for the decision above.
std::string explain(const render::ScriptArtifact &local,
                    const RemoteDeploymentState &remote);

class DriftReconciler {
  remote::IRemoteChannel &channel_;
  customio::IOutput &output_;

public:
  DriftReconciler(remote::IRemoteChannel &channel, customio::IOutput &output)
      : channel_(channel), output_(output) {}

  // One remote round trip. A broken channel or a failed probe command is a
  // RemoteExecError.
  RemoteDeploymentState observe(const std::string &script_path,
                                const std::string &service);

  static std::string observe_command(const std::string &script_path,
                                     const std::string &service);
  static RemoteDeploymentState parse_observation(const std::string &output);
};

} // namespace reconcile
} // namespace revtun
