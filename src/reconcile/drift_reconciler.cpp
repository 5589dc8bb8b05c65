#include "reconcile/drift_reconciler.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "my_error_codes.hpp"
#include "remote/systemd_units.hpp"
#include "revtun_errors.hpp"
#include "util/string_util.hpp"

namespace revtun {
namespace reconcile {

namespace {

bool is_md5_hex(const std::string &value) {
  return value.size() == 32 &&
         std::all_of(value.begin(), value.end(), [](unsigned char c) {
           return std::isdigit(c) || (c >= 'a' && c <= 'f');
         });
}

} // namespace

bool needs_update(const render::ScriptArtifact &local,
                  const RemoteDeploymentState &remote) {
  if (!remote.script_fingerprint) {
    return true;
  }
  if (*remote.script_fingerprint != local.fingerprint) {
    return true;
  }
  return !remote.service_installed;
}

std::string explain(const render::ScriptArtifact &local,
                    const RemoteDeploymentState &remote) {
  if (!remote.script_fingerprint) {
    return "Server script not deployed yet";
  }
  if (*remote.script_fingerprint != local.fingerprint) {
    return fmt::format("Server configuration changed (checksum {} != {})",
                       *remote.script_fingerprint, local.fingerprint);
  }
  if (!remote.service_installed) {
    return "Service file does not exist, will create it";
  }
  return "Server configuration up-to-date";
}

std::string DriftReconciler::observe_command(const std::string &script_path,
                                             const std::string &service) {
  const auto script = stringutil::shell_quote(script_path);
  return fmt::format(
      "if [ -f {script} ]; then\n"
      "  echo \"fingerprint=$(md5sum {script} | awk '{{print $1}}')\"\n"
      "else\n"
      "  echo 'fingerprint=none'\n"
      "fi\n"
      "if {exists}; then echo 'installed=yes'; else echo 'installed=no'; fi\n"
      "if {active}; then echo 'active=yes'; else echo 'active=no'; fi\n",
      fmt::arg("script", script),
      fmt::arg("exists", remote::systemd::unit_exists_command(service)),
      fmt::arg("active", remote::systemd::is_active_command(service)));
}

RemoteDeploymentState
DriftReconciler::parse_observation(const std::string &output) {
  RemoteDeploymentState state;
  for (const auto &raw : stringutil::split_lines(output)) {
    std::string line = stringutil::trimmed(raw);
    auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);
    if (key == "fingerprint") {
      // anything but a digest (e.g. "none", md5sum errors) means absent
      if (is_md5_hex(value)) {
        state.script_fingerprint = value;
      } else {
        state.script_fingerprint.reset();
      }
    } else if (key == "installed") {
      state.service_installed = value == "yes";
    } else if (key == "active") {
      state.service_active = value == "yes";
    }
  }
  return state;
}

RemoteDeploymentState DriftReconciler::observe(const std::string &script_path,
                                               const std::string &service) {
  output_.info() << "Checking if server configuration needs updating...";
  auto r = channel_.execute(observe_command(script_path, service));
  if (!r.ok()) {
    throw RemoteExecError(
        my_errors::REMOTE::COMMAND_FAILED,
        fmt::format("remote state query exited with code {}: {}", r.exit_code,
                    stringutil::trimmed(r.stderr_data)),
        "observe remote state");
  }
  auto state = parse_observation(r.stdout_data);
  output_.debug() << "Remote state: fingerprint="
                  << state.script_fingerprint.value_or("none")
                  << " installed=" << (state.service_installed ? "yes" : "no")
                  << " active=" << (state.service_active ? "yes" : "no");
  return state;
}

} // namespace reconcile
} // namespace revtun
