#include "remote/remote_deployer.hpp"

#include <unistd.h>

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "remote/systemd_units.hpp"
#include "revtun_errors.hpp"
#include "util/file_util.hpp"
#include "util/string_util.hpp"

namespace revtun {
namespace remote {

using stringutil::shell_quote;

namespace {

// Removes the local staging copy whichever way deploy() leaves.
class StagedFile {
  fs::path path_;

public:
  explicit StagedFile(fs::path path) : path_(std::move(path)) {}
  StagedFile(const StagedFile &) = delete;
  StagedFile &operator=(const StagedFile &) = delete;
  ~StagedFile() {
    std::error_code ec;
    fs::remove(path_, ec);
  }
  const fs::path &path() const { return path_; }
};

} // namespace

std::string RemoteDeployer::install_command(const std::string &staged_path,
                                            const std::string &script_path,
                                            const std::string &service) {
  const auto staged = shell_quote(staged_path);
  const auto script = shell_quote(script_path);
  return fmt::format("set -e\n"
                     "mkdir -p \"$(dirname {script})\"\n"
                     "mv {staged} {script}\n"
                     "chmod +x {script}\n"
                     "{install_unit}\n"
                     "{restart}\n",
                     fmt::arg("staged", staged), fmt::arg("script", script),
                     fmt::arg("install_unit",
                              systemd::install_unit_command(service,
                                                            script_path)),
                     fmt::arg("restart", systemd::restart_command(service)));
}

std::string RemoteDeployer::ensure_running_command(const std::string &service) {
  return fmt::format("if ! {active}; then\n"
                     "  echo 'Service is not running, starting it...'\n"
                     "  {start}\n"
                     "else\n"
                     "  echo 'Service is already running'\n"
                     "fi\n",
                     fmt::arg("active", systemd::is_active_command(service)),
                     fmt::arg("start", systemd::start_command(service)));
}

void RemoteDeployer::deploy(const render::ScriptArtifact &artifact) {
  const auto &config = config_provider_.get();
  const std::string script_name =
      fs::path(config.remote_script).filename().string();

  output_.info() << "Deploying updated configuration to server...";
  StagedFile staged(fileutil::unique_temp_path(script_name));
  try {
    fileutil::write_file_atomic(staged.path(), artifact.content,
                                fs::perms::owner_all);
  } catch (const std::exception &e) {
    throw TransferError(my_errors::REMOTE::TRANSFER_FAILED,
                        fmt::format("cannot stage script locally: {}",
                                    e.what()),
                        "transfer");
  }

  const std::string remote_tmp =
      fmt::format("/tmp/{}.{}", script_name, ::getpid());
  channel_.copy(staged.path(), remote_tmp);

  output_.info() << "Installing and starting server configuration...";
  RemoteExecResult r;
  try {
    r = channel_.execute(install_command(remote_tmp, config.remote_script,
                                         config.remote_service));
  } catch (const RemoteExecError &e) {
    throw RemoteExecError(e.code(), e.what(), "install");
  }
  if (!r.ok()) {
    throw RemoteExecError(
        my_errors::REMOTE::COMMAND_FAILED,
        fmt::format("Failed to configure server (exit {}): {}", r.exit_code,
                    stringutil::trimmed(r.stderr_data)),
        "install");
  }
  output_.info() << "Server configuration deployed and service restarted";
}

bool RemoteDeployer::ensure_running() {
  const auto &config = config_provider_.get();
  output_.info() << "Ensuring service is running...";
  try {
    auto r = channel_.execute(ensure_running_command(config.remote_service));
    if (!r.ok()) {
      output_.warning() << "Could not verify service status (exit "
                        << r.exit_code
                        << "): " << stringutil::trimmed(r.stderr_data);
      return false;
    }
    output_.info() << stringutil::trimmed(r.stdout_data);
    return true;
  } catch (const RemoteExecError &e) {
    output_.warning() << "Could not verify service status: " << e.what();
    return false;
  }
}

} // namespace remote
} // namespace revtun
