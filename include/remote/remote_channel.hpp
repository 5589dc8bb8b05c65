#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "conf/revtun_config.hpp"
#include "customio/output.hpp"
#include "exec/process_runner.hpp"
#include "util/cancellation.hpp"

namespace revtun {
namespace remote {

namespace fs = std::filesystem;

struct RemoteEndpoint {
  std::string host;
  int port{22};
  std::string user;
  std::chrono::seconds connect_timeout{10};
  std::chrono::seconds command_timeout{120};

  std::string destination() const { return user + "@" + host; }

  static RemoteEndpoint from_config(const RevtunConfig &config);
};

struct RemoteExecResult {
  std::string stdout_data;
  std::string stderr_data;
  int exit_code{0};

  bool ok() const { return exit_code == 0; }
};

// Command-and-response link to the server. A non-zero remote exit code is
// returned to the caller; a broken channel is raised as RemoteExecError
// (REMOTE::CHANNEL_UNREACHABLE).
class IRemoteChannel {
public:
  virtual ~IRemoteChannel() = default;

  // `command` may span many lines; it is run by bash on the remote host.
  virtual RemoteExecResult execute(const std::string &command) = 0;

  // Throws TransferError on failure.
  virtual void copy(const fs::path &local_path,
                    const std::string &remote_path) = 0;

  virtual std::string describe() const = 0;
};

std::vector<std::string> ssh_argv(const RemoteEndpoint &endpoint);
std::vector<std::string> scp_argv(const RemoteEndpoint &endpoint,
                                  const fs::path &local_path,
                                  const std::string &remote_path);

class SshRemoteChannel : public IRemoteChannel {
  IRevtunConfigProvider &config_provider_;
  exec::IProcessRunner &runner_;
  CancellationToken &token_;
  customio::IOutput &output_;

public:
  SshRemoteChannel(IRevtunConfigProvider &config_provider,
                   exec::IProcessRunner &runner, CancellationToken &token,
                   customio::IOutput &output)
      : config_provider_(config_provider), runner_(runner), token_(token),
        output_(output) {}

  RemoteExecResult execute(const std::string &command) override;
  void copy(const fs::path &local_path,
            const std::string &remote_path) override;
  std::string describe() const override;
};

} // namespace remote
} // namespace revtun
