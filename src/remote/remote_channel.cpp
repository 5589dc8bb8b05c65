#include "remote/remote_channel.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "revtun_errors.hpp"

namespace revtun {
namespace remote {

namespace {
// ssh reserves 255 for its own failures (DNS, refused, auth, timeout).
constexpr int kSshChannelFailure = 255;
} // namespace

RemoteEndpoint RemoteEndpoint::from_config(const RevtunConfig &config) {
  RemoteEndpoint endpoint;
  endpoint.host = config.server_ssh_ip;
  endpoint.port = config.ssh_port;
  endpoint.user = config.ssh_user;
  endpoint.connect_timeout =
      std::chrono::seconds(config.ssh_connect_timeout_seconds);
  endpoint.command_timeout =
      std::chrono::seconds(config.remote_command_timeout_seconds);
  return endpoint;
}

std::vector<std::string> ssh_argv(const RemoteEndpoint &endpoint) {
  return {"ssh",
          "-p",
          std::to_string(endpoint.port),
          "-o",
          fmt::format("ConnectTimeout={}", endpoint.connect_timeout.count()),
          "-o",
          "BatchMode=yes",
          endpoint.destination(),
          "bash",
          "-s"};
}

std::vector<std::string> scp_argv(const RemoteEndpoint &endpoint,
                                  const fs::path &local_path,
                                  const std::string &remote_path) {
  return {"scp",
          "-q",
          "-P",
          std::to_string(endpoint.port),
          "-o",
          fmt::format("ConnectTimeout={}", endpoint.connect_timeout.count()),
          "-o",
          "BatchMode=yes",
          local_path.string(),
          fmt::format("{}:{}", endpoint.destination(), remote_path)};
}

RemoteExecResult SshRemoteChannel::execute(const std::string &command) {
  auto endpoint = RemoteEndpoint::from_config(config_provider_.get());
  output_.trace() << "ssh " << endpoint.destination() << ":" << endpoint.port
                  << " <<\n"
                  << command;

  auto r = runner_.run(ssh_argv(endpoint), command,
                       std::chrono::duration_cast<std::chrono::milliseconds>(
                           endpoint.command_timeout),
                       &token_);
  if (r.cancelled) {
    throw OperationCancelled("remote command");
  }
  if (r.spawn_error || r.timed_out || r.exit_code == kSshChannelFailure) {
    throw RemoteExecError(
        my_errors::REMOTE::CHANNEL_UNREACHABLE,
        fmt::format("ssh to {}:{} failed: {}", endpoint.destination(),
                    endpoint.port, r.describe()));
  }
  return RemoteExecResult{std::move(r.stdout_data), std::move(r.stderr_data),
                          r.exit_code};
}

void SshRemoteChannel::copy(const fs::path &local_path,
                            const std::string &remote_path) {
  auto endpoint = RemoteEndpoint::from_config(config_provider_.get());
  output_.debug() << "scp " << local_path.string() << " -> "
                  << endpoint.destination() << ":" << remote_path;

  auto r = runner_.run(scp_argv(endpoint, local_path, remote_path),
                       std::nullopt,
                       std::chrono::duration_cast<std::chrono::milliseconds>(
                           endpoint.command_timeout),
                       &token_);
  if (r.cancelled) {
    throw OperationCancelled("file transfer");
  }
  if (!r.success()) {
    throw TransferError(my_errors::REMOTE::TRANSFER_FAILED,
                        fmt::format("scp to {}:{} failed: {}",
                                    endpoint.destination(), remote_path,
                                    r.describe()),
                        "transfer");
  }
}

std::string SshRemoteChannel::describe() const {
  auto endpoint = RemoteEndpoint::from_config(config_provider_.get());
  return fmt::format("{}:{}", endpoint.destination(), endpoint.port);
}

} // namespace remote
} // namespace revtun
