#pragma once

#include <string>

#include "conf/revtun_config.hpp"
#include "customio/output.hpp"
#include "remote/remote_channel.hpp"
#include "render/remote_script_synthesizer.hpp"

namespace revtun {
namespace remote {

class RemoteDeployer {
  IRemoteChannel &channel_;
  IRevtunConfigProvider &config_provider_;
  customio::IOutput &output_;

public:
  RemoteDeployer(IRemoteChannel &channel,
                 IRevtunConfigProvider &config_provider,
                 customio::IOutput &output)
      : channel_(channel), config_provider_(config_provider), output_(output) {}

  // Copies the script to a temporary path on the server, moves it over the
  // configured script path, creates the service unit if there is none and
  // restarts the service. Throws TransferError or RemoteExecError; nothing
  // already applied on the server is undone.
  void deploy(const render::ScriptArtifact &artifact);

  // Starts the service unless it is already active. Returns false (after a
  // warning) when the server could not be queried.
  bool ensure_running();

  static std::string install_command(const std::string &staged_path,
                                     const std::string &script_path,
                                     const std::string &service);
  static std::string ensure_running_command(const std::string &service);
};

} // namespace remote
} // namespace revtun
