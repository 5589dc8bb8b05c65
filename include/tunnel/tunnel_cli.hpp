#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "exec/process_runner.hpp"
#include "util/cancellation.hpp"

namespace revtun {
namespace tunnel {

namespace fs = std::filesystem;

// The slice of wg / wg-quick this program drives.
class ITunnelCli {
public:
  virtual ~ITunnelCli() = default;

  // `wg-quick up <config>`; throws RevtunError (TUNNEL::APPLY_FAILED).
  virtual void apply_interface(const fs::path &config_path) = 0;
  // `wg-quick down <name or config path>`; false when it failed (e.g.
  // already down).
  virtual bool teardown_interface(const std::string &name) = 0;
  // `wg show <name>`; nullopt when the interface does not exist.
  virtual std::optional<std::string> show_status(const std::string &name) = 0;
  // Most recent handshake over all peers; nullopt when unknown or none yet.
  virtual std::optional<std::chrono::system_clock::time_point>
  latest_handshake(const std::string &name) = 0;
};

class WgQuickCli : public ITunnelCli {
  exec::IProcessRunner &runner_;
  CancellationToken &token_;

public:
  WgQuickCli(exec::IProcessRunner &runner, CancellationToken &token)
      : runner_(runner), token_(token) {}

  void apply_interface(const fs::path &config_path) override;
  bool teardown_interface(const std::string &name) override;
  std::optional<std::string> show_status(const std::string &name) override;
  std::optional<std::chrono::system_clock::time_point>
  latest_handshake(const std::string &name) override;

  // Parses `wg show <if> latest-handshakes` output ("<pubkey>\t<epoch>").
  static std::optional<std::chrono::system_clock::time_point>
  parse_latest_handshakes(const std::string &output);
};

} // namespace tunnel
} // namespace revtun
