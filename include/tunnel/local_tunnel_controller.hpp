#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "conf/revtun_config.hpp"
#include "customio/output.hpp"
#include "render/tunnel_config_renderer.hpp"
#include "tunnel/tunnel_cli.hpp"

namespace revtun {
namespace tunnel {

struct TunnelState {
  bool interface_up{false};
  std::optional<std::chrono::seconds> last_handshake_age;
};

class ILocalTunnelController {
public:
  virtual ~ILocalTunnelController() = default;

  // Idempotent bring-up: tears down first, then applies `config`.
  virtual void up(const render::RenderedConfig &config) = 0;
  // Best effort; never throws.
  virtual void down() noexcept = 0;
  virtual bool is_up() = 0;
  virtual std::optional<std::chrono::seconds> last_handshake_age() = 0;
  // `wg show` text, or a short note when the interface is absent.
  virtual std::string status_text() = 0;

  TunnelState state() { return TunnelState{is_up(), last_handshake_age()}; }
};

class LocalTunnelController : public ILocalTunnelController {
  ITunnelCli &cli_;
  IRevtunConfigProvider &config_provider_;
  customio::IOutput &output_;

public:
  LocalTunnelController(ITunnelCli &cli,
                        IRevtunConfigProvider &config_provider,
                        customio::IOutput &output)
      : cli_(cli), config_provider_(config_provider), output_(output) {}

  void up(const render::RenderedConfig &config) override;
  void down() noexcept override;
  bool is_up() override;
  std::optional<std::chrono::seconds> last_handshake_age() override;
  std::string status_text() override;

  fs::path config_path() const;

private:
  const std::string &interface_name() const;
};

// Scoped ownership of the local interface: whatever path the holder takes
// out of scope (normal return, exception, cancellation) the interface is
// torn down exactly once.
class TunnelLease {
  ILocalTunnelController *controller_;

public:
  explicit TunnelLease(ILocalTunnelController &controller)
      : controller_(&controller) {}
  TunnelLease(TunnelLease &&other) noexcept : controller_(other.controller_) {
    other.controller_ = nullptr;
  }
  TunnelLease &operator=(TunnelLease &&other) noexcept {
    if (this != &other) {
      release();
      controller_ = other.controller_;
      other.controller_ = nullptr;
    }
    return *this;
  }
  TunnelLease(const TunnelLease &) = delete;
  TunnelLease &operator=(const TunnelLease &) = delete;

  ~TunnelLease() { release(); }

  void release() noexcept {
    if (auto *c = controller_) {
      controller_ = nullptr;
      c->down();
    }
  }

  bool held() const { return controller_ != nullptr; }
};

} // namespace tunnel
} // namespace revtun
