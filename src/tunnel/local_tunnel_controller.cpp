#include "tunnel/local_tunnel_controller.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "revtun_errors.hpp"
#include "util/file_util.hpp"

namespace revtun {
namespace tunnel {

const std::string &LocalTunnelController::interface_name() const {
  return config_provider_.get().interface_name;
}

fs::path LocalTunnelController::config_path() const {
  const auto &config = config_provider_.get();
  return config.wireguard_dir / (config.interface_name + ".conf");
}

void LocalTunnelController::up(const render::RenderedConfig &config) {
  if (config.role != render::Role::Local) {
    throw RenderError(my_errors::RENDER::UNSAFE_VALUE,
                      "refusing to apply a remote configuration locally",
                      "local up");
  }
  down();

  const auto path = config_path();
  try {
    fileutil::write_file_atomic(path, config.text,
                                fileutil::private_file_perms());
  } catch (const std::exception &e) {
    throw RevtunError(my_errors::TUNNEL::CONFIG_WRITE_FAILED,
                      fmt::format("cannot write {}: {}", path.string(),
                                  e.what()),
                      "local up");
  }

  output_.info() << "Bringing up WireGuard interface " << interface_name();
  cli_.apply_interface(path);
}

void LocalTunnelController::down() noexcept {
  try {
    const auto &name = interface_name();
    output_.debug() << "Bringing down WireGuard interface " << name;
    // wg-quick resolves a bare name under /etc/wireguard only
    const auto path = config_path();
    std::error_code ec;
    const std::string target = fs::exists(path, ec) ? path.string() : name;
    if (!cli_.teardown_interface(target)) {
      output_.debug() << "Interface " << name << " was not up";
    }
  } catch (const std::exception &e) {
    output_.warning() << "Tunnel teardown failed: " << e.what();
  }
}

bool LocalTunnelController::is_up() {
  return cli_.show_status(interface_name()).has_value();
}

std::optional<std::chrono::seconds>
LocalTunnelController::last_handshake_age() {
  auto latest = cli_.latest_handshake(interface_name());
  if (!latest) {
    return std::nullopt;
  }
  auto age = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now() - *latest);
  if (age.count() < 0) {
    age = std::chrono::seconds(0);
  }
  return age;
}

std::string LocalTunnelController::status_text() {
  const auto &name = interface_name();
  if (auto text = cli_.show_status(name)) {
    return *text;
  }
  return fmt::format("interface {} is not up", name);
}

} // namespace tunnel
} // namespace revtun
