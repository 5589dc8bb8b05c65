#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

#include "customio/output.hpp"
#include "render/tunnel_config_renderer.hpp"
#include "tunnel/local_tunnel_controller.hpp"

namespace revtun {
namespace supervise {

namespace asio = boost::asio;

// Periodic local liveness check. Each tick asks whether the interface is
// still there; when it is not the loop enters Down and re-applies the
// configuration (best effort), and the next tick starts from Up again. It
// never stops by itself: stop() or destroying the io_context ends it.
// Must be owned by a std::shared_ptr before start() is called.
class SupervisionLoop : public std::enable_shared_from_this<SupervisionLoop> {
public:
  enum class State { Up, Down };

  SupervisionLoop(asio::io_context &ioc,
                  tunnel::ILocalTunnelController &controller,
                  customio::IOutput &output, render::RenderedConfig config,
                  std::chrono::milliseconds interval);

  void start();
  void stop();

  // One liveness check; exceptions are logged and swallowed.
  void tick_once();

  std::size_t ticks() const { return ticks_.load(); }
  State state() const { return state_.load(); }

private:
  void schedule();
  void on_timer(const boost::system::error_code &ec);

  asio::steady_timer timer_;
  tunnel::ILocalTunnelController &controller_;
  customio::IOutput &output_;
  const render::RenderedConfig config_;
  const std::chrono::milliseconds interval_;
  std::atomic<std::size_t> ticks_{0};
  std::atomic<State> state_{State::Up};
  std::atomic<bool> stopped_{false};
};

} // namespace supervise
} // namespace revtun
