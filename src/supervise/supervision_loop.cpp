#include "supervise/supervision_loop.hpp"

#include <boost/asio/post.hpp>

namespace revtun {
namespace supervise {

SupervisionLoop::SupervisionLoop(asio::io_context &ioc,
                                 tunnel::ILocalTunnelController &controller,
                                 customio::IOutput &output,
                                 render::RenderedConfig config,
                                 std::chrono::milliseconds interval)
    : timer_(ioc), controller_(controller), output_(output),
      config_(std::move(config)), interval_(interval) {}

void SupervisionLoop::start() {
  output_.debug() << "Supervision loop started, interval "
                  << interval_.count() << "ms";
  asio::post(timer_.get_executor(),
             [self = shared_from_this()] { self->schedule(); });
}

void SupervisionLoop::stop() {
  stopped_ = true;
  // the timer is only touched from the I/O thread
  asio::post(timer_.get_executor(),
             [self = shared_from_this()] { self->timer_.cancel(); });
}

void SupervisionLoop::schedule() {
  if (stopped_) {
    return;
  }
  timer_.expires_after(interval_);
  timer_.async_wait([self = shared_from_this()](
                        const boost::system::error_code &ec) {
    self->on_timer(ec);
  });
}

void SupervisionLoop::on_timer(const boost::system::error_code &ec) {
  if (ec) {
    if (ec != asio::error::operation_aborted) {
      output_.warning() << "Supervision timer error: " << ec.message();
    }
    return;
  }
  if (stopped_) {
    return;
  }
  tick_once();
  schedule();
}

void SupervisionLoop::tick_once() {
  ++ticks_;
  state_ = State::Up;
  try {
    if (controller_.is_up()) {
      return;
    }
    state_ = State::Down;
    output_.warning()
        << "WireGuard interface went down! Attempting to restart...";
    controller_.up(config_);
    output_.info() << "WireGuard interface restored";
  } catch (const std::exception &e) {
    output_.warning() << "Supervision check failed: " << e.what();
  }
}

} // namespace supervise
} // namespace revtun
