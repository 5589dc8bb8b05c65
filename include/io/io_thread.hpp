#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <mutex>
#include <optional>
#include <thread>

namespace revtun {

namespace asio = boost::asio;

// Owns the single I/O thread. Signal handling and the supervision timer live
// here; all blocking pipeline work stays on the main thread.
class IoThread {
  asio::io_context ioc_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>>
      work_guard_;
  std::thread thread_;
  std::once_flag stop_once_;

public:
  IoThread() : work_guard_(asio::make_work_guard(ioc_)) {
    thread_ = std::thread([this] { ioc_.run(); });
  }

  IoThread(const IoThread &) = delete;
  IoThread &operator=(const IoThread &) = delete;

  ~IoThread() { stop(); }

  asio::io_context &ioc() { return ioc_; }

  // Drops the work guard, stops the context and joins the thread.
  void stop() {
    std::call_once(stop_once_, [this] {
      work_guard_.reset();
      ioc_.stop();
      if (thread_.joinable()) {
        thread_.join();
      }
    });
  }
};

} // namespace revtun
