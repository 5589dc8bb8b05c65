#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "revtun_errors.hpp"

namespace revtun {

// Set once by the signal handler; observed by the pipeline at phase
// boundaries, by interruptible sleeps and by running child processes.
class CancellationToken {
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::vector<std::function<void()>> callbacks_;

public:
  void cancel() {
    std::vector<std::function<void()>> callbacks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_.exchange(true)) {
        return;
      }
      callbacks.swap(callbacks_);
    }
    cv_.notify_all();
    for (auto &cb : callbacks) {
      cb();
    }
  }

  bool is_cancelled() const { return cancelled_.load(); }

  // Runs `cb` on cancellation (immediately when already cancelled).
  void on_cancel(std::function<void()> cb) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!cancelled_.load()) {
        callbacks_.push_back(std::move(cb));
        return;
      }
    }
    cb();
  }

  // Returns false when woken by cancellation.
  template <typename Rep, typename Period>
  bool sleep_for(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, d, [this] { return cancelled_.load(); });
  }

  void wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_.load(); });
  }

  void throw_if_cancelled(const std::string &step) const {
    if (is_cancelled()) {
      throw OperationCancelled(step);
    }
  }
};

} // namespace revtun
