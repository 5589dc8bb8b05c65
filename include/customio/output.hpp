#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace customio {

// One log statement. Text is buffered until the temporary dies, then written
// under the shared mutex as a single prefixed block so lines from the I/O
// thread and the pipeline never interleave.
class LogStream {
public:
  using Mirror = std::function<void(const std::string &)>;

  static LogStream make_enabled(std::ostream &os, std::string prefix,
                                std::mutex &mutex, Mirror mirror = {}) {
    return LogStream(&os, std::move(prefix), &mutex, std::move(mirror));
  }

  static LogStream make_disabled() { return LogStream(); }

  LogStream(LogStream &&other) noexcept
      : os_(other.os_), prefix_(std::move(other.prefix_)),
        mutex_(other.mutex_), buf_(std::move(other.buf_)),
        mirror_(std::move(other.mirror_)) {
    other.os_ = nullptr;
  }
  LogStream &operator=(LogStream &&) = delete;
  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  ~LogStream() { flush(); }

  template <typename T> LogStream &operator<<(const T &v) {
    if (os_) {
      buf_ << v;
    }
    return *this;
  }

  using Manip = std::ostream &(*)(std::ostream &);
  LogStream &operator<<(Manip m) {
    if (os_) {
      m(buf_);
    }
    return *this;
  }

  bool enabled() const { return os_ != nullptr; }

private:
  LogStream() = default;
  LogStream(std::ostream *os, std::string prefix, std::mutex *mutex,
            Mirror mirror)
      : os_(os), prefix_(std::move(prefix)), mutex_(mutex),
        mirror_(std::move(mirror)) {}

  void flush() noexcept {
    if (!os_) {
      return;
    }
    try {
      std::string text = buf_.str();
      if (text.empty()) {
        return;
      }
      std::lock_guard<std::mutex> lock(*mutex_);
      (*os_) << prefix_ << text;
      if (text.back() != '\n') {
        (*os_) << '\n';
      }
      os_->flush();
      if (mirror_) {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
          text.pop_back();
        }
        mirror_(text);
      }
    } catch (const std::exception &) {
      // output failures must never escape a destructor
    }
    os_ = nullptr;
  }

  std::ostream *os_{nullptr};
  std::string prefix_;
  std::mutex *mutex_{nullptr};
  std::ostringstream buf_;
  Mirror mirror_;
};

struct IOutput {
  virtual ~IOutput() = default;

  virtual LogStream trace() = 0;
  virtual LogStream debug() = 0;
  virtual LogStream info() = 0;
  virtual LogStream warning() = 0;
  virtual LogStream error() = 0;

  virtual std::ostream &stream() = 0;
  virtual std::ostream &err_stream() = 0;
  // 0 silent, 1 error .. 5 trace
  virtual std::size_t verbosity() const = 0;
};

} // namespace customio
