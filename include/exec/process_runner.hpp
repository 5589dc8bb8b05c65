#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "util/cancellation.hpp"

namespace revtun {
namespace exec {

struct ExecResult {
  int exit_code{-1};
  std::string stdout_data;
  std::string stderr_data;
  bool timed_out{false};
  bool cancelled{false};
  // set when the child never ran (fork/exec/pipe failure)
  std::optional<std::string> spawn_error;

  [[nodiscard]] bool success() const {
    return !spawn_error && !timed_out && !cancelled && exit_code == 0;
  }

  std::string describe() const;
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  // Runs argv[0] (looked up on PATH) to completion. `stdin_data`, when given,
  // is written to the child's stdin which is then closed. The child is
  // killed when `timeout` elapses or `token` fires.
  virtual ExecResult run(const std::vector<std::string> &argv,
                         const std::optional<std::string> &stdin_data,
                         std::chrono::milliseconds timeout,
                         const CancellationToken *token = nullptr) = 0;
};

class PosixProcessRunner : public IProcessRunner {
public:
  ExecResult run(const std::vector<std::string> &argv,
                 const std::optional<std::string> &stdin_data,
                 std::chrono::milliseconds timeout,
                 const CancellationToken *token = nullptr) override;
};

// True when `name` resolves to an executable file on PATH.
bool command_exists(const std::string &name);

} // namespace exec
} // namespace revtun
