#include "exec/process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace revtun {
namespace exec {

namespace {

struct Pipe {
  int fds[2]{-1, -1};

  ~Pipe() {
    close_read();
    close_write();
  }
  bool open() { return ::pipe(fds) == 0; }
  int read_end() const { return fds[0]; }
  int write_end() const { return fds[1]; }
  void close_read() {
    if (fds[0] >= 0) {
      ::close(fds[0]);
      fds[0] = -1;
    }
  }
  void close_write() {
    if (fds[1] >= 0) {
      ::close(fds[1]);
      fds[1] = -1;
    }
  }
};

void set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Returns false once the descriptor reached EOF or failed.
bool drain(int fd, std::string &out) {
  char buffer[4096];
  while (true) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void fill_status(ExecResult &result, int status) {
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = -1;
    result.stderr_data.append(
        fmt::format("\nProcess terminated by signal {}", WTERMSIG(status)));
  } else {
    result.exit_code = -1;
  }
}

// The child leads its own process group; take descendants down with it.
void kill_group(pid_t pid) {
  if (::kill(-pid, SIGKILL) == -1) {
    ::kill(pid, SIGKILL);
  }
}

void reap(pid_t pid, int &status) {
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      break;
    }
  }
}

} // namespace

std::string ExecResult::describe() const {
  if (spawn_error) {
    return *spawn_error;
  }
  if (cancelled) {
    return "command cancelled";
  }
  if (timed_out) {
    return "command timed out";
  }
  std::string err = stringutil::trimmed(stderr_data);
  if (err.empty()) {
    return fmt::format("command exited with code {}", exit_code);
  }
  return fmt::format("command exited with code {}: {}", exit_code, err);
}

ExecResult PosixProcessRunner::run(const std::vector<std::string> &argv,
                                   const std::optional<std::string> &stdin_data,
                                   std::chrono::milliseconds timeout,
                                   const CancellationToken *token) {
  ExecResult result;
  if (argv.empty()) {
    result.spawn_error = "empty command line";
    return result;
  }
  if (token && token->is_cancelled()) {
    result.cancelled = true;
    return result;
  }

  // A child that exits before consuming stdin must not kill us.
  static std::once_flag sigpipe_once;
  std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

  Pipe in_pipe, out_pipe, err_pipe;
  if (!in_pipe.open() || !out_pipe.open() || !err_pipe.open()) {
    result.spawn_error =
        std::string("Failed to create pipes: ") + std::strerror(errno);
    return result;
  }

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    cargv.push_back(const_cast<char *>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    result.spawn_error = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    // child: a terminal SIGINT is for revtun, which cancels us itself
    ::setpgid(0, 0);
    if (::dup2(in_pipe.read_end(), STDIN_FILENO) == -1 ||
        ::dup2(out_pipe.write_end(), STDOUT_FILENO) == -1 ||
        ::dup2(err_pipe.write_end(), STDERR_FILENO) == -1) {
      _exit(127);
    }
    ::close(in_pipe.fds[0]);
    ::close(in_pipe.fds[1]);
    ::close(out_pipe.fds[0]);
    ::close(out_pipe.fds[1]);
    ::close(err_pipe.fds[0]);
    ::close(err_pipe.fds[1]);
    ::execvp(cargv[0], cargv.data());
    _exit(127);
  }

  // parent
  ::setpgid(pid, pid);
  in_pipe.close_read();
  out_pipe.close_write();
  err_pipe.close_write();

  std::string pending = stdin_data.value_or("");
  std::size_t written = 0;
  if (pending.empty()) {
    in_pipe.close_write();
  } else {
    set_nonblocking(in_pipe.write_end());
  }
  set_nonblocking(out_pipe.read_end());
  set_nonblocking(err_pipe.read_end());

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int status = 0;
  bool exited = false;

  while (true) {
    std::vector<pollfd> pfds;
    if (in_pipe.write_end() >= 0) {
      pfds.push_back({in_pipe.write_end(), POLLOUT, 0});
    }
    if (out_pipe.read_end() >= 0) {
      pfds.push_back({out_pipe.read_end(), POLLIN, 0});
    }
    if (err_pipe.read_end() >= 0) {
      pfds.push_back({err_pipe.read_end(), POLLIN, 0});
    }

    if (!pfds.empty()) {
      int rc = ::poll(pfds.data(), pfds.size(), 50);
      if (rc < 0 && errno != EINTR) {
        kill_group(pid);
        reap(pid, status);
        result.spawn_error =
            std::string("poll failed: ") + std::strerror(errno);
        return result;
      }
      for (const auto &p : pfds) {
        if (p.revents == 0) {
          continue;
        }
        if (p.fd == in_pipe.write_end()) {
          if (p.revents & (POLLERR | POLLHUP)) {
            in_pipe.close_write();
            continue;
          }
          ssize_t n = ::write(p.fd, pending.data() + written,
                              pending.size() - written);
          if (n > 0) {
            written += static_cast<std::size_t>(n);
          } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
            in_pipe.close_write();
          }
          if (written >= pending.size()) {
            in_pipe.close_write();
          }
        } else if (p.fd == out_pipe.read_end()) {
          if (!drain(p.fd, result.stdout_data)) {
            out_pipe.close_read();
          }
        } else if (p.fd == err_pipe.read_end()) {
          if (!drain(p.fd, result.stderr_data)) {
            err_pipe.close_read();
          }
        }
      }
    } else if (!exited) {
      ::usleep(50 * 1000);
    }

    if (!exited) {
      pid_t w = ::waitpid(pid, &status, WNOHANG);
      if (w == pid) {
        exited = true;
      } else if (w == -1 && errno != EINTR) {
        result.spawn_error =
            std::string("waitpid failed: ") + std::strerror(errno);
        return result;
      }
    }

    if (exited) {
      // Descendants may keep the pipes open; collect what is there and stop.
      if (out_pipe.read_end() >= 0) {
        drain(out_pipe.read_end(), result.stdout_data);
      }
      if (err_pipe.read_end() >= 0) {
        drain(err_pipe.read_end(), result.stderr_data);
      }
      break;
    }

    bool cancel_now = token && token->is_cancelled();
    if (cancel_now || std::chrono::steady_clock::now() >= deadline) {
      kill_group(pid);
      reap(pid, status);
      result.cancelled = cancel_now;
      result.timed_out = !cancel_now;
      result.exit_code = -1;
      return result;
    }
  }

  fill_status(result, status);
  // Interrupted together with the token: a cancellation, not a failure.
  if (result.exit_code != 0 && token && token->is_cancelled()) {
    // pid is reaped: only the group id is still safe to signal
    ::kill(-pid, SIGKILL);
    result.cancelled = true;
  }
  return result;
}

bool command_exists(const std::string &name) {
  if (name.find('/') != std::string::npos) {
    return ::access(name.c_str(), X_OK) == 0;
  }
  const char *path_env = std::getenv("PATH");
  if (!path_env) {
    return false;
  }
  for (const auto &dir : stringutil::split_trim(path_env, ':')) {
    std::filesystem::path candidate = std::filesystem::path(dir) / name;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

} // namespace exec
} // namespace revtun
