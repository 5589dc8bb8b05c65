#include "util/file_util.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <random>
#include <stdexcept>

#include <fmt/format.h>

namespace revtun {
namespace fileutil {

namespace {

std::string generate_temp_suffix() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<std::uint64_t> dist;
  return fmt::format("{}.{:x}", ::getpid(), dist(gen));
}

} // namespace

void write_file_atomic(const fs::path &destination, const std::string &content,
                       fs::perms perms) {
  auto dest_dir = destination.parent_path();
  if (!dest_dir.empty() && !fs::exists(dest_dir)) {
    fs::create_directories(dest_dir);
    fs::permissions(dest_dir, default_directory_perms(),
                    fs::perm_options::add);
  }

  auto temp_dest = destination;
  temp_dest += ".tmp-";
  temp_dest += generate_temp_suffix();

  int fd = ::open(temp_dest.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                  static_cast<mode_t>(perms));
  if (fd < 0) {
    throw std::runtime_error(fmt::format("Failed to create '{}': {}",
                                         temp_dest.string(),
                                         std::strerror(errno)));
  }
  std::size_t written = 0;
  while (written < content.size()) {
    ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      ::close(fd);
      std::error_code ec;
      fs::remove(temp_dest, ec);
      throw std::runtime_error(fmt::format("Failed to write '{}': {}",
                                           temp_dest.string(),
                                           std::strerror(err)));
    }
    written += static_cast<std::size_t>(n);
  }
  ::close(fd);

  // umask may have stripped bits from the open() mode
  fs::permissions(temp_dest, perms, fs::perm_options::replace);

  std::error_code ec;
  fs::rename(temp_dest, destination, ec);
  if (ec) {
    std::error_code rm_ec;
    fs::remove(temp_dest, rm_ec);
    throw fs::filesystem_error("rename failed", temp_dest, destination, ec);
  }
}

fs::path unique_temp_path(const std::string &prefix) {
  return fs::temp_directory_path() /
         fmt::format("{}.{}", prefix, generate_temp_suffix());
}

} // namespace fileutil
} // namespace revtun
