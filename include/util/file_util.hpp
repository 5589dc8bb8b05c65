#pragma once

#include <filesystem>
#include <string>

namespace revtun {
namespace fileutil {

namespace fs = std::filesystem;

inline fs::perms private_file_perms() {
  return fs::perms::owner_read | fs::perms::owner_write;
}

inline fs::perms public_file_perms() {
  return fs::perms::owner_read | fs::perms::owner_write |
         fs::perms::group_read | fs::perms::others_read;
}

inline fs::perms default_directory_perms() {
  return fs::perms::owner_read | fs::perms::owner_write |
         fs::perms::owner_exec | fs::perms::group_read |
         fs::perms::group_exec;
}

// Writes `content` to a sibling temp file created with `perms`, then renames
// it over `destination`. Readers never see a partial file and private
// material is never world readable, not even briefly. Throws
// std::filesystem::filesystem_error or std::runtime_error.
void write_file_atomic(const fs::path &destination, const std::string &content,
                       fs::perms perms);

// Unique "<prefix>.<pid>.<random>" name under the system temp directory.
fs::path unique_temp_path(const std::string &prefix);

} // namespace fileutil
} // namespace revtun
