#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace revtun {
namespace stringutil {

namespace fs = std::filesystem;

// Trim leading and trailing whitespace from a string
inline void trim(std::string &str) {
  auto start = std::find_if_not(str.begin(), str.end(), ::isspace);
  auto end = std::find_if_not(str.rbegin(), str.rend(), ::isspace).base();
  str = (start < end) ? std::string(start, end) : std::string{};
}

inline std::string trimmed(std::string str) {
  trim(str);
  return str;
}

inline bool starts_with(const std::string &str, const std::string &prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

// Empty string with `ec` set when the file cannot be read.
std::string readFile(const std::string &filePath, std::error_code &ec);

std::string replaceAllEfficient(const std::string &input,
                                const std::string &from, const std::string &to);

std::vector<std::string> split_lines(const std::string &str);

std::vector<std::string> split_trim(const std::string &str, char delim = ' ',
                                    size_t maxsplit = 0);

// POSIX shell single-quoted literal; safe for any byte except NUL.
std::string shell_quote(std::string_view value);

// True when `value` only holds characters that need no quoting in a path
// or identifier (letters, digits, and . _ - / @ : +).
bool is_shell_safe_token(std::string_view value);

} // namespace stringutil
} // namespace revtun
