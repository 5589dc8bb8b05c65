#include "util/string_util.hpp"

#include <fstream>
#include <sstream>

namespace revtun {
namespace stringutil {

std::string readFile(const std::string &filePath, std::error_code &ec) {
  std::ifstream file(filePath);

  if (!file.is_open()) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
    return "";
  }

  std::ostringstream ss;
  ss << file.rdbuf();

  if (!file.good() && !file.eof()) {
    ec = std::make_error_code(std::errc::io_error);
    return "";
  }
  return ss.str();
}

std::string replaceAllEfficient(const std::string &input,
                                const std::string &from,
                                const std::string &to) {
  if (from.empty()) return input;  // Avoid infinite loop if 'from' is empty
  std::string result;
  result.reserve(input.size());
  size_t last = 0, next;
  while ((next = input.find(from, last)) != std::string::npos) {
    result.append(input, last, next - last);
    result += to;
    last = next + from.size();
  }
  result += input.substr(last);
  return result;
}

std::vector<std::string> split_lines(const std::string &str) {
  std::vector<std::string> lines;
  std::istringstream iss(str);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

std::vector<std::string> split_trim(const std::string &str, char delim,
                                    size_t maxsplit) {
  std::vector<std::string> result;
  size_t pos = 0;
  while (pos < str.size()) {
    size_t start = str.find_first_not_of({' ', '\t', delim}, pos);
    if (start == std::string::npos) break;
    size_t end = str.find_first_of({delim, ' ', '\t'}, start);
    if (end == std::string::npos) {
      result.push_back(str.substr(start));
      break;
    }
    if (maxsplit > 0 && result.size() == maxsplit - 1) {
      result.push_back(str.substr(start));
      break;
    } else {
      result.push_back(str.substr(start, end - start));
      pos = end + 1;
    }
  }
  return result;
}

std::string shell_quote(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

bool is_shell_safe_token(std::string_view value) {
  if (value.empty()) {
    return false;
  }
  return std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == '/' ||
           c == '@' || c == ':' || c == '+';
  });
}

} // namespace stringutil
} // namespace revtun
