#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <unistd.h>

namespace customio {

// ANSI escape codes for console prefixes. Every code is empty unless the
// target stream is a terminal and TERM is not "dumb".
class ColorPrinter {
 public:
  ColorPrinter() : enable_colors_(detect_tty_for_stream(std::cerr)) {}
  explicit ColorPrinter(bool enable_colors) : enable_colors_(enable_colors) {}

  bool enabled() const { return enable_colors_; }

  const char* reset() const { return enable_colors_ ? "\033[0m" : ""; }
  const char* dim_code() const { return enable_colors_ ? "\033[2m" : ""; }
  const char* red_code() const { return enable_colors_ ? "\033[31m" : ""; }
  const char* yellow_code() const { return enable_colors_ ? "\033[33m" : ""; }

  static bool detect_tty_for_stream(std::ostream& os) {
    int fd = -1;
    if (&os == &std::cout) {
      fd = fileno(stdout);
    } else if (&os == &std::cerr) {
      fd = fileno(stderr);
    }
    if (fd < 0 || !::isatty(fd)) {
      return false;
    }
    const char* term = std::getenv("TERM");
    return term && std::strcmp(term, "dumb") != 0;
  }

 private:
  bool enable_colors_;
};

} // namespace customio
