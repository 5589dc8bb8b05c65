#pragma once

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>

#include "customio/color_printer.hpp"
#include "customio/output.hpp"

namespace customio {

// Console IOutput used by the application. Every emitted line is also
// recorded through Boost.Log so the rotating log file keeps the same history
// the operator saw on the terminal.
class ConsoleOutputWithColor : public IOutput {
  using severity = boost::log::trivial::severity_level;

  std::size_t verbosity_;
  std::mutex mutex_;
  ColorPrinter printer_{};
  boost::log::sources::severity_logger_mt<severity> lg_;

  LogStream make(std::size_t min_level, std::ostream &os,
                 const std::string &prefix, severity sev) {
    if (verbosity_ < min_level) {
      return LogStream::make_disabled();
    }
    return LogStream::make_enabled(
        os, prefix, mutex_, [this, sev](const std::string &line) {
          BOOST_LOG_SEV(lg_, sev) << line;
        });
  }

public:
  explicit ConsoleOutputWithColor(std::size_t verbosity)
      : verbosity_(verbosity) {}

  LogStream trace() override {
    return make(5, std::cerr, std::string(printer_.dim_code()) + "[trace] " +
                                  printer_.reset(),
                boost::log::trivial::trace);
  }
  LogStream debug() override {
    return make(4, std::cerr, std::string(printer_.dim_code()) + "[debug] " +
                                  printer_.reset(),
                boost::log::trivial::debug);
  }
  LogStream info() override {
    return make(3, std::cout, "", boost::log::trivial::info);
  }
  LogStream warning() override {
    return make(2, std::cerr, std::string(printer_.yellow_code()) +
                                  "[warning] " + printer_.reset(),
                boost::log::trivial::warning);
  }
  LogStream error() override {
    return make(1, std::cerr, std::string(printer_.red_code()) + "[error] " +
                                  printer_.reset(),
                boost::log::trivial::error);
  }

  std::ostream &stream() override { return std::cout; }
  std::ostream &err_stream() override { return std::cerr; }
  std::size_t verbosity() const override { return verbosity_; }
};

// Output hub handed to the subcommand handlers.
class ConsoleOutput {
  customio::IOutput &logger_;

public:
  ConsoleOutput(customio::IOutput &logger) : logger_(logger) {}

  customio::IOutput &logger() { return logger_; }
};

} // namespace customio
