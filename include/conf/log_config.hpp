#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace revtun {

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{"/var/lib/revtun/logs"};
  std::string log_file{"revtun"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const boost::json::value_to_tag<LoggingConfig> &,
                                  const boost::json::value &jv) {
    auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    LoggingConfig lc{};
    if (auto *p = jo_p->if_contains("level"); p && p->is_string())
      lc.level = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("log_dir"); p && p->is_string())
      lc.log_dir = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("log_file"); p && p->is_string())
      lc.log_file = p->as_string().c_str();
    if (auto *p = jo_p->if_contains("rotation_size"))
      lc.rotation_size = p->to_number<std::uint64_t>();
    return lc;
  }
};

} // namespace revtun
