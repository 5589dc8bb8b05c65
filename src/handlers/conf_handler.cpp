#include "handlers/conf_handler.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <charconv>
#include <sstream>

namespace revtun {

namespace {

const std::vector<std::string> kIntegerKeys{
    "wg_port",
    "ssh_port",
    "tunnel_prefix_length",
    "keepalive_seconds",
    "ssh_connect_timeout_seconds",
    "remote_command_timeout_seconds",
    "handshake_wait_seconds",
    "stabilize_wait_seconds",
    "supervision_interval_seconds",
    "probe_attempts",
    "probe_timeout_seconds"};

} // namespace

const std::vector<std::string> &ConfHandler::known_keys() {
  static const std::vector<std::string> keys = [] {
    std::vector<std::string> all = kRequiredConfigKeys;
    for (const char *k :
         {"interface_name", "wireguard_dir", "client_keyfile",
          "client_pubfile", "allowed_range", "tunnel_prefix_length",
          "keepalive_seconds", "ssh_connect_timeout_seconds",
          "remote_command_timeout_seconds", "handshake_wait_seconds",
          "stabilize_wait_seconds", "supervision_interval_seconds",
          "probe_attempts", "probe_timeout_seconds", "verbose"}) {
      all.emplace_back(k);
    }
    return all;
  }();
  return keys;
}

bool ConfHandler::is_integer_key(const std::string &key) {
  return std::find(kIntegerKeys.begin(), kIntegerKeys.end(), key) !=
         kIntegerKeys.end();
}

std::string ConfHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage: \nrevtun conf get <key>\nrevtun conf set <key> <value>\n"
      << "Keys: " << fmt::format("{}", fmt::join(known_keys(), ", "))
      << std::endl;
  return oss.str();
}

void ConfHandler::show_usage(const std::string &msg) {
  if (!msg.empty()) {
    output_hub_.logger().error() << msg;
  }
  throw RevtunError(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc());
}

void ConfHandler::start() {
  const auto &keys = known_keys();
  auto is_known = [&keys](const std::string &key) {
    return std::find(keys.begin(), keys.end(), key) != keys.end();
  };

  if (cli_ctx_.is_set()) {
    auto [key, value] = cli_ctx_.get_set_kv();
    if (!is_known(key)) {
      show_usage(fmt::format("Unknown configuration key: {}", key));
    }
    json::value jv;
    if (is_integer_key(key)) {
      int number = 0;
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), number);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        throw PreconditionError(
            my_errors::CONFIG::INVALID_VALUE,
            fmt::format("{} expects an integer, got '{}'", key, value));
      }
      jv = number;
    } else {
      jv = value;
    }
    config_provider_.save({{key, jv}});
    output_hub_.logger().info() << "Set " << key << " to " << value;
  } else if (cli_ctx_.is_get()) {
    auto key = cli_ctx_.get_get_k();
    if (!is_known(key)) {
      show_usage(fmt::format("Unknown configuration key: {}", key));
    }
    const auto *p = config_provider_.raw().if_contains(key);
    if (!p || p->is_null()) {
      output_hub_.logger().info() << key << " = (unset)";
    } else if (p->is_string()) {
      output_hub_.logger().info() << key << " = " << p->as_string().c_str();
    } else {
      output_hub_.logger().info() << key << " = " << json::serialize(*p);
    }
  } else {
    show_usage();
  }
}

} // namespace revtun
