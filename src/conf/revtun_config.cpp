#include "conf/revtun_config.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <fstream>
#include <iterator>

#include "my_error_codes.hpp"
#include "revtun_errors.hpp"
#include "util/string_util.hpp"

namespace revtun {

namespace {

// .env-era configurations carry numbers as strings; accept both forms.
int int_field(const json::object &jo, const char *key, int fallback) {
  auto *p = jo.if_contains(key);
  if (!p || p->is_null()) {
    return fallback;
  }
  if (p->is_string()) {
    std::string_view sv = p->as_string();
    int value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc() || ptr != sv.data() + sv.size()) {
      throw PreconditionError(
          my_errors::CONFIG::INVALID_VALUE,
          fmt::format("Configuration key '{}' is not an integer: '{}'", key,
                      std::string(sv)));
    }
    return value;
  }
  try {
    return p->to_number<int>();
  } catch (const std::exception &) {
    throw PreconditionError(
        my_errors::CONFIG::INVALID_VALUE,
        fmt::format("Configuration key '{}' is not an integer", key));
  }
}

std::string string_field(const json::object &jo, const char *key,
                         std::string fallback = {}) {
  auto *p = jo.if_contains(key);
  if (!p || p->is_null()) {
    return fallback;
  }
  if (p->is_string()) {
    return std::string(p->as_string().c_str());
  }
  if (p->is_int64() || p->is_uint64()) {
    return json::serialize(*p);
  }
  throw PreconditionError(
      my_errors::CONFIG::INVALID_VALUE,
      fmt::format("Configuration key '{}' must be a string", key));
}

bool present(const json::object &jo, const std::string &key) {
  auto *p = jo.if_contains(key);
  if (!p || p->is_null()) {
    return false;
  }
  if (p->is_string()) {
    return !p->as_string().empty();
  }
  return true;
}

} // namespace

RevtunConfig tag_invoke(const json::value_to_tag<RevtunConfig> &,
                        const json::value &jv) {
  auto *jo_p = jv.if_object();
  if (!jo_p) {
    throw PreconditionError(my_errors::GENERAL::JSON_PARSE_ERROR,
                            "RevtunConfig is not an object");
  }
  const auto &jo = *jo_p;

  std::vector<std::string> missing;
  for (const auto &key : kRequiredConfigKeys) {
    if (!present(jo, key)) {
      missing.push_back(key);
    }
  }
  if (!missing.empty()) {
    throw PreconditionError(
        my_errors::CONFIG::MISSING_REQUIRED,
        fmt::format("Missing required configuration values: {}",
                    fmt::join(missing, " ")),
        "configuration");
  }

  RevtunConfig rc{};
  rc.wg_port = int_field(jo, "wg_port", 0);
  rc.server_ssh_ip = string_field(jo, "server_ssh_ip");
  rc.server_tunnel_ip = string_field(jo, "server_tunnel_ip");
  rc.client_tunnel_ip = string_field(jo, "client_tunnel_ip");
  rc.additional_ip = string_field(jo, "additional_ip");
  rc.ssh_user = string_field(jo, "ssh_user");
  rc.ssh_port = int_field(jo, "ssh_port", 0);
  rc.remote_script = string_field(jo, "remote_script");
  rc.remote_service = string_field(jo, "remote_service");
  rc.server_wg_keyfile = string_field(jo, "server_wg_keyfile");
  rc.server_wg_pubfile = string_field(jo, "server_wg_pubfile");

  rc.interface_name = string_field(jo, "interface_name", rc.interface_name);
  rc.wireguard_dir =
      string_field(jo, "wireguard_dir", rc.wireguard_dir.string());
  rc.client_keyfile = string_field(jo, "client_keyfile");
  rc.client_pubfile = string_field(jo, "client_pubfile");
  rc.allowed_range = string_field(jo, "allowed_range", rc.allowed_range);
  rc.tunnel_prefix_length =
      int_field(jo, "tunnel_prefix_length", rc.tunnel_prefix_length);
  rc.keepalive_seconds = int_field(jo, "keepalive_seconds", rc.keepalive_seconds);
  rc.ssh_connect_timeout_seconds = int_field(
      jo, "ssh_connect_timeout_seconds", rc.ssh_connect_timeout_seconds);
  rc.remote_command_timeout_seconds = int_field(
      jo, "remote_command_timeout_seconds", rc.remote_command_timeout_seconds);
  rc.handshake_wait_seconds =
      int_field(jo, "handshake_wait_seconds", rc.handshake_wait_seconds);
  rc.stabilize_wait_seconds =
      int_field(jo, "stabilize_wait_seconds", rc.stabilize_wait_seconds);
  rc.supervision_interval_seconds = int_field(
      jo, "supervision_interval_seconds", rc.supervision_interval_seconds);
  rc.probe_attempts = int_field(jo, "probe_attempts", rc.probe_attempts);
  rc.probe_timeout_seconds =
      int_field(jo, "probe_timeout_seconds", rc.probe_timeout_seconds);
  rc.verbose = string_field(jo, "verbose");
  rc.runtime_dir = string_field(jo, "runtime_dir");

  if (rc.supervision_interval_seconds <= 0) {
    throw PreconditionError(my_errors::CONFIG::INVALID_VALUE,
                            "supervision_interval_seconds must be positive");
  }
  if (rc.probe_attempts <= 0 || rc.probe_timeout_seconds <= 0) {
    throw PreconditionError(my_errors::CONFIG::INVALID_VALUE,
                            "probe_attempts and probe_timeout_seconds must be "
                            "positive");
  }
  if (rc.ssh_port <= 0 || rc.ssh_port > 65535) {
    throw PreconditionError(
        my_errors::CONFIG::INVALID_VALUE,
        fmt::format("ssh_port={} is not a valid port", rc.ssh_port));
  }
  if (rc.ssh_connect_timeout_seconds <= 0 ||
      rc.remote_command_timeout_seconds <= 0) {
    throw PreconditionError(my_errors::CONFIG::INVALID_VALUE,
                            "ssh timeouts must be positive");
  }
  // These end up in commands executed on the server.
  auto require_path = [](const char *key, const std::string &value) {
    if (!stringutil::is_shell_safe_token(value) ||
        !stringutil::starts_with(value, "/")) {
      throw PreconditionError(
          my_errors::CONFIG::INVALID_VALUE,
          fmt::format("{}='{}' must be an absolute path of letters, digits "
                      "and ._-/@:+",
                      key, value));
    }
  };
  auto require_token = [](const char *key, const std::string &value) {
    if (!stringutil::is_shell_safe_token(value) ||
        stringutil::starts_with(value, "-")) {
      throw PreconditionError(
          my_errors::CONFIG::INVALID_VALUE,
          fmt::format("{}='{}' contains unsupported characters", key, value));
    }
  };
  require_path("remote_script", rc.remote_script);
  require_path("server_wg_keyfile", rc.server_wg_keyfile);
  require_path("server_wg_pubfile", rc.server_wg_pubfile);
  require_token("remote_service", rc.remote_service);
  require_token("ssh_user", rc.ssh_user);
  require_token("server_ssh_ip", rc.server_ssh_ip);
  return rc;
}

RevtunConfigProviderFile::RevtunConfigProviderFile(
    ConfigSources &config_sources, customio::IOutput &output)
    : output_(output), config_sources_(config_sources) {
  auto content = config_sources_.json_content("application");
  if (!content) {
    output_.error() << "Failed to load App config." << std::endl;
    throw PreconditionError(my_errors::GENERAL::FILE_NOT_FOUND,
                            "No application.json found in any configuration "
                            "directory");
  }
  raw_ = std::move(*content);
}

const RevtunConfig &RevtunConfigProviderFile::get() const {
  if (!config_) {
    config_ = json::value_to<RevtunConfig>(json::value(raw_));
  }
  return *config_;
}

void RevtunConfigProviderFile::save(const json::object &content) {
  auto f = config_sources_.override_file("application");
  json::object jo;
  if (fs::exists(f)) {
    std::ifstream ifs(f);
    if (!ifs) {
      throw RevtunError(my_errors::GENERAL::FILE_READ_WRITE,
                        "Unable to open configuration file: " + f.string());
    }
    std::string existing_content((std::istreambuf_iterator<char>(ifs)),
                                 std::istreambuf_iterator<char>());
    boost::system::error_code ec;
    auto jv = json::parse(existing_content, ec);
    if (ec || !jv.is_object()) {
      throw RevtunError(my_errors::GENERAL::INVALID_ARGUMENT,
                        "Configuration file is not a JSON object: " +
                            f.string());
    }
    jo = std::move(jv.as_object());
  }
  for (const auto &[key, value] : content) {
    jo[key] = value;
    raw_[key] = value;
  }
  std::ofstream ofs(f, std::ios::trunc);
  if (!ofs) {
    throw RevtunError(my_errors::GENERAL::FILE_READ_WRITE,
                      "Unable to open configuration file for writing: " +
                          f.string());
  }
  ofs << json::serialize(jo) << std::endl;
  config_.reset();
}

} // namespace revtun
