#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "conf/config_sources.hpp"
#include "customio/output.hpp"

namespace revtun {
namespace fs = std::filesystem;
namespace json = boost::json;

// Keys every deployment must provide; missing ones are reported together.
inline const std::vector<std::string> kRequiredConfigKeys{
    "wg_port",          "server_ssh_ip",  "server_tunnel_ip",
    "client_tunnel_ip", "additional_ip",  "ssh_user",
    "ssh_port",         "remote_script",  "remote_service",
    "server_wg_keyfile", "server_wg_pubfile"};

struct RevtunConfig {
  // required
  int wg_port{0};
  std::string server_ssh_ip;
  std::string server_tunnel_ip;
  std::string client_tunnel_ip;
  std::string additional_ip;
  std::string ssh_user;
  int ssh_port{0};
  std::string remote_script;
  std::string remote_service;
  std::string server_wg_keyfile;
  std::string server_wg_pubfile;

  // optional
  std::string interface_name{"wg0"};
  fs::path wireguard_dir{"/etc/wireguard"};
  fs::path client_keyfile{};  // defaults to <wireguard_dir>/<interface>.key
  fs::path client_pubfile{};  // defaults to <wireguard_dir>/<interface>.pub
  std::string allowed_range{"10.10.10.0/24"};
  int tunnel_prefix_length{24};
  int keepalive_seconds{25};
  int ssh_connect_timeout_seconds{10};
  int remote_command_timeout_seconds{120};
  int handshake_wait_seconds{3};
  int stabilize_wait_seconds{15};
  int supervision_interval_seconds{60};
  int probe_attempts{3};
  int probe_timeout_seconds{3};
  std::string verbose{};
  fs::path runtime_dir{};

  fs::path client_keyfile_path() const {
    return client_keyfile.empty() ? wireguard_dir / (interface_name + ".key")
                                  : client_keyfile;
  }
  fs::path client_pubfile_path() const {
    return client_pubfile.empty() ? wireguard_dir / (interface_name + ".pub")
                                  : client_pubfile;
  }

  // Throws PreconditionError naming every missing required key.
  friend RevtunConfig tag_invoke(const json::value_to_tag<RevtunConfig> &,
                                 const json::value &jv);
};

class IRevtunConfigProvider {
public:
  virtual ~IRevtunConfigProvider() = default;

  // Parsed, validated configuration. Throws PreconditionError when required
  // keys are missing, so subcommands that only edit configuration can still
  // run against an incomplete setup.
  virtual const RevtunConfig &get() const = 0;
  // Merged JSON as loaded, before validation.
  virtual const json::object &raw() const = 0;

  // Persists the given keys into application.override.json.
  virtual void save(const json::object &content) = 0;
};

class RevtunConfigProviderFile : public IRevtunConfigProvider {
  json::object raw_;
  mutable std::optional<RevtunConfig> config_;
  customio::IOutput &output_;
  ConfigSources &config_sources_;

public:
  RevtunConfigProviderFile(ConfigSources &config_sources,
                           customio::IOutput &output);

  const RevtunConfig &get() const override;
  const json::object &raw() const override { return raw_; }

  void save(const json::object &content) override;
};

} // namespace revtun
