#pragma once

#include <string>

#include "conf/revtun_config.hpp"
#include "keys/key_material_manager.hpp"

namespace revtun {
namespace render {

// Everything both tunnel ends are rendered from. Built once per run and
// passed by const reference; a change means building a new value.
struct ProvisioningParameters {
  int listen_port{0};
  std::string server_tunnel_address;
  std::string client_tunnel_address;
  std::string additional_address;
  std::string server_public_key;
  std::string client_public_key;
  std::string allowed_range;
  int keepalive_interval{25};

  int tunnel_prefix_length{24};
  std::string server_endpoint_host;
  std::string interface_name{"wg0"};
  // path on the server; the server key itself never leaves the server
  std::string server_private_key_path;
  // only consumed by the local rendering
  std::string client_private_key;
  int supervision_interval_seconds{60};

  bool operator==(const ProvisioningParameters &) const = default;
};

// Validates and assembles the parameters. Throws PreconditionError listing
// every invalid value.
ProvisioningParameters make_parameters(const RevtunConfig &config,
                                       const std::string &server_public_key,
                                       const keys::KeyPair &client_keys);

bool is_ipv4_address(const std::string &value);
bool is_ipv4_cidr(const std::string &value);
// Linux interface names: 1..15 chars of [A-Za-z0-9_=+.-]
bool is_interface_name(const std::string &value);

} // namespace render
} // namespace revtun
