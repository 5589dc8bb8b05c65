#include "render/provisioning_parameters.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <vector>

#include "my_error_codes.hpp"
#include "openssl/crypt_util.hpp"
#include "revtun_errors.hpp"
#include "util/string_util.hpp"

namespace revtun {
namespace render {

bool is_ipv4_address(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  boost::system::error_code ec;
  auto addr = boost::asio::ip::make_address_v4(value, ec);
  // make_address_v4 accepts some legacy shorthand forms; require canonical.
  return !ec && addr.to_string() == value;
}

bool is_ipv4_cidr(const std::string &value) {
  auto slash = value.find('/');
  if (slash == std::string::npos || slash + 1 >= value.size()) {
    return false;
  }
  std::string prefix = value.substr(slash + 1);
  if (prefix.size() > 2 ||
      !std::all_of(prefix.begin(), prefix.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  int bits = std::stoi(prefix);
  return bits >= 0 && bits <= 32 && is_ipv4_address(value.substr(0, slash));
}

bool is_interface_name(const std::string &value) {
  if (value.empty() || value.size() > 15) {
    return false;
  }
  return std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '=' || c == '+' || c == '.' ||
           c == '-';
  });
}

ProvisioningParameters make_parameters(const RevtunConfig &config,
                                       const std::string &server_public_key,
                                       const keys::KeyPair &client_keys) {
  std::vector<std::string> problems;
  auto check = [&problems](bool ok, const std::string &what) {
    if (!ok) {
      problems.push_back(what);
    }
  };

  check(config.wg_port > 0 && config.wg_port <= 65535,
        fmt::format("wg_port={} is not a valid port", config.wg_port));
  check(is_ipv4_address(config.server_tunnel_ip),
        fmt::format("server_tunnel_ip='{}' is not an IPv4 address",
                    config.server_tunnel_ip));
  check(is_ipv4_address(config.client_tunnel_ip),
        fmt::format("client_tunnel_ip='{}' is not an IPv4 address",
                    config.client_tunnel_ip));
  check(is_ipv4_address(config.additional_ip),
        fmt::format("additional_ip='{}' is not an IPv4 address",
                    config.additional_ip));
  check(config.server_tunnel_ip != config.client_tunnel_ip,
        "server_tunnel_ip and client_tunnel_ip must differ");
  check(is_ipv4_cidr(config.allowed_range),
        fmt::format("allowed_range='{}' is not an IPv4 CIDR range",
                    config.allowed_range));
  check(config.tunnel_prefix_length >= 1 && config.tunnel_prefix_length <= 32,
        fmt::format("tunnel_prefix_length={} is out of range",
                    config.tunnel_prefix_length));
  check(config.keepalive_seconds >= 0 && config.keepalive_seconds <= 65535,
        fmt::format("keepalive_seconds={} is out of range",
                    config.keepalive_seconds));
  check(stringutil::is_shell_safe_token(config.server_ssh_ip),
        fmt::format("server_ssh_ip='{}' is not a host name or address",
                    config.server_ssh_ip));
  check(is_interface_name(config.interface_name),
        fmt::format("interface_name='{}' is not a valid interface name",
                    config.interface_name));
  check(stringutil::is_shell_safe_token(config.server_wg_keyfile) &&
            stringutil::starts_with(config.server_wg_keyfile, "/"),
        fmt::format("server_wg_keyfile='{}' must be an absolute path",
                    config.server_wg_keyfile));
  check(cryptutil::is_wireguard_key(server_public_key),
        "server public key is not a WireGuard key");
  check(cryptutil::is_wireguard_key(client_keys.public_key),
        "client public key is not a WireGuard key");
  check(cryptutil::is_wireguard_key(client_keys.private_key),
        "client private key is not a WireGuard key");

  if (!problems.empty()) {
    throw PreconditionError(
        my_errors::CONFIG::INVALID_VALUE,
        fmt::format("invalid provisioning parameters: {}",
                    fmt::join(problems, "; ")),
        "parameters");
  }

  ProvisioningParameters params;
  params.listen_port = config.wg_port;
  params.server_tunnel_address = config.server_tunnel_ip;
  params.client_tunnel_address = config.client_tunnel_ip;
  params.additional_address = config.additional_ip;
  params.server_public_key = server_public_key;
  params.client_public_key = client_keys.public_key;
  params.allowed_range = config.allowed_range;
  params.keepalive_interval = config.keepalive_seconds;
  params.tunnel_prefix_length = config.tunnel_prefix_length;
  params.server_endpoint_host = config.server_ssh_ip;
  params.interface_name = config.interface_name;
  params.server_private_key_path = config.server_wg_keyfile;
  params.client_private_key = client_keys.private_key;
  params.supervision_interval_seconds = config.supervision_interval_seconds;
  return params;
}

} // namespace render
} // namespace revtun
