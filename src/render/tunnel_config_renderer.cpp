#include "render/tunnel_config_renderer.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "revtun_errors.hpp"

namespace revtun {
namespace render {

namespace {

void require_single_line(const std::string &name, const std::string &value) {
  if (value.find_first_of("\r\n") != std::string::npos) {
    throw RenderError(my_errors::RENDER::UNSAFE_VALUE,
                      fmt::format("{} contains a line break", name), "render");
  }
}

void require_single_line(const ProvisioningParameters &p) {
  require_single_line("server_tunnel_address", p.server_tunnel_address);
  require_single_line("client_tunnel_address", p.client_tunnel_address);
  require_single_line("additional_address", p.additional_address);
  require_single_line("server_public_key", p.server_public_key);
  require_single_line("client_public_key", p.client_public_key);
  require_single_line("allowed_range", p.allowed_range);
  require_single_line("server_endpoint_host", p.server_endpoint_host);
  require_single_line("server_private_key_path", p.server_private_key_path);
  require_single_line("client_private_key", p.client_private_key);
}

std::string render_local(const ProvisioningParameters &p) {
  return fmt::format("[Interface]\n"
                     "PrivateKey = {}\n"
                     "Address = {}/{}\n"
                     "ListenPort = {}\n"
                     "\n"
                     "[Peer]\n"
                     "PublicKey = {}\n"
                     "Endpoint = {}:{}\n"
                     "AllowedIPs = {}\n"
                     "PersistentKeepalive = {}\n",
                     p.client_private_key, p.client_tunnel_address,
                     p.tunnel_prefix_length, p.listen_port,
                     p.server_public_key, p.server_endpoint_host,
                     p.listen_port, p.allowed_range, p.keepalive_interval);
}

std::string render_remote(const ProvisioningParameters &p) {
  const std::string dnat =
      fmt::format("PREROUTING -d {} -j DNAT --to-destination {}",
                  p.additional_address, p.client_tunnel_address);
  const std::string snat =
      fmt::format("POSTROUTING -d {} -j SNAT --to-source {}",
                  p.client_tunnel_address, p.server_tunnel_address);

  return fmt::format(
      "[Interface]\n"
      "Address = {address}/{prefix}\n"
      "ListenPort = {port}\n"
      "SaveConfig = false\n"
      "PostUp = wg set %i private-key {key_path}\n"
      "\n"
      "# Enable IP forwarding\n"
      "PostUp = sysctl -w net.ipv4.ip_forward=1\n"
      "PostUp = sysctl -w net.ipv6.conf.all.forwarding=1\n"
      "\n"
      "# Forward all traffic for the additional address to the client;\n"
      "# SNAT sends replies back through the tunnel\n"
      "PostUp = iptables -t nat -A {dnat}\n"
      "PostUp = iptables -t nat -A {snat}\n"
      "\n"
      "PostDown = iptables -t nat -D {dnat}\n"
      "PostDown = iptables -t nat -D {snat}\n"
      "\n"
      "[Peer]\n"
      "PublicKey = {client_pub}\n"
      "AllowedIPs = {allowed}\n"
      "PersistentKeepalive = {keepalive}\n",
      fmt::arg("address", p.server_tunnel_address),
      fmt::arg("prefix", p.tunnel_prefix_length),
      fmt::arg("port", p.listen_port),
      fmt::arg("key_path", p.server_private_key_path), fmt::arg("dnat", dnat),
      fmt::arg("snat", snat), fmt::arg("client_pub", p.client_public_key),
      fmt::arg("allowed", p.allowed_range),
      fmt::arg("keepalive", p.keepalive_interval));
}

} // namespace

RenderedConfig render_config(Role role, const ProvisioningParameters &params) {
  require_single_line(params);
  if (role == Role::Local) {
    return RenderedConfig{role, render_local(params)};
  }
  return RenderedConfig{role, render_remote(params)};
}

} // namespace render
} // namespace revtun
