#include "render/remote_script_synthesizer.hpp"

#include <fmt/format.h>

#include <regex>
#include <utility>
#include <vector>

#include "my_error_codes.hpp"
#include "openssl/crypt_util.hpp"
#include "render/tunnel_config_renderer.hpp"
#include "revtun_errors.hpp"
#include "util/string_util.hpp"

namespace revtun {
namespace render {

namespace {

constexpr const char *kConfigTerminator = "REVTUN_WG_CONF";

// clang-format off
const char *const kServerScriptTemplate = R"SCRIPT(#!/bin/bash
# Managed by revtun. Regenerated on every deploy; local edits are overwritten.
set -euo pipefail

INTERFACE=__INTERFACE__
WG_CONF=__WG_CONF__
SERVER_TUNNEL_IP=__SERVER_TUNNEL_IP__
CLIENT_TUNNEL_IP=__CLIENT_TUNNEL_IP__
ADDITIONAL_IP=__ADDITIONAL_IP__
WG_PORT=__WG_PORT__
CHECK_INTERVAL=__CHECK_INTERVAL__

cleanup() {
    echo "Server cleanup..."
    iptables -t nat -D PREROUTING -d "$ADDITIONAL_IP" -j DNAT --to-destination "$CLIENT_TUNNEL_IP" 2>/dev/null || true
    iptables -t nat -D POSTROUTING -d "$CLIENT_TUNNEL_IP" -j SNAT --to-source "$SERVER_TUNNEL_IP" 2>/dev/null || true
    wg-quick down "$INTERFACE" 2>/dev/null || true
}

on_signal() {
    cleanup
    exit 0
}

cleanup
trap on_signal INT TERM

echo "Creating server WireGuard configuration..."
mkdir -p "$(dirname "$WG_CONF")"
umask 077
cat > "$WG_CONF" <<'__CONFIG_TERMINATOR__'
__WG_CONFIG__
__CONFIG_TERMINATOR__
chmod 600 "$WG_CONF"

echo "Bringing up WireGuard interface $INTERFACE..."
wg-quick up "$INTERFACE"

echo ""
echo "Server configuration complete!"
echo "Testing tunnel connectivity..."
sleep 2

if ping -c 2 -W 2 "$CLIENT_TUNNEL_IP"; then
    echo "Tunnel is UP! Can reach client at $CLIENT_TUNNEL_IP"
else
    echo "Cannot reach client at $CLIENT_TUNNEL_IP"
    echo "Showing WireGuard status:"
    wg show "$INTERFACE" || true
fi

echo ""
echo "=== Server Summary ==="
echo "- Tunnel IP: $SERVER_TUNNEL_IP"
echo "- Client IP: $CLIENT_TUNNEL_IP"
echo "- WireGuard port: $WG_PORT"
echo "- Additional IP $ADDITIONAL_IP now forwards to client"
echo ""

while true; do
    sleep "$CHECK_INTERVAL" &
    wait $! || true
    if ! wg show "$INTERFACE" >/dev/null 2>&1; then
        echo "WireGuard interface went down! Attempting to restart..."
        wg-quick up "$INTERFACE" || true
    fi
done
)SCRIPT";
// clang-format on

} // namespace

const std::string &RemoteScriptSynthesizer::default_template() {
  static const std::string tmpl(kServerScriptTemplate);
  return tmpl;
}

ScriptArtifact
RemoteScriptSynthesizer::synthesize(const ProvisioningParameters &params) const {
  using stringutil::shell_quote;

  auto remote = render_config(Role::Remote, params);
  std::string config_text = remote.text;
  while (!config_text.empty() && config_text.back() == '\n') {
    config_text.pop_back();
  }
  for (const auto &line : stringutil::split_lines(config_text)) {
    if (line == kConfigTerminator) {
      throw RenderError(my_errors::RENDER::UNSAFE_VALUE,
                        "remote configuration contains the heredoc terminator",
                        "synthesize");
    }
  }

  const std::string wg_conf =
      fmt::format("/etc/wireguard/{}.conf", params.interface_name);

  // Values are substituted first and the configuration body last so that
  // nothing inside the body is ever treated as a placeholder.
  const std::vector<std::pair<std::string, std::string>> substitutions{
      {"__INTERFACE__", shell_quote(params.interface_name)},
      {"__WG_CONF__", shell_quote(wg_conf)},
      {"__SERVER_TUNNEL_IP__", shell_quote(params.server_tunnel_address)},
      {"__CLIENT_TUNNEL_IP__", shell_quote(params.client_tunnel_address)},
      {"__ADDITIONAL_IP__", shell_quote(params.additional_address)},
      {"__WG_PORT__", shell_quote(std::to_string(params.listen_port))},
      {"__CHECK_INTERVAL__",
       shell_quote(std::to_string(params.supervision_interval_seconds))},
      {"__CONFIG_TERMINATOR__", kConfigTerminator},
  };

  std::string content = template_;
  for (const auto &[placeholder, value] : substitutions) {
    content = stringutil::replaceAllEfficient(content, placeholder, value);
  }

  static const std::regex leftover(R"(__[A-Z_]+__)");
  std::string without_body =
      stringutil::replaceAllEfficient(content, "__WG_CONFIG__", "");
  std::smatch m;
  if (std::regex_search(without_body, m, leftover)) {
    throw RenderError(my_errors::RENDER::TEMPLATE_PLACEHOLDER,
                      fmt::format("unresolved placeholder {}", m.str()),
                      "synthesize");
  }
  content =
      stringutil::replaceAllEfficient(content, "__WG_CONFIG__", config_text);

  ScriptArtifact artifact;
  artifact.fingerprint = cryptutil::md5_hex(content);
  artifact.content = std::move(content);
  return artifact;
}

} // namespace render
} // namespace revtun
