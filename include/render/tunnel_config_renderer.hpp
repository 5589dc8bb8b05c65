#pragma once

#include <ostream>
#include <string>

#include "render/provisioning_parameters.hpp"

namespace revtun {
namespace render {

enum class Role { Local, Remote };

inline std::ostream &operator<<(std::ostream &os, Role role) {
  return os << (role == Role::Local ? "local" : "remote");
}

struct RenderedConfig {
  Role role{Role::Local};
  std::string text;
};

// wg-quick configuration for one end of the tunnel. Pure: identical
// parameters always give byte-identical text.
//
// Local: interface (client private key, address, port) and the server peer
// with its endpoint.
// Remote: interface without an inline private key (PostUp loads it from the
// server key file), forwarding and NAT rules added on up and removed on down,
// and the client peer.
//
// Throws RenderError if a value would break the line-oriented format.
RenderedConfig render_config(Role role, const ProvisioningParameters &params);

} // namespace render
} // namespace revtun
