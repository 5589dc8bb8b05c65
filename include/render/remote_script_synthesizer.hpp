#pragma once

#include <string>

#include "render/provisioning_parameters.hpp"

namespace revtun {
namespace render {

struct ScriptArtifact {
  std::string content;
  // lowercase hex MD5 of `content`; compared against remote `md5sum`
  std::string fingerprint;
};

// Builds the server control script run by the supervised service. The
// script tears down any previous instance, writes the remote wg-quick
// configuration, brings the interface up, probes the client, prints a
// summary and then supervises the interface until it receives INT or TERM,
// at which point it removes its NAT rules and the interface.
class RemoteScriptSynthesizer {
public:
  RemoteScriptSynthesizer() = default;
  // Alternate template, mainly for tests. Must use the same placeholders.
  explicit RemoteScriptSynthesizer(std::string script_template)
      : template_(std::move(script_template)) {}

  ScriptArtifact synthesize(const ProvisioningParameters &params) const;

  static const std::string &default_template();

private:
  std::string template_{default_template()};
};

} // namespace render
} // namespace revtun
