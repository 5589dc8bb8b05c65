#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "customio/output.hpp"
#include "remote/remote_channel.hpp"

namespace revtun {
namespace keys {

namespace fs = std::filesystem;

struct KeyPair {
  std::string private_key;
  std::string public_key;
};

// Ensures a WireGuard key pair exists on either host and hands back the
// public half. Keys are generated only when the private key file is absent
// and are never rotated. Every failure is a KeyRetrievalError: without both
// public keys no configuration can be rendered.
class KeyMaterialManager {
  remote::IRemoteChannel &channel_;
  customio::IOutput &output_;

public:
  KeyMaterialManager(remote::IRemoteChannel &channel,
                     customio::IOutput &output)
      : channel_(channel), output_(output) {}

  // One round trip: generate on the server if missing, then print the public
  // key.
  std::string ensure_remote_key_pair(const std::string &private_key_path,
                                     const std::string &public_key_path);

  // Same contract, performed in-process. The private key file is mode 0600.
  KeyPair ensure_local_key_pair(const fs::path &private_key_path,
                                const fs::path &public_key_path);

  // Read-only variants; nullopt when the key does not exist yet.
  std::optional<std::string>
  read_remote_public_key(const std::string &public_key_path);
  std::optional<KeyPair> read_local_key_pair(const fs::path &private_key_path,
                                             const fs::path &public_key_path);

  // Shell snippet executed by ensure_remote_key_pair.
  static std::string remote_ensure_command(const std::string &private_key_path,
                                           const std::string &public_key_path);
};

} // namespace keys
} // namespace revtun
