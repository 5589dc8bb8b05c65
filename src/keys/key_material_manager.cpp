#include "keys/key_material_manager.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "openssl/crypt_util.hpp"
#include "revtun_errors.hpp"
#include "util/file_util.hpp"
#include "util/string_util.hpp"

namespace revtun {
namespace keys {

using stringutil::shell_quote;

namespace {

constexpr const char *kRemoteStep = "remote key material";
constexpr const char *kLocalStep = "local key material";

std::string read_key_file(const fs::path &path) {
  std::error_code ec;
  std::string content = stringutil::readFile(path.string(), ec);
  if (ec) {
    throw KeyRetrievalError(
        my_errors::KEYS::RETRIEVAL_FAILED,
        fmt::format("cannot read '{}': {}", path.string(), ec.message()),
        kLocalStep);
  }
  return stringutil::trimmed(std::move(content));
}

void require_valid_key(const std::string &key, const std::string &origin,
                       const char *step) {
  if (key.empty()) {
    throw KeyRetrievalError(my_errors::KEYS::RETRIEVAL_FAILED,
                            fmt::format("empty public key from {}", origin),
                            step);
  }
  if (!cryptutil::is_wireguard_key(key)) {
    throw KeyRetrievalError(
        my_errors::KEYS::MALFORMED_KEY,
        fmt::format("malformed key from {}: '{}'", origin, key), step);
  }
}

void write_key_file(const fs::path &path, const std::string &key,
                    fs::perms perms) {
  try {
    fileutil::write_file_atomic(path, key + "\n", perms);
  } catch (const std::exception &e) {
    throw KeyRetrievalError(my_errors::KEYS::GENERATION_FAILED,
                            fmt::format("cannot write '{}': {}", path.string(),
                                        e.what()),
                            kLocalStep);
  }
}

} // namespace

std::string
KeyMaterialManager::remote_ensure_command(const std::string &private_key_path,
                                          const std::string &public_key_path) {
  const auto priv = shell_quote(private_key_path);
  const auto pub = shell_quote(public_key_path);
  return fmt::format("set -e\n"
                     "umask 077\n"
                     "mkdir -p \"$(dirname {priv})\" \"$(dirname {pub})\"\n"
                     "if [ ! -f {priv} ]; then\n"
                     "  wg genkey > {priv}\n"
                     "  chmod 600 {priv}\n"
                     "  wg pubkey < {priv} > {pub}\n"
                     "elif [ ! -s {pub} ]; then\n"
                     "  wg pubkey < {priv} > {pub}\n"
                     "fi\n"
                     "cat {pub}\n",
                     fmt::arg("priv", priv), fmt::arg("pub", pub));
}

std::string
KeyMaterialManager::ensure_remote_key_pair(const std::string &private_key_path,
                                           const std::string &public_key_path) {
  remote::RemoteExecResult r;
  try {
    r = channel_.execute(
        remote_ensure_command(private_key_path, public_key_path));
  } catch (const RemoteExecError &e) {
    throw KeyRetrievalError(e.code(), e.what(), kRemoteStep);
  }
  if (!r.ok()) {
    throw KeyRetrievalError(
        my_errors::KEYS::RETRIEVAL_FAILED,
        fmt::format("key command on {} exited with code {}: {}",
                    channel_.describe(), r.exit_code,
                    stringutil::trimmed(r.stderr_data)),
        kRemoteStep);
  }
  std::string key = stringutil::trimmed(r.stdout_data);
  require_valid_key(key, channel_.describe(), kRemoteStep);
  output_.debug() << "Server public key: " << key;
  return key;
}

KeyPair KeyMaterialManager::ensure_local_key_pair(
    const fs::path &private_key_path, const fs::path &public_key_path) {
  KeyPair pair;
  std::error_code ec;
  if (!fs::exists(private_key_path, ec)) {
    output_.info() << "Generating WireGuard keypair for client";
    cryptutil::RawKey priv;
    cryptutil::RawKey pub;
    try {
      priv = cryptutil::generate_private_key();
      pub = cryptutil::derive_public_key(priv);
    } catch (const std::exception &e) {
      throw KeyRetrievalError(my_errors::KEYS::GENERATION_FAILED, e.what(),
                              kLocalStep);
    }
    pair.private_key = cryptutil::encode_wireguard_key(priv);
    pair.public_key = cryptutil::encode_wireguard_key(pub);
    write_key_file(private_key_path, pair.private_key,
                   fileutil::private_file_perms());
    write_key_file(public_key_path, pair.public_key,
                   fileutil::public_file_perms());
    return pair;
  }

  output_.info() << "Using existing WireGuard keypair";
  pair.private_key = read_key_file(private_key_path);
  auto raw_priv = cryptutil::decode_wireguard_key(pair.private_key);
  if (!raw_priv) {
    throw KeyRetrievalError(
        my_errors::KEYS::MALFORMED_KEY,
        fmt::format("malformed private key in '{}'", private_key_path.string()),
        kLocalStep);
  }

  bool pub_missing = !fs::exists(public_key_path, ec) ||
                     fs::file_size(public_key_path, ec) == 0 || ec;
  if (pub_missing) {
    output_.debug() << "Deriving missing public key "
                    << public_key_path.string();
    try {
      pair.public_key = cryptutil::encode_wireguard_key(
          cryptutil::derive_public_key(*raw_priv));
    } catch (const std::exception &e) {
      throw KeyRetrievalError(my_errors::KEYS::GENERATION_FAILED, e.what(),
                              kLocalStep);
    }
    write_key_file(public_key_path, pair.public_key,
                   fileutil::public_file_perms());
  } else {
    pair.public_key = read_key_file(public_key_path);
  }
  require_valid_key(pair.public_key, public_key_path.string(), kLocalStep);
  return pair;
}

std::optional<std::string>
KeyMaterialManager::read_remote_public_key(const std::string &public_key_path) {
  auto r = channel_.execute(fmt::format(
      "if [ -s {0} ]; then cat {0}; fi", shell_quote(public_key_path)));
  if (!r.ok()) {
    return std::nullopt;
  }
  std::string key = stringutil::trimmed(r.stdout_data);
  if (key.empty()) {
    return std::nullopt;
  }
  require_valid_key(key, channel_.describe(), kRemoteStep);
  return key;
}

std::optional<KeyPair>
KeyMaterialManager::read_local_key_pair(const fs::path &private_key_path,
                                        const fs::path &public_key_path) {
  std::error_code ec;
  if (!fs::exists(private_key_path, ec) || !fs::exists(public_key_path, ec)) {
    return std::nullopt;
  }
  KeyPair pair{read_key_file(private_key_path),
               read_key_file(public_key_path)};
  require_valid_key(pair.public_key, public_key_path.string(), kLocalStep);
  return pair;
}

} // namespace keys
} // namespace revtun
