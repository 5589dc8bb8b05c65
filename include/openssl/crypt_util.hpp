#pragma once

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace revtun {
namespace cryptutil {

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EVP_PKEY_CTX_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

inline constexpr std::size_t WG_KEY_LEN = 32;
// base64 of 32 bytes, one '=' of padding
inline constexpr std::size_t WG_KEY_B64_LEN = 44;

using RawKey = std::array<std::uint8_t, WG_KEY_LEN>;

// Lowercase hex MD5, byte-for-byte what `md5sum` prints for the same input.
std::string md5_hex(std::string_view content);

std::string base64_encode(const std::uint8_t *data, std::size_t len);
// nullopt on malformed input
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view b64);

// Fresh Curve25519 private key with the WireGuard clamping applied, so the
// output is indistinguishable from `wg genkey`.
RawKey generate_private_key();

// Curve25519 public key for `private_key` (what `wg pubkey` prints).
RawKey derive_public_key(const RawKey &private_key);

// Accepts exactly the textual form `wg` emits: 44 chars decoding to 32 bytes.
bool is_wireguard_key(std::string_view b64);

std::optional<RawKey> decode_wireguard_key(std::string_view b64);

inline std::string encode_wireguard_key(const RawKey &key) {
  return base64_encode(key.data(), key.size());
}

} // namespace cryptutil
} // namespace revtun
