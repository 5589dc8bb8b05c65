#include "openssl/crypt_util.hpp"

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace revtun {
namespace cryptutil {

namespace {

std::string last_openssl_error(const char *what) {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return what;
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return fmt::format("{}: {}", what, buf);
}

} // namespace

std::string md5_hex(std::string_view content) {
  EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
  if (!context) {
    throw std::runtime_error("Failed to create EVP_MD_CTX.");
  }
  if (EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error(last_openssl_error("EVP_DigestInit_ex failed"));
  }
  if (EVP_DigestUpdate(context.get(), content.data(), content.size()) != 1) {
    throw std::runtime_error(last_openssl_error("EVP_DigestUpdate failed"));
  }
  unsigned char hash[EVP_MAX_MD_SIZE];  // Maximum size for any hash
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(context.get(), hash, &hash_len) != 1) {
    throw std::runtime_error(last_openssl_error("EVP_DigestFinal_ex failed"));
  }

  // Convert the hash to a hex string
  std::string hex_str;
  hex_str.reserve(hash_len * 2);
  for (unsigned int i = 0; i < hash_len; ++i) {
    hex_str += fmt::format("{:02x}", hash[i]);
  }
  return hex_str;
}

std::string base64_encode(const std::uint8_t *data, std::size_t len) {
  std::string out(4 * ((len + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                data, static_cast<int>(len));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view b64) {
  if (b64.empty() || b64.size() % 4 != 0) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> out(3 * b64.size() / 4);
  int n = EVP_DecodeBlock(out.data(),
                          reinterpret_cast<const unsigned char *>(b64.data()),
                          static_cast<int>(b64.size()));
  if (n < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock keeps the bytes produced by padding; drop them.
  std::size_t padding = 0;
  if (b64.back() == '=') {
    ++padding;
    if (b64[b64.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(n) - padding);
  return out;
}

RawKey generate_private_key() {
  RawKey key{};
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    throw std::runtime_error(last_openssl_error("RAND_bytes failed"));
  }
  key[0] &= 248;
  key[31] &= 127;
  key[31] |= 64;
  return key;
}

RawKey derive_public_key(const RawKey &private_key) {
  EVP_PKEY_ptr pkey{EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                 private_key.data(),
                                                 private_key.size()),
                    &EVP_PKEY_free};
  if (!pkey) {
    throw std::runtime_error(
        last_openssl_error("EVP_PKEY_new_raw_private_key failed"));
  }
  RawKey pub{};
  std::size_t pub_len = pub.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &pub_len) != 1 ||
      pub_len != WG_KEY_LEN) {
    throw std::runtime_error(
        last_openssl_error("EVP_PKEY_get_raw_public_key failed"));
  }
  return pub;
}

std::optional<RawKey> decode_wireguard_key(std::string_view b64) {
  if (b64.size() != WG_KEY_B64_LEN || b64.back() != '=') {
    return std::nullopt;
  }
  auto bytes = base64_decode(b64);
  if (!bytes || bytes->size() != WG_KEY_LEN) {
    return std::nullopt;
  }
  RawKey key{};
  std::copy(bytes->begin(), bytes->end(), key.begin());
  return key;
}

bool is_wireguard_key(std::string_view b64) {
  return decode_wireguard_key(b64).has_value();
}

} // namespace cryptutil
} // namespace revtun
