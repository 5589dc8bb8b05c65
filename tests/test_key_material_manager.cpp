#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "keys/key_material_manager.hpp"
#include "openssl/crypt_util.hpp"
#include "revtun_errors.hpp"
#include "revtun_test_support.hpp"

using namespace revtun;
namespace fs = std::filesystem;

TEST(LocalKeyMaterialTest, GeneratesOnceAndReusesAfterwards) {
  testinfra::TempDir dir;
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  keys::KeyMaterialManager keys(channel, out);

  const auto priv = dir.path() / "wg0.key";
  const auto pub = dir.path() / "wg0.pub";
  auto first = keys.ensure_local_key_pair(priv, pub);
  ASSERT_TRUE(fs::exists(priv));
  ASSERT_TRUE(fs::exists(pub));
  EXPECT_TRUE(cryptutil::is_wireguard_key(first.private_key));
  EXPECT_TRUE(cryptutil::is_wireguard_key(first.public_key));

  auto perms = fs::status(priv).permissions();
  EXPECT_EQ(perms & fs::perms::all,
            fs::perms::owner_read | fs::perms::owner_write);

  auto second = keys.ensure_local_key_pair(priv, pub);
  EXPECT_EQ(first.private_key, second.private_key);
  EXPECT_EQ(first.public_key, second.public_key);
  EXPECT_TRUE(channel.commands.empty());
}

TEST(LocalKeyMaterialTest, PublicKeyMatchesPrivateKey) {
  testinfra::TempDir dir;
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  keys::KeyMaterialManager keys(channel, out);

  auto pair = keys.ensure_local_key_pair(dir.path() / "k", dir.path() / "p");
  auto raw = cryptutil::decode_wireguard_key(pair.private_key);
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(cryptutil::encode_wireguard_key(cryptutil::derive_public_key(*raw)),
            pair.public_key);
  // WireGuard clamping
  EXPECT_EQ((*raw)[0] & 7, 0);
  EXPECT_EQ((*raw)[31] & 128, 0);
  EXPECT_EQ((*raw)[31] & 64, 64);
}

TEST(LocalKeyMaterialTest, MissingPublicKeyIsDerived) {
  testinfra::TempDir dir;
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  keys::KeyMaterialManager keys(channel, out);

  const auto priv = dir.path() / "wg0.key";
  const auto pub = dir.path() / "wg0.pub";
  auto first = keys.ensure_local_key_pair(priv, pub);
  fs::remove(pub);
  auto second = keys.ensure_local_key_pair(priv, pub);
  EXPECT_EQ(first.public_key, second.public_key);
  EXPECT_EQ(testinfra::read_text(pub), first.public_key + "\n");
}

TEST(LocalKeyMaterialTest, MalformedPrivateKeyIsRejected) {
  testinfra::TempDir dir;
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  keys::KeyMaterialManager keys(channel, out);

  const auto priv = dir.path() / "wg0.key";
  std::ofstream(priv) << "garbage\n";
  try {
    keys.ensure_local_key_pair(priv, dir.path() / "wg0.pub");
    FAIL() << "expected KeyRetrievalError";
  } catch (const KeyRetrievalError &e) {
    EXPECT_EQ(e.code(), my_errors::KEYS::MALFORMED_KEY);
  }
}

TEST(LocalKeyMaterialTest, ReadOnlyVariantNeverGenerates) {
  testinfra::TempDir dir;
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  keys::KeyMaterialManager keys(channel, out);

  EXPECT_FALSE(
      keys.read_local_key_pair(dir.path() / "k", dir.path() / "p").has_value());
  EXPECT_FALSE(fs::exists(dir.path() / "k"));

  auto pair = keys.ensure_local_key_pair(dir.path() / "k", dir.path() / "p");
  auto read = keys.read_local_key_pair(dir.path() / "k", dir.path() / "p");
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(read->public_key, pair.public_key);
}

TEST(RemoteKeyMaterialTest, ReturnsServerPublicKeyInOneRoundTrip) {
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  keys::KeyMaterialManager keys(channel, out);

  auto key = keys.ensure_remote_key_pair("/etc/wireguard/server.key",
                                         "/etc/wireguard/server.pub");
  EXPECT_EQ(key, channel.server_public_key);
  ASSERT_EQ(channel.commands.size(), 1u);
  const auto &cmd = channel.commands[0];
  EXPECT_NE(cmd.find("if [ ! -f '/etc/wireguard/server.key' ]"),
            std::string::npos);
  EXPECT_NE(cmd.find("chmod 600 '/etc/wireguard/server.key'"),
            std::string::npos);
  EXPECT_NE(cmd.find("cat '/etc/wireguard/server.pub'"), std::string::npos);
}

TEST(RemoteKeyMaterialTest, EmptyKeyIsAnError) {
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  channel.server_public_key = "";
  keys::KeyMaterialManager keys(channel, out);
  try {
    keys.ensure_remote_key_pair("/etc/wireguard/server.key",
                                "/etc/wireguard/server.pub");
    FAIL() << "expected KeyRetrievalError";
  } catch (const KeyRetrievalError &e) {
    EXPECT_EQ(e.code(), my_errors::KEYS::RETRIEVAL_FAILED);
    EXPECT_EQ(e.step(), "remote key material");
  }
}

TEST(RemoteKeyMaterialTest, UnreachableServerIsKeyRetrievalError) {
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  channel.unreachable = true;
  keys::KeyMaterialManager keys(channel, out);
  EXPECT_THROW(keys.ensure_remote_key_pair("/etc/wireguard/server.key",
                                           "/etc/wireguard/server.pub"),
               KeyRetrievalError);
}

TEST(RemoteKeyMaterialTest, ReadOnlyVariantReportsAbsence) {
  testinfra::SimulatedServerChannel channel;
  testinfra::TestOutput out;
  keys::KeyMaterialManager keys(channel, out);
  EXPECT_FALSE(
      keys.read_remote_public_key("/etc/wireguard/server.pub").has_value());
  channel.key_present = true;
  auto key = keys.read_remote_public_key("/etc/wireguard/server.pub");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(*key, channel.server_public_key);
}
