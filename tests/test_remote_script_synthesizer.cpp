#include <gtest/gtest.h>

#include <string>

#include "openssl/crypt_util.hpp"
#include "render/provisioning_parameters.hpp"
#include "render/remote_script_synthesizer.hpp"
#include "revtun_errors.hpp"
#include "revtun_test_support.hpp"

using namespace revtun;

namespace {

render::ProvisioningParameters sample_params() {
  render::ProvisioningParameters p;
  p.listen_port = 51820;
  p.server_tunnel_address = "10.10.10.1";
  p.client_tunnel_address = "10.10.10.2";
  p.additional_address = "198.51.100.7";
  p.server_public_key = testinfra::make_public_key();
  p.client_public_key = testinfra::make_public_key();
  p.client_private_key = testinfra::make_public_key();
  p.allowed_range = "10.10.10.0/24";
  p.server_endpoint_host = "203.0.113.5";
  p.interface_name = "wg0";
  p.server_private_key_path = "/etc/wireguard/server.key";
  p.supervision_interval_seconds = 60;
  return p;
}

} // namespace

TEST(RemoteScriptSynthesizerTest, SameParametersGiveSameFingerprint) {
  render::RemoteScriptSynthesizer synthesizer;
  auto params = sample_params();
  auto a = synthesizer.synthesize(params);
  auto b = synthesizer.synthesize(params);
  EXPECT_EQ(a.content, b.content);
  EXPECT_EQ(a.fingerprint, b.fingerprint);
  EXPECT_EQ(a.fingerprint, cryptutil::md5_hex(a.content));
  EXPECT_EQ(a.fingerprint.size(), 32u);
}

TEST(RemoteScriptSynthesizerTest, ChangedAdditionalAddressChangesFingerprint) {
  render::RemoteScriptSynthesizer synthesizer;
  auto params = sample_params();
  auto before = synthesizer.synthesize(params);
  params.additional_address = "198.51.100.8";
  auto after = synthesizer.synthesize(params);
  EXPECT_NE(before.fingerprint, after.fingerprint);
}

TEST(RemoteScriptSynthesizerTest, EmbedsConfigurationAndQuotedParameters) {
  render::RemoteScriptSynthesizer synthesizer;
  auto params = sample_params();
  auto script = synthesizer.synthesize(params).content;

  EXPECT_EQ(script.rfind("#!/bin/bash\n", 0), 0u);
  EXPECT_NE(script.find("INTERFACE='wg0'\n"), std::string::npos);
  EXPECT_NE(script.find("WG_CONF='/etc/wireguard/wg0.conf'\n"),
            std::string::npos);
  EXPECT_NE(script.find("ADDITIONAL_IP='198.51.100.7'\n"), std::string::npos);
  EXPECT_NE(script.find("WG_PORT='51820'\n"), std::string::npos);
  EXPECT_NE(script.find("CHECK_INTERVAL='60'\n"), std::string::npos);
  EXPECT_NE(script.find("<<'REVTUN_WG_CONF'\n[Interface]\n"),
            std::string::npos);
  EXPECT_NE(script.find("PersistentKeepalive = 25\nREVTUN_WG_CONF\n"),
            std::string::npos);
  EXPECT_NE(script.find("trap on_signal INT TERM"), std::string::npos);
  EXPECT_NE(script.find("wg-quick up \"$INTERFACE\""), std::string::npos);
  // the server private key never appears, only its path
  EXPECT_EQ(script.find("PrivateKey"), std::string::npos);
  EXPECT_EQ(script.find(params.client_private_key), std::string::npos);
  EXPECT_EQ(script.find("__"), std::string::npos);
}

TEST(RemoteScriptSynthesizerTest, UnknownPlaceholderInTemplateIsRejected) {
  render::RemoteScriptSynthesizer synthesizer(
      "#!/bin/bash\nIFACE=__INTERFACE__\nX=__UNKNOWN_THING__\n");
  EXPECT_THROW(synthesizer.synthesize(sample_params()), RenderError);
}

TEST(RemoteScriptSynthesizerTest, CustomTemplateIsFingerprinted) {
  render::RemoteScriptSynthesizer synthesizer(
      "iface=__INTERFACE__ port=__WG_PORT__\n");
  auto artifact = synthesizer.synthesize(sample_params());
  EXPECT_EQ(artifact.content, "iface='wg0' port='51820'\n");
  EXPECT_EQ(artifact.fingerprint, cryptutil::md5_hex(artifact.content));
}
