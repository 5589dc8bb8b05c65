#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <fstream>

#include "conf/config_sources.hpp"
#include "conf/revtun_config.hpp"
#include "revtun_errors.hpp"
#include "revtun_test_support.hpp"

using namespace revtun;
namespace json = boost::json;

namespace {

json::object complete_object() {
  return json::object{{"wg_port", 51820},
                      {"server_ssh_ip", "203.0.113.5"},
                      {"server_tunnel_ip", "10.10.10.1"},
                      {"client_tunnel_ip", "10.10.10.2"},
                      {"additional_ip", "198.51.100.7"},
                      {"ssh_user", "root"},
                      {"ssh_port", 22},
                      {"remote_script", "/usr/local/bin/wg-reverse-tunnel.sh"},
                      {"remote_service", "wg-reverse-tunnel"},
                      {"server_wg_keyfile", "/etc/wireguard/server.key"},
                      {"server_wg_pubfile", "/etc/wireguard/server.pub"}};
}

RevtunConfig parse(const json::object &jo) {
  return json::value_to<RevtunConfig>(json::value(jo));
}

void write_json(const fs::path &file, const json::object &jo) {
  std::ofstream(file) << json::serialize(jo);
}

} // namespace

TEST(RevtunConfigTest, ParsesCompleteObjectWithDefaults) {
  auto c = parse(complete_object());
  EXPECT_EQ(c.wg_port, 51820);
  EXPECT_EQ(c.server_ssh_ip, "203.0.113.5");
  EXPECT_EQ(c.ssh_port, 22);
  EXPECT_EQ(c.interface_name, "wg0");
  EXPECT_EQ(c.wireguard_dir, fs::path("/etc/wireguard"));
  EXPECT_EQ(c.allowed_range, "10.10.10.0/24");
  EXPECT_EQ(c.keepalive_seconds, 25);
  EXPECT_EQ(c.handshake_wait_seconds, 3);
  EXPECT_EQ(c.stabilize_wait_seconds, 15);
  EXPECT_EQ(c.supervision_interval_seconds, 60);
  EXPECT_EQ(c.probe_attempts, 3);
  EXPECT_EQ(c.client_keyfile_path(), fs::path("/etc/wireguard/wg0.key"));
  EXPECT_EQ(c.client_pubfile_path(), fs::path("/etc/wireguard/wg0.pub"));
}

TEST(RevtunConfigTest, EveryMissingKeyIsReportedAtOnce) {
  auto jo = complete_object();
  jo.erase("additional_ip");
  jo.erase("ssh_user");
  jo["server_wg_pubfile"] = "";
  try {
    parse(jo);
    FAIL() << "expected PreconditionError";
  } catch (const PreconditionError &e) {
    EXPECT_EQ(e.code(), my_errors::CONFIG::MISSING_REQUIRED);
    std::string what = e.what();
    EXPECT_NE(what.find("additional_ip"), std::string::npos);
    EXPECT_NE(what.find("ssh_user"), std::string::npos);
    EXPECT_NE(what.find("server_wg_pubfile"), std::string::npos);
    EXPECT_EQ(what.find("wg_port"), std::string::npos);
  }
}

TEST(RevtunConfigTest, NumbersMayBeStrings) {
  auto jo = complete_object();
  jo["wg_port"] = "51821";
  jo["ssh_port"] = "2222";
  jo["keepalive_seconds"] = "15";
  auto c = parse(jo);
  EXPECT_EQ(c.wg_port, 51821);
  EXPECT_EQ(c.ssh_port, 2222);
  EXPECT_EQ(c.keepalive_seconds, 15);
}

TEST(RevtunConfigTest, InvalidValuesAreRejected) {
  auto not_a_number = complete_object();
  not_a_number["wg_port"] = "51820a";
  EXPECT_THROW(parse(not_a_number), PreconditionError);

  auto relative_script = complete_object();
  relative_script["remote_script"] = "wg-reverse-tunnel.sh";
  EXPECT_THROW(parse(relative_script), PreconditionError);

  auto injected_service = complete_object();
  injected_service["remote_service"] = "svc; reboot";
  EXPECT_THROW(parse(injected_service), PreconditionError);

  auto zero_interval = complete_object();
  zero_interval["supervision_interval_seconds"] = 0;
  EXPECT_THROW(parse(zero_interval), PreconditionError);

  auto bad_ssh_port = complete_object();
  bad_ssh_port["ssh_port"] = 70000;
  EXPECT_THROW(parse(bad_ssh_port), PreconditionError);
}

TEST(ConfigSourcesTest, LaterFilesWin) {
  testinfra::TempDir base;
  auto first = base.path() / "etc";
  auto second = base.path() / "home";
  fs::create_directories(first);
  fs::create_directories(second);

  write_json(first / "application.json",
             json::object{{"wg_port", 1}, {"ssh_user", "a"}, {"keep", "x"}});
  write_json(first / "application.lab.json", json::object{{"wg_port", 2}});
  write_json(first / "application.override.json",
             json::object{{"ssh_user", "b"}});
  write_json(second / "application.json", json::object{{"wg_port", 3}});

  ConfigSources sources({first, second}, {"lab"});
  auto merged = sources.json_content("application");
  ASSERT_TRUE(merged.has_value());
  EXPECT_EQ(merged->at("wg_port").as_int64(), 3);
  EXPECT_EQ(merged->at("ssh_user").as_string(), "b");
  EXPECT_EQ(merged->at("keep").as_string(), "x");
  EXPECT_EQ(sources.override_file(), second / "application.override.json");

  EXPECT_FALSE(sources.json_content("log_config").has_value());
}

TEST(ConfigSourcesTest, CommandLineOverridesApplyLast) {
  testinfra::TempDir dir;
  write_json(dir.path() / "application.json",
             json::object{{"server_ssh_ip", "203.0.113.5"}});
  ConfigSources sources({dir.path()}, {},
                        {{"server_ssh_ip", "192.0.2.44"}});
  auto merged = sources.json_content("application");
  ASSERT_TRUE(merged.has_value());
  EXPECT_EQ(merged->at("server_ssh_ip").as_string(), "192.0.2.44");
}

TEST(ConfigSourcesTest, MalformedFileIsReported) {
  testinfra::TempDir dir;
  std::ofstream(dir.path() / "application.json") << "{ not json";
  ConfigSources sources({dir.path()}, {});
  EXPECT_THROW(sources.json_content("application"), PreconditionError);
}

TEST(RevtunConfigProviderFileTest, SaveWritesOverrideAndInvalidatesCache) {
  testinfra::TempDir dir;
  write_json(dir.path() / "application.json", complete_object());
  ConfigSources sources({dir.path()}, {});
  testinfra::TestOutput out;
  RevtunConfigProviderFile provider(sources, out);

  EXPECT_EQ(provider.get().wg_port, 51820);
  provider.save(json::object{{"wg_port", 51999}});
  EXPECT_EQ(provider.get().wg_port, 51999);
  EXPECT_EQ(provider.raw().at("wg_port").as_int64(), 51999);

  auto saved = json::parse(
      testinfra::read_text(dir.path() / "application.override.json"));
  EXPECT_EQ(saved.as_object().at("wg_port").as_int64(), 51999);

  // a fresh load sees the persisted value
  RevtunConfigProviderFile reloaded(sources, out);
  EXPECT_EQ(reloaded.get().wg_port, 51999);
}

TEST(RevtunConfigProviderFileTest, IncompleteConfigLoadsButDoesNotValidate) {
  testinfra::TempDir dir;
  write_json(dir.path() / "application.json",
             json::object{{"interface_name", "wg0"}});
  ConfigSources sources({dir.path()}, {});
  testinfra::TestOutput out;
  RevtunConfigProviderFile provider(sources, out);
  EXPECT_EQ(provider.raw().at("interface_name").as_string(), "wg0");
  EXPECT_THROW(provider.get(), PreconditionError);
}

TEST(RevtunConfigProviderFileTest, MissingApplicationJsonIsAnError) {
  testinfra::TempDir dir;
  ConfigSources sources({dir.path()}, {});
  testinfra::TestOutput out;
  EXPECT_THROW({ RevtunConfigProviderFile provider(sources, out); },
               PreconditionError);
}
