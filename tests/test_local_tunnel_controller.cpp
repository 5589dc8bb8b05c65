#include <gtest/gtest.h>

#include <chrono>

#include "tunnel/local_tunnel_controller.hpp"
#include "tunnel/tunnel_cli.hpp"
#include "revtun_errors.hpp"
#include "revtun_test_support.hpp"

using namespace revtun;

namespace {

class LocalTunnelControllerTest : public ::testing::Test {
protected:
  testinfra::TempDir dir;
  testinfra::StaticConfigProvider provider{testinfra::make_config(dir.path())};
  testinfra::FakeTunnelCli cli;
  testinfra::TestOutput out;
  tunnel::LocalTunnelController controller{cli, provider, out};

  render::RenderedConfig local(const std::string &text) {
    return render::RenderedConfig{render::Role::Local, text};
  }
};

} // namespace

TEST_F(LocalTunnelControllerTest, UpWritesPrivateConfigAndApplies) {
  controller.up(local("[Interface]\nAddress = 10.10.10.2/24\n"));

  const auto path = dir.path() / "wg0.conf";
  EXPECT_EQ(controller.config_path(), path);
  ASSERT_EQ(cli.applied.size(), 1u);
  EXPECT_EQ(cli.applied[0], path);
  EXPECT_EQ(cli.applied_text[0], "[Interface]\nAddress = 10.10.10.2/24\n");
  EXPECT_EQ(fs::status(path).permissions() & fs::perms::all,
            fs::perms::owner_read | fs::perms::owner_write);
  EXPECT_TRUE(controller.is_up());
}

TEST_F(LocalTunnelControllerTest, UpIsIdempotent) {
  controller.up(local("a\n"));
  controller.up(local("b\n"));
  EXPECT_EQ(cli.applied.size(), 2u);
  // the second bring-up first removed the running interface
  ASSERT_EQ(cli.teardowns.size(), 2u);
  EXPECT_EQ(testinfra::read_text(controller.config_path()), "b\n");
}

TEST_F(LocalTunnelControllerTest, RemoteConfigIsRefused) {
  EXPECT_THROW(controller.up(render::RenderedConfig{render::Role::Remote, "x"}),
               RenderError);
  EXPECT_TRUE(cli.applied.empty());
}

TEST_F(LocalTunnelControllerTest, ApplyFailurePropagates) {
  cli.fail_apply = true;
  try {
    controller.up(local("x\n"));
    FAIL() << "expected RevtunError";
  } catch (const RevtunError &e) {
    EXPECT_EQ(e.code(), my_errors::TUNNEL::APPLY_FAILED);
  }
}

TEST_F(LocalTunnelControllerTest, DownUsesConfigPathOnceWritten) {
  controller.down();
  ASSERT_EQ(cli.teardowns.size(), 1u);
  EXPECT_EQ(cli.teardowns[0], "wg0");

  controller.up(local("x\n"));
  controller.down();
  EXPECT_EQ(cli.teardowns.back(), (dir.path() / "wg0.conf").string());
  EXPECT_FALSE(controller.is_up());
}

TEST_F(LocalTunnelControllerTest, StatusAndHandshakeAge) {
  EXPECT_EQ(controller.status_text(), "interface wg0 is not up");
  EXPECT_FALSE(controller.last_handshake_age().has_value());

  controller.up(local("x\n"));
  EXPECT_NE(controller.status_text().find("interface: wg0"), std::string::npos);
  EXPECT_FALSE(controller.last_handshake_age().has_value());

  cli.handshake = std::chrono::system_clock::now() - std::chrono::seconds(42);
  auto age = controller.last_handshake_age();
  ASSERT_TRUE(age.has_value());
  EXPECT_GE(age->count(), 41);
  EXPECT_LE(age->count(), 60);

  auto state = controller.state();
  EXPECT_TRUE(state.interface_up);
  EXPECT_TRUE(state.last_handshake_age.has_value());
}

TEST(TunnelLeaseTest, ReleasesExactlyOnce) {
  testinfra::FakeLocalTunnelController controller;
  {
    tunnel::TunnelLease lease(controller);
    tunnel::TunnelLease moved(std::move(lease));
    EXPECT_FALSE(lease.held());
    EXPECT_TRUE(moved.held());
  }
  EXPECT_EQ(controller.down_calls, 1);

  tunnel::TunnelLease explicit_release(controller);
  explicit_release.release();
  explicit_release.release();
  EXPECT_EQ(controller.down_calls, 2);
}

TEST(WgQuickCliTest, DrivesWgQuick) {
  testinfra::FakeProcessRunner runner;
  CancellationToken token;
  tunnel::WgQuickCli cli(runner, token);

  cli.apply_interface("/etc/wireguard/wg0.conf");
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].argv,
            (std::vector<std::string>{"wg-quick", "up",
                                      "/etc/wireguard/wg0.conf"}));
  EXPECT_TRUE(runner.calls[0].with_token);

  EXPECT_TRUE(cli.teardown_interface("wg0"));
  EXPECT_EQ(runner.calls[1].argv,
            (std::vector<std::string>{"wg-quick", "down", "wg0"}));
  EXPECT_FALSE(runner.calls[1].with_token);
}

TEST(WgQuickCliTest, FailuresMapToErrors) {
  testinfra::FakeProcessRunner runner;
  CancellationToken token;
  tunnel::WgQuickCli cli(runner, token);
  runner.handler = [](const std::vector<std::string> &,
                      const std::optional<std::string> &) {
    exec::ExecResult r;
    r.exit_code = 1;
    r.stderr_data = "wg0 does not exist";
    return r;
  };
  EXPECT_THROW(cli.apply_interface("/x/wg0.conf"), RevtunError);
  EXPECT_FALSE(cli.teardown_interface("wg0"));
  EXPECT_FALSE(cli.show_status("wg0").has_value());
  EXPECT_FALSE(cli.latest_handshake("wg0").has_value());

  runner.handler = [](const std::vector<std::string> &,
                      const std::optional<std::string> &) {
    exec::ExecResult r;
    r.cancelled = true;
    return r;
  };
  EXPECT_THROW(cli.apply_interface("/x/wg0.conf"), OperationCancelled);
}

TEST(WgQuickCliTest, ParsesLatestHandshakes) {
  using tunnel::WgQuickCli;
  EXPECT_FALSE(WgQuickCli::parse_latest_handshakes("").has_value());
  EXPECT_FALSE(
      WgQuickCli::parse_latest_handshakes("peerA=\t0\n").has_value());

  auto newest = WgQuickCli::parse_latest_handshakes(
      "peerA=\t1700000000\npeerB=\t1700000100\ngarbage\n");
  ASSERT_TRUE(newest.has_value());
  EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(
                newest->time_since_epoch())
                .count(),
            1700000100);
}
