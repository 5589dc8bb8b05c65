#include <gtest/gtest.h>

#include "remote/remote_channel.hpp"
#include "revtun_errors.hpp"
#include "revtun_test_support.hpp"

using namespace revtun;

namespace {

class SshRemoteChannelTest : public ::testing::Test {
protected:
  testinfra::TempDir dir;
  testinfra::StaticConfigProvider provider{testinfra::make_config(dir.path())};
  testinfra::FakeProcessRunner runner;
  testinfra::TestOutput out;
  CancellationToken token;
  remote::SshRemoteChannel channel{provider, runner, token, out};

  void respond(int exit_code, std::string stdout_data = {},
               std::string stderr_data = {}) {
    runner.handler = [=](const std::vector<std::string> &,
                         const std::optional<std::string> &) {
      exec::ExecResult r;
      r.exit_code = exit_code;
      r.stdout_data = stdout_data;
      r.stderr_data = stderr_data;
      return r;
    };
  }
};

} // namespace

TEST(RemoteArgvTest, SshAndScp) {
  remote::RemoteEndpoint endpoint;
  endpoint.host = "203.0.113.5";
  endpoint.port = 2222;
  endpoint.user = "admin";
  endpoint.connect_timeout = std::chrono::seconds(7);

  EXPECT_EQ(remote::ssh_argv(endpoint),
            (std::vector<std::string>{"ssh", "-p", "2222", "-o",
                                      "ConnectTimeout=7", "-o",
                                      "BatchMode=yes", "admin@203.0.113.5",
                                      "bash", "-s"}));
  EXPECT_EQ(remote::scp_argv(endpoint, "/tmp/x.sh", "/tmp/x.sh.42"),
            (std::vector<std::string>{"scp", "-q", "-P", "2222", "-o",
                                      "ConnectTimeout=7", "-o",
                                      "BatchMode=yes", "/tmp/x.sh",
                                      "admin@203.0.113.5:/tmp/x.sh.42"}));
}

TEST_F(SshRemoteChannelTest, CommandGoesThroughStdin) {
  respond(0, "key\n");
  auto r = channel.execute("echo hi\necho there\n");
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.stdout_data, "key\n");
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].argv.front(), "ssh");
  EXPECT_EQ(runner.calls[0].argv.back(), "-s");
  ASSERT_TRUE(runner.calls[0].stdin_data.has_value());
  EXPECT_EQ(*runner.calls[0].stdin_data, "echo hi\necho there\n");
  EXPECT_EQ(runner.calls[0].timeout, std::chrono::seconds(120));
  EXPECT_TRUE(runner.calls[0].with_token);
  EXPECT_EQ(channel.describe(), "root@203.0.113.5:22");
}

TEST_F(SshRemoteChannelTest, RemoteFailureIsReturned) {
  respond(3, "", "no such file");
  auto r = channel.execute("false");
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.exit_code, 3);
  EXPECT_EQ(r.stderr_data, "no such file");
}

TEST_F(SshRemoteChannelTest, SshFailureIsUnreachable) {
  respond(255, "", "ssh: connect to host 203.0.113.5 port 22: Connection "
                   "refused");
  try {
    channel.execute("true");
    FAIL() << "expected RemoteExecError";
  } catch (const RemoteExecError &e) {
    EXPECT_EQ(e.code(), my_errors::REMOTE::CHANNEL_UNREACHABLE);
    EXPECT_NE(std::string(e.what()).find("Connection refused"),
              std::string::npos);
  }

  runner.handler = [](const std::vector<std::string> &,
                      const std::optional<std::string> &) {
    exec::ExecResult r;
    r.timed_out = true;
    return r;
  };
  EXPECT_THROW(channel.execute("true"), RemoteExecError);
}

TEST_F(SshRemoteChannelTest, CancelledCommandRaises) {
  runner.handler = [](const std::vector<std::string> &,
                      const std::optional<std::string> &) {
    exec::ExecResult r;
    r.cancelled = true;
    return r;
  };
  EXPECT_THROW(channel.execute("true"), OperationCancelled);
  EXPECT_THROW(channel.copy(dir.path() / "f", "/tmp/f"), OperationCancelled);
}

TEST_F(SshRemoteChannelTest, CopyFailureIsTransferError) {
  respond(1, "", "scp: /tmp: Permission denied");
  try {
    channel.copy(dir.path() / "f", "/tmp/f");
    FAIL() << "expected TransferError";
  } catch (const TransferError &e) {
    EXPECT_EQ(e.code(), my_errors::REMOTE::TRANSFER_FAILED);
    EXPECT_EQ(e.step(), "transfer");
  }

  respond(0);
  EXPECT_NO_THROW(channel.copy(dir.path() / "f", "/tmp/f"));
  EXPECT_EQ(runner.calls.back().argv.back(), "root@203.0.113.5:/tmp/f");
}
