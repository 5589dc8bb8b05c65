#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "exec/process_runner.hpp"
#include "util/cancellation.hpp"

using namespace revtun;
using namespace std::chrono_literals;

TEST(PosixProcessRunnerTest, CapturesStdout) {
  exec::PosixProcessRunner runner;
  auto r = runner.run({"echo", "hello"}, std::nullopt, 5s);
  EXPECT_TRUE(r.success());
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.stdout_data, "hello\n");
}

TEST(PosixProcessRunnerTest, FeedsStdin) {
  exec::PosixProcessRunner runner;
  auto r = runner.run({"cat"}, std::string("line one\nline two\n"), 5s);
  EXPECT_TRUE(r.success());
  EXPECT_EQ(r.stdout_data, "line one\nline two\n");
}

TEST(PosixProcessRunnerTest, ReportsExitCodeAndStderr) {
  exec::PosixProcessRunner runner;
  auto r = runner.run({"sh", "-c", "echo oops >&2; exit 3"}, std::nullopt, 5s);
  EXPECT_FALSE(r.success());
  EXPECT_EQ(r.exit_code, 3);
  EXPECT_EQ(r.stderr_data, "oops\n");
  EXPECT_EQ(r.describe(), "command exited with code 3: oops");
}

TEST(PosixProcessRunnerTest, KillsOnTimeout) {
  exec::PosixProcessRunner runner;
  const auto started = std::chrono::steady_clock::now();
  auto r = runner.run({"sleep", "10"}, std::nullopt, 200ms);
  EXPECT_TRUE(r.timed_out);
  EXPECT_FALSE(r.cancelled);
  EXPECT_FALSE(r.success());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(PosixProcessRunnerTest, KillsOnCancellation) {
  exec::PosixProcessRunner runner;
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(100ms);
    token.cancel();
  });
  auto r = runner.run({"sleep", "10"}, std::nullopt, 30s, &token);
  canceller.join();
  EXPECT_TRUE(r.cancelled);
  EXPECT_FALSE(r.timed_out);
  EXPECT_EQ(r.describe(), "command cancelled");
}

TEST(PosixProcessRunnerTest, ChildLeadsItsOwnProcessGroup) {
  exec::PosixProcessRunner runner;
  auto r = runner.run(
      {"sh", "-c", "read _ _ _ _ pgrp _ < /proc/$$/stat; [ \"$pgrp\" = \"$$\" ]"},
      std::nullopt, 5s);
  EXPECT_TRUE(r.success()) << r.describe();
}

TEST(PosixProcessRunnerTest, ChildInterruptedWithTokenIsCancelled) {
  namespace fs = std::filesystem;
  const fs::path pid_file =
      fs::temp_directory_path() /
      ("revtun-interrupted-" + std::to_string(::getpid()) + ".pid");
  fs::remove(pid_file);

  exec::PosixProcessRunner runner;
  CancellationToken token;
  std::thread interrupter([&token, &pid_file] {
    pid_t child = 0;
    for (int i = 0; i < 300 && child <= 0; ++i) {
      std::this_thread::sleep_for(10ms);
      std::ifstream in(pid_file);
      in >> child;
    }
    // what a terminal Ctrl+C does: the signal handler cancels while the
    // child sees SIGINT
    token.cancel();
    if (child > 0) {
      ::kill(child, SIGINT);
    }
  });
  auto r = runner.run({"sh", "-c",
                       "echo $$ > " + pid_file.string() +
                           "; trap 'exit 255' INT; sleep 10 & wait"},
                      std::nullopt, 30s, &token);
  interrupter.join();
  fs::remove(pid_file);

  EXPECT_TRUE(r.cancelled);
  EXPECT_FALSE(r.timed_out);
  EXPECT_EQ(r.describe(), "command cancelled");
}

TEST(PosixProcessRunnerTest, FailureWithoutCancellationStaysFailure) {
  exec::PosixProcessRunner runner;
  CancellationToken token;
  auto r = runner.run({"sh", "-c", "exit 255"}, std::nullopt, 5s, &token);
  EXPECT_FALSE(r.cancelled);
  EXPECT_EQ(r.exit_code, 255);
}

TEST(PosixProcessRunnerTest, AlreadyCancelledNeverSpawns) {
  exec::PosixProcessRunner runner;
  CancellationToken token;
  token.cancel();
  auto r = runner.run({"echo", "hi"}, std::nullopt, 5s, &token);
  EXPECT_TRUE(r.cancelled);
  EXPECT_TRUE(r.stdout_data.empty());
}

TEST(PosixProcessRunnerTest, MissingExecutable) {
  exec::PosixProcessRunner runner;
  auto r = runner.run({"revtun-no-such-binary"}, std::nullopt, 5s);
  EXPECT_FALSE(r.success());
  EXPECT_EQ(r.exit_code, 127);

  auto empty = runner.run({}, std::nullopt, 5s);
  ASSERT_TRUE(empty.spawn_error.has_value());
}

TEST(CommandExistsTest, LooksUpPath) {
  EXPECT_TRUE(exec::command_exists("sh"));
  EXPECT_TRUE(exec::command_exists("/bin/sh"));
  EXPECT_FALSE(exec::command_exists("revtun-no-such-binary"));
}

TEST(CancellationTokenTest, SleepWakesOnCancel) {
  CancellationToken token;
  int callbacks = 0;
  token.on_cancel([&callbacks] { ++callbacks; });
  std::thread canceller([&token] {
    std::this_thread::sleep_for(50ms);
    token.cancel();
  });
  EXPECT_FALSE(token.sleep_for(10s));
  canceller.join();
  token.cancel();
  EXPECT_EQ(callbacks, 1);
  EXPECT_THROW(token.throw_if_cancelled("x"), OperationCancelled);

  // registered late, runs at once
  token.on_cancel([&callbacks] { ++callbacks; });
  EXPECT_EQ(callbacks, 2);
}

TEST(CancellationTokenTest, SleepCompletesWhenNotCancelled) {
  CancellationToken token;
  EXPECT_TRUE(token.sleep_for(10ms));
  EXPECT_NO_THROW(token.throw_if_cancelled("x"));
}
