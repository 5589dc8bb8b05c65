#include <gtest/gtest.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <thread>

#include "supervise/supervision_loop.hpp"
#include "revtun_test_support.hpp"

using namespace revtun;
using State = supervise::SupervisionLoop::State;

namespace {

render::RenderedConfig local_config() {
  return render::RenderedConfig{render::Role::Local, "[Interface]\n"};
}

std::shared_ptr<supervise::SupervisionLoop>
make_loop(boost::asio::io_context &ioc,
          testinfra::FakeLocalTunnelController &controller,
          testinfra::TestOutput &out,
          std::chrono::milliseconds interval = std::chrono::milliseconds(10)) {
  return std::make_shared<supervise::SupervisionLoop>(
      ioc, controller, out, local_config(), interval);
}

} // namespace

TEST(SupervisionLoopTest, HealthyInterfaceIsLeftAlone) {
  boost::asio::io_context ioc;
  testinfra::FakeLocalTunnelController controller;
  testinfra::TestOutput out;
  controller.interface_up = true;

  auto loop = make_loop(ioc, controller, out);
  loop->tick_once();
  EXPECT_EQ(loop->ticks(), 1u);
  EXPECT_EQ(loop->state(), State::Up);
  EXPECT_EQ(controller.up_calls, 0);
}

TEST(SupervisionLoopTest, MissingInterfaceIsReapplied) {
  boost::asio::io_context ioc;
  testinfra::FakeLocalTunnelController controller;
  testinfra::TestOutput out;

  auto loop = make_loop(ioc, controller, out);
  loop->tick_once();
  EXPECT_EQ(loop->state(), State::Down);
  EXPECT_EQ(controller.up_calls, 1);
  ASSERT_TRUE(controller.last_config.has_value());
  EXPECT_EQ(controller.last_config->text, "[Interface]\n");
  EXPECT_TRUE(out.contains("[warning] WireGuard interface went down!"));
  EXPECT_TRUE(out.contains("[info] WireGuard interface restored"));

  // restored, so the next check starts from Up again
  loop->tick_once();
  EXPECT_EQ(loop->state(), State::Up);
  EXPECT_EQ(controller.up_calls, 1);
}

TEST(SupervisionLoopTest, FailedRestoreIsLoggedAndRetried) {
  boost::asio::io_context ioc;
  testinfra::FakeLocalTunnelController controller;
  testinfra::TestOutput out;
  controller.fail_up = true;

  auto loop = make_loop(ioc, controller, out);
  EXPECT_NO_THROW(loop->tick_once());
  EXPECT_NO_THROW(loop->tick_once());
  EXPECT_EQ(controller.up_calls, 2);
  EXPECT_EQ(loop->ticks(), 2u);
  EXPECT_TRUE(out.contains("[warning] Supervision check failed"));
}

TEST(SupervisionLoopTest, TicksOnTheIoContextUntilStopped) {
  boost::asio::io_context ioc;
  auto guard = boost::asio::make_work_guard(ioc);
  testinfra::FakeLocalTunnelController controller;
  testinfra::TestOutput out;
  controller.interface_up = true;

  auto loop = make_loop(ioc, controller, out);
  std::thread io_thread([&ioc] { ioc.run(); });
  loop->start();

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (loop->ticks() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_GE(loop->ticks(), 3u);

  loop->stop();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  const auto after_stop = loop->ticks();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(loop->ticks(), after_stop);

  guard.reset();
  io_thread.join();
  EXPECT_EQ(controller.up_calls, 0);
}
