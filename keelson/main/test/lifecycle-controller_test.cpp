#include "keelson/lifecycle-controller.hpp"

#include <gtest/gtest.h>
#include <poll.h>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace keelson {

namespace {

using namespace std::chrono_literals;

bool IsReadable(int fd) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}

}  // namespace

TEST(LifecycleControllerTest, StartupEntersServing) {
  LifecycleController lifecycle;
  int nbCalls = 0;
  lifecycle.setStartupHook([&nbCalls] { ++nbCalls; });
  EXPECT_EQ(lifecycle.state(), LifecycleController::State::NotStarted);
  lifecycle.startup();
  EXPECT_EQ(lifecycle.state(), LifecycleController::State::Serving);
  EXPECT_EQ(nbCalls, 1);
  EXPECT_THROW(lifecycle.startup(), std::logic_error);
}

TEST(LifecycleControllerTest, FailingStartupHookAbortsStartup) {
  LifecycleController lifecycle;
  lifecycle.setStartupHook([] { throw std::runtime_error("database unreachable"); });
  try {
    lifecycle.startup();
    FAIL() << "startup() should have thrown";
  } catch (const std::runtime_error& ex) {
    EXPECT_STREQ(ex.what(), "Application startup failed: database unreachable");
  }
  EXPECT_EQ(lifecycle.state(), LifecycleController::State::Stopped);
}

TEST(LifecycleControllerTest, ShutdownRequestWakesLoop) {
  LifecycleController lifecycle;
  lifecycle.startup();
  EXPECT_FALSE(IsReadable(lifecycle.wakeupFd()));
  EXPECT_TRUE(lifecycle.requestShutdown(250ms));
  EXPECT_EQ(lifecycle.state(), LifecycleController::State::Stopping);
  EXPECT_EQ(lifecycle.gracePeriod(), 250ms);
  EXPECT_TRUE(IsReadable(lifecycle.wakeupFd()));
  lifecycle.consumeWakeup();
  EXPECT_FALSE(IsReadable(lifecycle.wakeupFd()));

  // Second request only updates the parameters.
  EXPECT_FALSE(lifecycle.requestShutdown(100ms, true));
  EXPECT_TRUE(lifecycle.isForceRequested());
  EXPECT_TRUE(IsReadable(lifecycle.wakeupFd()));
}

TEST(LifecycleControllerTest, CompletionSignalledWhenLastConnectionCloses) {
  LifecycleController lifecycle;
  lifecycle.startup();
  lifecycle.onConnectionClosed(0);
  EXPECT_FALSE(IsReadable(lifecycle.completionFd()));  // not stopping yet

  lifecycle.requestShutdown();
  lifecycle.onConnectionClosed(2);
  EXPECT_FALSE(IsReadable(lifecycle.completionFd()));
  lifecycle.onConnectionClosed(1);
  EXPECT_FALSE(IsReadable(lifecycle.completionFd()));
  lifecycle.onConnectionClosed(0);
  EXPECT_TRUE(IsReadable(lifecycle.completionFd()));
}

TEST(LifecycleControllerTest, FinishRunsShutdownHookOnce) {
  LifecycleController lifecycle;
  int nbCalls = 0;
  lifecycle.setShutdownHook([&nbCalls] { ++nbCalls; });
  lifecycle.startup();
  lifecycle.requestShutdown();
  lifecycle.finish(false);
  lifecycle.finish(false);
  EXPECT_EQ(nbCalls, 1);
  EXPECT_EQ(lifecycle.state(), LifecycleController::State::Stopped);
  EXPECT_TRUE(lifecycle.waitUntilStopped(0ms));
}

TEST(LifecycleControllerTest, ForcedFinishSkipsShutdownHook) {
  LifecycleController lifecycle;
  bool called = false;
  lifecycle.setShutdownHook([&called] { called = true; });
  lifecycle.startup();
  lifecycle.requestShutdown(0ms, true);
  lifecycle.finish(true);
  EXPECT_FALSE(called);
  EXPECT_EQ(lifecycle.state(), LifecycleController::State::Stopped);
}

TEST(LifecycleControllerTest, FailingShutdownHookStillStops) {
  LifecycleController lifecycle;
  lifecycle.setShutdownHook([] { throw std::runtime_error("flush failed"); });
  lifecycle.startup();
  lifecycle.requestShutdown();
  EXPECT_NO_THROW(lifecycle.finish(false));
  EXPECT_EQ(lifecycle.state(), LifecycleController::State::Stopped);
}

TEST(LifecycleControllerTest, ShutdownRequestedDuringStartup) {
  LifecycleController lifecycle;
  lifecycle.setStartupHook([&lifecycle] { EXPECT_TRUE(lifecycle.requestShutdown()); });
  lifecycle.startup();
  EXPECT_EQ(lifecycle.state(), LifecycleController::State::Stopping);
  EXPECT_TRUE(IsReadable(lifecycle.wakeupFd()));
}

TEST(LifecycleControllerTest, WaitUntilStoppedFromAnotherThread) {
  LifecycleController lifecycle;
  lifecycle.startup();
  EXPECT_FALSE(lifecycle.waitUntilStopped(10ms));
  std::jthread stopper([&lifecycle] {
    std::this_thread::sleep_for(20ms);
    lifecycle.requestShutdown();
    lifecycle.finish(false);
  });
  EXPECT_TRUE(lifecycle.waitUntilStopped(5s));
}

TEST(LifecycleControllerTest, StateNames) {
  EXPECT_EQ(LifecycleStateName(LifecycleController::State::Serving), "Serving");
  EXPECT_EQ(LifecycleStateName(LifecycleController::State::Stopped), "Stopped");
}

}  // namespace keelson
