#include "keelson/signal-handler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>

namespace keelson {

class SignalHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override { SignalHandler::Enable(std::chrono::milliseconds{250}); }

  void TearDown() override {
    SignalHandler::Disable();
    SignalHandler::ResetStopRequest();
  }
};

TEST_F(SignalHandlerTest, FirstSignalRequestsGracefulStop) {
  EXPECT_FALSE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::GetGracePeriod(), std::chrono::milliseconds{250});
  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_FALSE(SignalHandler::IsForceExitRequested());
}

TEST_F(SignalHandlerTest, SecondInterruptRequestsForceExit) {
  ASSERT_EQ(std::raise(SIGINT), 0);
  EXPECT_FALSE(SignalHandler::IsForceExitRequested());
  ASSERT_EQ(std::raise(SIGINT), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_TRUE(SignalHandler::IsForceExitRequested());
}

TEST_F(SignalHandlerTest, SecondTermDoesNotForce) {
  ASSERT_EQ(std::raise(SIGTERM), 0);
  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_FALSE(SignalHandler::IsForceExitRequested());
}

}  // namespace keelson
