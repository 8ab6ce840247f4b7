#include "deadsimple/signal-handler.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace deadsimple {

class SignalHandlerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    SignalHandler::Disable();
    SignalHandler::ResetStopRequest();
  }
};

TEST_F(SignalHandlerTest, NoStopRequestedInitially) {
  EXPECT_FALSE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), 0);
}

TEST_F(SignalHandlerTest, SigTermRequestsStop) {
  SignalHandler::Enable();
  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), SIGTERM);
}

TEST_F(SignalHandlerTest, SigIntRequestsStop) {
  SignalHandler::Enable();
  ASSERT_EQ(std::raise(SIGINT), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::ReceivedSignal(), SIGINT);
}

}  // namespace deadsimple
