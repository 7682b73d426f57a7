#include <gtest/gtest.h>
#include "call_context.hpp"

#include <thread>

using namespace orchestrator;

TEST(CallContextTest, BackgroundNeverExpires) {
  auto ctx = CallContext::Background();
  EXPECT_FALSE(ctx.Done());
  EXPECT_EQ(ctx.Err(), ContextErr::kNone);
  EXPECT_FALSE(ctx.HasDeadline());
  EXPECT_FALSE(ctx.Remaining().has_value());
}

TEST(CallContextTest, TimeoutExpires) {
  auto ctx = CallContext::Background().WithTimeout(std::chrono::milliseconds(20));
  EXPECT_TRUE(ctx.HasDeadline());
  EXPECT_FALSE(ctx.Done());
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  EXPECT_TRUE(ctx.Done());
  EXPECT_EQ(ctx.Err(), ContextErr::kDeadlineExceeded);
  EXPECT_EQ(ctx.Remaining()->count(), 0);
}

TEST(CallContextTest, CancelPropagatesToChildren) {
  auto parent = CallContext::Background();
  auto child = parent.WithTimeout(std::chrono::seconds(10));
  auto copy = parent;
  copy.Cancel();
  EXPECT_EQ(parent.Err(), ContextErr::kCanceled);
  EXPECT_EQ(child.Err(), ContextErr::kCanceled);
}

TEST(CallContextTest, ChildCancelDoesNotAffectParent) {
  auto parent = CallContext::Background();
  auto child = parent.WithTimeout(std::chrono::seconds(10));
  child.Cancel();
  EXPECT_TRUE(child.Done());
  EXPECT_FALSE(parent.Done());
}

TEST(CallContextTest, DeadlineIsEarliestInChain) {
  auto parent = CallContext::Background().WithTimeout(std::chrono::milliseconds(100));
  auto child = parent.WithTimeout(std::chrono::seconds(10));
  EXPECT_EQ(child.Deadline(), parent.Deadline());
  EXPECT_LE(child.Remaining()->count(), 100);
}
