#include <gtest/gtest.h>
#include "executors/local_executor.hpp"

#include <stdexcept>
#include <thread>

using namespace orchestrator;

class LocalExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tool.id = "t1";
    tool.server_id = "s1";
    tool.parameters = {{"x", "string", "", true, nullptr}};
  }

  LocalExecutor executor;
  Tool tool;
  Error err;
};

TEST_F(LocalExecutorTest, RunsRegisteredHandler) {
  executor.RegisterHandler("t1", [](const CallContext&, const nlohmann::json& params, Error*) {
    return std::optional<nlohmann::json>(nlohmann::json{{"echo", params["x"]}});
  });
  EXPECT_TRUE(executor.HasHandler("t1"));
  auto r = executor.Execute(CallContext::Background(), tool, {{"x", "hi"}}, &err);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, ToolExecutionStatus::kSuccess);
  EXPECT_EQ(r->result, (nlohmann::json{{"echo", "hi"}}));
  EXPECT_LE(r->start_time, r->end_time);
}

TEST_F(LocalExecutorTest, MissingHandlerIsNotFound) {
  auto r = executor.Execute(CallContext::Background(), tool, {{"x", "hi"}}, &err);
  EXPECT_FALSE(r.has_value());
  EXPECT_EQ(err.code, ErrorCode::kNotFound);
}

TEST_F(LocalExecutorTest, InvalidParametersNeverReachHandler) {
  int calls = 0;
  executor.RegisterHandler("t1", [&calls](const CallContext&, const nlohmann::json&, Error*) {
    ++calls;
    return std::optional<nlohmann::json>(nlohmann::json::object());
  });
  auto r = executor.Execute(CallContext::Background(), tool, nlohmann::json::object(), &err);
  EXPECT_FALSE(r.has_value());
  EXPECT_EQ(err.code, ErrorCode::kValidationFailed);
  EXPECT_EQ(err.message, "parameter validation failed: missing required parameter: x");
  EXPECT_EQ(calls, 0);
}

TEST_F(LocalExecutorTest, HandlerFailureBecomesErrorResult) {
  executor.RegisterHandler("t1", [](const CallContext&, const nlohmann::json&, Error* e) {
    SetError(e, ErrorCode::kExecutionFailure, "disk full");
    return std::optional<nlohmann::json>();
  });
  auto r = executor.Execute(CallContext::Background(), tool, {{"x", "hi"}}, &err);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, ToolExecutionStatus::kError);
  EXPECT_EQ(r->error, "disk full");
}

TEST_F(LocalExecutorTest, HandlerExceptionBecomesErrorResult) {
  executor.RegisterHandler("t1", [](const CallContext&, const nlohmann::json&, Error*) -> std::optional<nlohmann::json> {
    throw std::runtime_error("boom");
  });
  auto r = executor.Execute(CallContext::Background(), tool, {{"x", "hi"}}, &err);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, ToolExecutionStatus::kError);
  EXPECT_EQ(r->error, "boom");
}

TEST_F(LocalExecutorTest, ExpiredDeadlineIsTimeout) {
  executor.RegisterHandler("t1", [](const CallContext& ctx, const nlohmann::json&, Error*) {
    while (!ctx.Done()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return std::optional<nlohmann::json>();
  });
  auto ctx = CallContext::Background().WithTimeout(std::chrono::milliseconds(30));
  auto r = executor.Execute(ctx, tool, {{"x", "hi"}}, &err);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, ToolExecutionStatus::kTimeout);
  EXPECT_EQ(r->error, "execution timed out");
}

TEST_F(LocalExecutorTest, HandlerErrorAfterDeadlineKeepsItsMessage) {
  executor.RegisterHandler("t1", [](const CallContext& ctx, const nlohmann::json&, Error* e) {
    while (!ctx.Done()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    SetError(e, ErrorCode::kExecutionFailure, "disk full");
    return std::optional<nlohmann::json>();
  });
  auto ctx = CallContext::Background().WithTimeout(std::chrono::milliseconds(30));
  auto r = executor.Execute(ctx, tool, {{"x", "hi"}}, &err);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, ToolExecutionStatus::kError);
  EXPECT_EQ(r->error, "disk full");
}

TEST_F(LocalExecutorTest, ReportedTimeoutBeforeDeadline) {
  executor.RegisterHandler("t1", [](const CallContext&, const nlohmann::json&, Error* e) {
    SetError(e, ErrorCode::kTimeout, "upstream slow");
    return std::optional<nlohmann::json>();
  });
  auto r = executor.Execute(CallContext::Background(), tool, {{"x", "hi"}}, &err);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, ToolExecutionStatus::kTimeout);
}
