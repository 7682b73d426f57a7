#include "local_executor.hpp"

#include <chrono>
#include <exception>
#include <mutex>
#include <utility>

namespace orchestrator {

void LocalExecutor::RegisterHandler(const std::string& tool_id, ToolHandler handler) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  handlers_[tool_id] = std::move(handler);
}

bool LocalExecutor::HasHandler(const std::string& tool_id) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return handlers_.find(tool_id) != handlers_.end();
}

std::optional<ToolExecutionResult> LocalExecutor::Execute(const CallContext& ctx,
                                                          const Tool& tool,
                                                          const nlohmann::json& params,
                                                          Error* err) {
  if (!ValidateParameters(tool, params, err)) {
    WrapError(err, "parameter validation failed");
    return std::nullopt;
  }

  ToolHandler handler;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = handlers_.find(tool.id);
    if (it == handlers_.end()) {
      SetError(err, ErrorCode::kNotFound, "no handler registered for tool " + tool.id);
      return std::nullopt;
    }
    handler = it->second;
  }

  ToolExecutionResult out;
  Error call_err;
  std::optional<nlohmann::json> value;
  out.start_time = std::chrono::system_clock::now();
  try {
    value = handler(ctx, params.is_null() ? nlohmann::json::object() : params, &call_err);
  } catch (const std::exception& e) {
    call_err = {ErrorCode::kExecutionFailure, e.what()};
  }
  out.end_time = std::chrono::system_clock::now();

  if (value) {
    out.status = ToolExecutionStatus::kSuccess;
    out.result = std::move(*value);
    return out;
  }

  // A handler that reports its own failure keeps it even when the deadline has also passed.
  const bool gave_up = call_err.code == ErrorCode::kOk && ctx.Err() == ContextErr::kDeadlineExceeded;
  if (call_err.code == ErrorCode::kTimeout || gave_up) {
    out.status = ToolExecutionStatus::kTimeout;
    out.error = "execution timed out";
  } else {
    out.status = ToolExecutionStatus::kError;
    out.error = call_err.message.empty() ? "handler failed" : call_err.message;
  }
  return out;
}

}  // namespace orchestrator
