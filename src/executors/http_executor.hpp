#pragma once

#include "executor.hpp"

#include <chrono>

namespace orchestrator {

// POSTs the parameters as JSON to the tool's "endpoint" metadata URL.
class HttpExecutor : public IExecutor {
 public:
  explicit HttpExecutor(std::chrono::milliseconds timeout);

  ServerType Type() const override { return ServerType::kRemote; }

  std::optional<ToolExecutionResult> Execute(const CallContext& ctx,
                                             const Tool& tool,
                                             const nlohmann::json& params,
                                             Error* err) override;

 private:
  std::chrono::milliseconds timeout_;
  int connect_timeout_seconds_ = 5;
};

}  // namespace orchestrator
