#pragma once

#include "executor.hpp"

#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace orchestrator {

// In-process tool implementation. Returning nullopt means the call failed; *err says why.
// An err->code of kTimeout (or an expired ctx) classifies the outcome as a timeout.
using ToolHandler =
    std::function<std::optional<nlohmann::json>(const CallContext& ctx, const nlohmann::json& params, Error* err)>;

class LocalExecutor : public IExecutor {
 public:
  LocalExecutor() = default;

  ServerType Type() const override { return ServerType::kLocal; }

  void RegisterHandler(const std::string& tool_id, ToolHandler handler);
  bool HasHandler(const std::string& tool_id) const;

  std::optional<ToolExecutionResult> Execute(const CallContext& ctx,
                                             const Tool& tool,
                                             const nlohmann::json& params,
                                             Error* err) override;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

}  // namespace orchestrator
