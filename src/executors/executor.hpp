#pragma once

#include "../call_context.hpp"
#include "../errors.hpp"
#include "../mcp_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace orchestrator {

class IExecutor {
 public:
  virtual ~IExecutor() = default;

  virtual ServerType Type() const = 0;

  // Returns nullopt only when no invocation was attempted (invalid parameters, no handler).
  // Failures of an attempted invocation come back inside the result with status error or timeout.
  virtual std::optional<ToolExecutionResult> Execute(const CallContext& ctx,
                                                     const Tool& tool,
                                                     const nlohmann::json& params,
                                                     Error* err) = 0;
};

}  // namespace orchestrator
