#pragma once

#include "../call_context.hpp"
#include "../errors.hpp"
#include "../mcp_types.hpp"

#include <chrono>
#include <string>

namespace orchestrator {

struct RunnerOptions {
  std::chrono::milliseconds health_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds probe_timeout{std::chrono::seconds(5)};
};

// Lifecycle of one server: Stopped -> Running -> {Stopped, Error}. Leaving Error takes a fresh Start.
class IServerRunner {
 public:
  virtual ~IServerRunner() = default;

  virtual bool Start(const CallContext& ctx, Error* err) = 0;
  virtual bool Stop(const CallContext& ctx, Error* err) = 0;
  virtual ServerStatus Status() const = 0;
  virtual bool HealthCheck(const CallContext& ctx, Error* err) = 0;
};

// GET url and require a 200. The timeout is further bounded by the context's deadline.
bool ProbeHealth(const CallContext& ctx, const std::string& url, std::chrono::milliseconds timeout, Error* err);

}  // namespace orchestrator
