#pragma once

#include "errors.hpp"
#include "manager.hpp"

#include <httplib.h>

namespace orchestrator {

// HTTP status for an error code reported by the manager.
int HttpStatusFor(ErrorCode code);

// Mounts the /api/mcp endpoints, /health and the JSON error/exception handlers.
class McpRouter {
 public:
  explicit McpRouter(Manager* manager);
  void Register(httplib::Server* server);

 private:
  Manager* manager_;
};

}  // namespace orchestrator
