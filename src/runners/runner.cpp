#include "runner.hpp"

#include "../config.hpp"

#include <httplib.h>

#include <algorithm>

namespace orchestrator {

bool ProbeHealth(const CallContext& ctx, const std::string& url, std::chrono::milliseconds timeout, Error* err) {
  if (auto left = ctx.Remaining()) timeout = std::min(timeout, *left);
  if (ctx.Done() || timeout.count() <= 0) {
    return SetError(err, ErrorCode::kTimeout, "health check failed: context done");
  }

  const auto ep = ParseHttpEndpoint(url, 80);
  httplib::Client cli(SchemeHostPort(ep));
  if (!cli.is_valid()) {
    return SetError(err, ErrorCode::kInvalidArgument, "health check failed: unsupported url " + url);
  }
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);

  auto res = cli.Get(ep.base_path.empty() ? std::string("/") : ep.base_path);
  if (!res) {
    return SetError(err, ErrorCode::kExecutionFailure, "health check failed: " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    return SetError(err, ErrorCode::kExecutionFailure,
                    "health check failed with status: " + std::to_string(res->status));
  }
  return true;
}

}  // namespace orchestrator
