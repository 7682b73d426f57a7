#include "http_executor.hpp"

#include "../config.hpp"

#include <httplib.h>

#include <algorithm>
#include <string>
#include <utility>

namespace orchestrator {
namespace {

static std::string ExtractErrorField(const nlohmann::json& body) {
  if (!body.is_object() || !body.contains("error")) return {};
  const auto& e = body["error"];
  if (e.is_string()) return e.get<std::string>();
  if (e.is_object() && e.contains("message") && e["message"].is_string()) return e["message"].get<std::string>();
  if (e.is_null()) return {};
  return e.dump();
}

static ToolExecutionResult Failed(ToolExecutionResult out, ToolExecutionStatus status, std::string message) {
  out.status = status;
  out.error = std::move(message);
  return out;
}

}  // namespace

HttpExecutor::HttpExecutor(std::chrono::milliseconds timeout) : timeout_(timeout) {}

std::optional<ToolExecutionResult> HttpExecutor::Execute(const CallContext& ctx,
                                                         const Tool& tool,
                                                         const nlohmann::json& params,
                                                         Error* err) {
  if (!ValidateParameters(tool, params, err)) {
    WrapError(err, "parameter validation failed");
    return std::nullopt;
  }

  ToolExecutionResult out;
  out.start_time = std::chrono::system_clock::now();
  out.end_time = out.start_time;

  auto endpoint_it = tool.metadata.find("endpoint");
  if (endpoint_it == tool.metadata.end() || endpoint_it->second.empty()) {
    return Failed(std::move(out), ToolExecutionStatus::kError, "request failed: tool has no endpoint");
  }
  const auto ep = ParseHttpEndpoint(endpoint_it->second, 80);

  auto effective = timeout_;
  if (auto left = ctx.Remaining()) effective = std::min(effective, *left);
  if (ctx.Done() || effective.count() <= 0) {
    out.end_time = std::chrono::system_clock::now();
    if (ctx.Err() == ContextErr::kCanceled) {
      return Failed(std::move(out), ToolExecutionStatus::kError, "request failed: context canceled");
    }
    return Failed(std::move(out), ToolExecutionStatus::kTimeout, "execution timed out");
  }

  httplib::Client cli(SchemeHostPort(ep));
  if (!cli.is_valid()) {
    out.end_time = std::chrono::system_clock::now();
    return Failed(std::move(out), ToolExecutionStatus::kError, "request failed: unsupported endpoint " + endpoint_it->second);
  }
  cli.set_connection_timeout(std::min(effective, std::chrono::milliseconds(connect_timeout_seconds_ * 1000)));
  cli.set_read_timeout(effective);
  cli.set_write_timeout(effective);

  httplib::Headers headers;
  if (auto auth = tool.metadata.find("auth"); auth != tool.metadata.end() && !auth->second.empty()) {
    headers.emplace("Authorization", auth->second);
  }

  const auto body = params.is_null() ? nlohmann::json::object().dump() : params.dump();
  const auto path = ep.base_path.empty() ? std::string("/") : ep.base_path;
  const auto started = CallContext::Clock::now();
  auto res = cli.Post(path, headers, body, "application/json");
  const auto elapsed = CallContext::Clock::now() - started;
  out.end_time = std::chrono::system_clock::now();

  if (!res) {
    const auto e = res.error();
    const bool timed_out = ctx.Err() == ContextErr::kDeadlineExceeded || e == httplib::Error::ConnectionTimeout ||
                           (e == httplib::Error::Read && elapsed >= effective);
    if (timed_out) return Failed(std::move(out), ToolExecutionStatus::kTimeout, "execution timed out");
    return Failed(std::move(out), ToolExecutionStatus::kError, "request failed: " + httplib::to_string(e));
  }

  auto decoded = nlohmann::json::parse(res->body, nullptr, false);
  if (res->status < 200 || res->status >= 300) {
    auto message = decoded.is_discarded() ? std::string() : ExtractErrorField(decoded);
    if (message.empty()) message = "server returned status " + std::to_string(res->status);
    return Failed(std::move(out), ToolExecutionStatus::kError, message);
  }
  if (decoded.is_discarded()) {
    return Failed(std::move(out), ToolExecutionStatus::kError, "failed to decode response");
  }

  out.status = ToolExecutionStatus::kSuccess;
  out.result = std::move(decoded);
  return out;
}

}  // namespace orchestrator
