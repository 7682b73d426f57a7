#include "mcp_router.hpp"

#include "call_context.hpp"
#include "mcp_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

namespace orchestrator {
namespace {

nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}};
  return j;
}

void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

void SendError(httplib::Response* res, const Error& err) {
  SendJson(res, HttpStatusFor(err.code), MakeError(err.message, ErrorCodeName(err.code)));
}

void SendBadRequest(httplib::Response* res, const std::string& message) {
  SendJson(res, 400, MakeError(message, ErrorCodeName(ErrorCode::kInvalidArgument)));
}

bool ParseBody(const httplib::Request& req, httplib::Response* res, nlohmann::json* out) {
  auto j = nlohmann::json::parse(req.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    SendBadRequest(res, "invalid json body");
    return false;
  }
  *out = std::move(j);
  return true;
}

bool RequireId(const httplib::Request& req, httplib::Response* res, std::string* id) {
  *id = req.get_param_value("id");
  if (!id->empty()) return true;
  SendBadRequest(res, "missing id");
  return false;
}

}  // namespace

int HttpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return 200;
    case ErrorCode::kNotFound:
      return 404;
    case ErrorCode::kAlreadyExists:
    case ErrorCode::kPreconditionFailed:
      return 409;
    case ErrorCode::kValidationFailed:
    case ErrorCode::kConfigInvalid:
    case ErrorCode::kInvalidArgument:
      return 400;
    case ErrorCode::kTimeout:
      return 504;
    case ErrorCode::kNotImplemented:
      return 501;
    case ErrorCode::kExecutionFailure:
    case ErrorCode::kPersistenceFailure:
      return 500;
  }
  return 500;
}

McpRouter::McpRouter(Manager* manager) : manager_(manager) {}

void McpRouter::Register(httplib::Server* server) {
  server->Get("/api/mcp/servers", [this](const httplib::Request&, httplib::Response& res) {
    auto out = nlohmann::json::array();
    for (const auto& s : manager_->ListServers(CallContext::Background())) out.push_back(ToJson(s));
    SendJson(&res, 200, out);
  });

  server->Post("/api/mcp/servers", [this](const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    if (!ParseBody(req, &res, &body)) return;
    Server s;
    std::string perr;
    if (!FromJson(body, &s, &perr)) {
      SendBadRequest(&res, perr);
      return;
    }
    Error err;
    auto stored = manager_->AddServer(CallContext::Background(), std::move(s), &err);
    if (!stored) {
      SendError(&res, err);
      return;
    }
    SendJson(&res, 201, ToJson(*stored));
  });

  server->Delete("/api/mcp/servers", [this](const httplib::Request& req, httplib::Response& res) {
    std::string id;
    if (!RequireId(req, &res, &id)) return;
    Error err;
    if (!manager_->RemoveServer(CallContext::Background(), id, &err)) {
      SendError(&res, err);
      return;
    }
    res.status = 204;
  });

  // The start context owns the process lifetime, so it must outlive the request.
  server->Post("/api/mcp/servers/start", [this](const httplib::Request& req, httplib::Response& res) {
    std::string id;
    if (!RequireId(req, &res, &id)) return;
    Error err;
    if (!manager_->StartServer(CallContext::Background(), id, &err)) {
      SendError(&res, err);
      return;
    }
    res.status = 204;
  });

  server->Post("/api/mcp/servers/stop", [this](const httplib::Request& req, httplib::Response& res) {
    std::string id;
    if (!RequireId(req, &res, &id)) return;
    Error err;
    if (!manager_->StopServer(CallContext::Background(), id, &err)) {
      SendError(&res, err);
      return;
    }
    res.status = 204;
  });

  server->Get("/api/mcp/tools", [this](const httplib::Request&, httplib::Response& res) {
    auto out = nlohmann::json::array();
    for (const auto& t : manager_->ListTools(CallContext::Background())) out.push_back(ToJson(t));
    SendJson(&res, 200, out);
  });

  server->Post("/api/mcp/tools", [this](const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    if (!ParseBody(req, &res, &body)) return;
    if (!body.contains("tool_id") || !body["tool_id"].is_string() || body["tool_id"].get<std::string>().empty()) {
      SendBadRequest(&res, "tool_id is required");
      return;
    }
    const auto tool_id = body["tool_id"].get<std::string>();
    nlohmann::json params = body.contains("params") ? body["params"] : nlohmann::json::object();
    if (params.is_null()) params = nlohmann::json::object();

    const bool approved = body.contains("approved") && body["approved"].is_boolean() && body["approved"].get<bool>();
    auto ctx = CallContext::Background();
    if (!manager_->GetAutoApprove(ctx) && !approved) {
      std::cout << "[http] execute id=" << tool_id << " rejected=approval_required\n";
      SendJson(&res, 403, MakeError("tool execution requires approval", "approval_required"));
      return;
    }

    if (body.contains("timeout")) {
      if (!body["timeout"].is_number_integer()) {
        SendBadRequest(&res, "timeout must be an integer number of nanoseconds");
        return;
      }
      const auto ns = body["timeout"].get<int64_t>();
      if (ns > 0) {
        ctx = ctx.WithTimeout(std::chrono::ceil<std::chrono::milliseconds>(std::chrono::nanoseconds(ns)));
      }
    }

    Error err;
    auto result = manager_->ExecuteTool(ctx, tool_id, params, &err);
    if (!result) {
      SendError(&res, err);
      return;
    }
    SendJson(&res, 200, ToJson(*result));
  });

  server->Get("/api/mcp/config", [this](const httplib::Request&, httplib::Response& res) {
    auto ctx = CallContext::Background();
    nlohmann::json j;
    j["auto_approve"] = manager_->GetAutoApprove(ctx);
    j["timeout"] = static_cast<int64_t>(manager_->GetTimeout(ctx).count());
    SendJson(&res, 200, j);
  });

  server->Put("/api/mcp/config", [this](const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    if (!ParseBody(req, &res, &body)) return;
    if (body.contains("auto_approve") && !body["auto_approve"].is_boolean()) {
      SendBadRequest(&res, "auto_approve must be a boolean");
      return;
    }
    if (body.contains("timeout") && !body["timeout"].is_number_integer()) {
      SendBadRequest(&res, "timeout must be an integer number of nanoseconds");
      return;
    }
    auto ctx = CallContext::Background();
    Error err;
    if (body.contains("timeout") &&
        !manager_->SetTimeout(ctx, std::chrono::nanoseconds(body["timeout"].get<int64_t>()), &err)) {
      SendError(&res, err);
      return;
    }
    if (body.contains("auto_approve") && !manager_->SetAutoApprove(ctx, body["auto_approve"].get<bool>(), &err)) {
      SendError(&res, err);
      return;
    }
    res.status = 204;
  });

  server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    SendJson(&res, 200, j);
  });

  server->set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    SendJson(&res, 500, MakeError(message, "server_error"));
  });

  server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    if (res.status == 404) {
      res.set_content(MakeError("not found", ErrorCodeName(ErrorCode::kNotFound)).dump(), "application/json");
    } else if (res.status >= 500) {
      res.set_content(MakeError("server error", "server_error").dump(), "application/json");
    } else if (res.status >= 400) {
      res.set_content(MakeError("bad request", ErrorCodeName(ErrorCode::kInvalidArgument)).dump(), "application/json");
    }
  });
}

}  // namespace orchestrator
