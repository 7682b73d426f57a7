#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace orchestrator {

using Timestamp = std::chrono::system_clock::time_point;
using Metadata = std::map<std::string, std::string>;

enum class ServerType {
  kLocal,
  kRemote,
};

enum class ServerStatus {
  kStopped,
  kRunning,
  kError,
};

enum class ToolExecutionStatus {
  kSuccess,
  kError,
  kTimeout,
};

const char* ServerTypeName(ServerType type);
std::optional<ServerType> ParseServerType(const std::string& s);
const char* ServerStatusName(ServerStatus status);
std::optional<ServerStatus> ParseServerStatus(const std::string& s);
const char* ToolExecutionStatusName(ToolExecutionStatus status);

struct ToolParameter {
  std::string name;
  // One of: string, number, boolean, array, object.
  std::string type;
  std::string description;
  bool required = false;
  // null when no default is declared.
  nlohmann::json default_value;
};

struct Tool {
  std::string id;
  std::string name;
  std::string description;
  std::string version;
  std::string author;
  std::vector<ToolParameter> parameters;
  std::string server_id;
  Timestamp created_at{};
  Timestamp updated_at{};
  // "endpoint" and "auth" drive remote execution.
  Metadata metadata;
};

struct Server {
  std::string id;
  std::string name;
  std::string description;
  std::string version;
  std::string url;
  ServerType type = ServerType::kLocal;
  ServerStatus status = ServerStatus::kStopped;
  std::vector<Tool> tools;
  Timestamp created_at{};
  Timestamp updated_at{};
  // Operational parameters: start_cmd, work_dir, env, health_url.
  Metadata metadata;
};

struct ToolExecutionResult {
  ToolExecutionStatus status = ToolExecutionStatus::kSuccess;
  nlohmann::json result;
  std::string error;
  Timestamp start_time{};
  Timestamp end_time{};
};

struct ToolResult {
  std::string tool_id;
  ToolExecutionStatus status = ToolExecutionStatus::kSuccess;
  nlohmann::json result;
  std::string error;
  Timestamp start_time{};
  Timestamp end_time{};
};

// Checks params against the declared parameters. Stops at the first violation:
// required-presence over declared parameters first, then name and type of every supplied key.
bool ValidateParameters(const Tool& tool, const nlohmann::json& params, Error* err);

// RFC 3339 UTC with nanoseconds, e.g. 2024-05-01T12:00:00.000000000Z. Parsing also accepts
// numeric offsets and any number of fraction digits.
std::string FormatTimestamp(Timestamp ts);
std::optional<Timestamp> ParseTimestamp(const std::string& s);

nlohmann::json ToJson(const ToolParameter& p);
nlohmann::json ToJson(const Tool& tool);
nlohmann::json ToJson(const Server& server);
nlohmann::json ToJson(const ToolResult& result);

bool FromJson(const nlohmann::json& j, ToolParameter* out, std::string* err);
bool FromJson(const nlohmann::json& j, Tool* out, std::string* err);
bool FromJson(const nlohmann::json& j, Server* out, std::string* err);

std::string NewId(const std::string& prefix);

}  // namespace orchestrator
