#include "mcp_types.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>
#include <sstream>

namespace orchestrator {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static bool TypeMatches(const std::string& type, const nlohmann::json& value, std::string* err) {
  bool ok = false;
  if (type == "string") {
    ok = value.is_string();
  } else if (type == "number") {
    ok = value.is_number();
  } else if (type == "boolean") {
    ok = value.is_boolean();
  } else if (type == "array") {
    ok = value.is_array();
  } else if (type == "object") {
    ok = value.is_object();
  } else {
    if (err) *err = "unsupported parameter type: " + type;
    return false;
  }
  if (!ok && err) *err = "expected " + type + ", got " + value.type_name();
  return ok;
}

static std::string GetString(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

static Timestamp GetTimestamp(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return Timestamp{};
  auto ts = ParseTimestamp(j[key].get<std::string>());
  return ts ? *ts : Timestamp{};
}

static nlohmann::json MetadataToJson(const Metadata& m) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [k, v] : m) out[k] = v;
  return out;
}

static Metadata MetadataFromJson(const nlohmann::json& j) {
  Metadata out;
  if (!j.is_object()) return out;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.value().is_string()) out[it.key()] = it.value().get<std::string>();
  }
  return out;
}

}  // namespace

const char* ServerTypeName(ServerType type) {
  return type == ServerType::kRemote ? "remote" : "local";
}

std::optional<ServerType> ParseServerType(const std::string& s) {
  if (s == "local") return ServerType::kLocal;
  if (s == "remote") return ServerType::kRemote;
  return std::nullopt;
}

const char* ServerStatusName(ServerStatus status) {
  switch (status) {
    case ServerStatus::kRunning:
      return "running";
    case ServerStatus::kError:
      return "error";
    case ServerStatus::kStopped:
      break;
  }
  return "stopped";
}

std::optional<ServerStatus> ParseServerStatus(const std::string& s) {
  if (s == "stopped") return ServerStatus::kStopped;
  if (s == "running") return ServerStatus::kRunning;
  if (s == "error") return ServerStatus::kError;
  return std::nullopt;
}

const char* ToolExecutionStatusName(ToolExecutionStatus status) {
  switch (status) {
    case ToolExecutionStatus::kError:
      return "error";
    case ToolExecutionStatus::kTimeout:
      return "timeout";
    case ToolExecutionStatus::kSuccess:
      break;
  }
  return "success";
}

bool ValidateParameters(const Tool& tool, const nlohmann::json& params, Error* err) {
  if (!params.is_null() && !params.is_object()) {
    return SetError(err, ErrorCode::kValidationFailed, "parameters must be an object");
  }

  for (const auto& p : tool.parameters) {
    if (p.required && (!params.is_object() || !params.contains(p.name))) {
      return SetError(err, ErrorCode::kValidationFailed, "missing required parameter: " + p.name);
    }
  }

  if (params.is_null()) return true;
  for (auto it = params.begin(); it != params.end(); ++it) {
    const ToolParameter* def = nullptr;
    for (const auto& p : tool.parameters) {
      if (p.name == it.key()) {
        def = &p;
        break;
      }
    }
    if (!def) {
      return SetError(err, ErrorCode::kValidationFailed, "unknown parameter: " + it.key());
    }
    std::string why;
    if (!TypeMatches(def->type, it.value(), &why)) {
      return SetError(err, ErrorCode::kValidationFailed, "invalid type for parameter " + it.key() + ": " + why);
    }
  }
  return true;
}

std::string FormatTimestamp(Timestamp ts) {
  const auto since_epoch = ts.time_since_epoch();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs).count();
  if (nanos < 0) {
    secs -= std::chrono::seconds(1);
    nanos += 1000000000;
  }
  std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09lldZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(nanos));
  return buf;
}

std::optional<Timestamp> ParseTimestamp(const std::string& s) {
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour,
                  &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  size_t pos = static_cast<size_t>(consumed);
  int64_t nanos = 0;
  if (pos < s.size() && s[pos] == '.') {
    pos++;
    int digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      if (digits < 9) {
        nanos = nanos * 10 + (s[pos] - '0');
        digits++;
      }
      pos++;
    }
    for (; digits < 9; digits++) nanos *= 10;
  }

  int64_t offset_seconds = 0;
  if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
    pos++;
  } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
    int oh = 0;
    int om = 0;
    if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
    offset_seconds = (oh * 3600 + om * 60) * (s[pos] == '-' ? -1 : 1);
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != s.size()) return std::nullopt;

  const std::time_t t = timegm(&tm);
  Timestamp out{std::chrono::seconds(static_cast<int64_t>(t) - offset_seconds)};
  out += std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(nanos));
  return out;
}

nlohmann::json ToJson(const ToolParameter& p) {
  nlohmann::json j;
  j["name"] = p.name;
  j["type"] = p.type;
  j["description"] = p.description;
  j["required"] = p.required;
  if (!p.default_value.is_null()) j["default"] = p.default_value;
  return j;
}

nlohmann::json ToJson(const Tool& tool) {
  nlohmann::json j;
  j["id"] = tool.id;
  j["name"] = tool.name;
  j["description"] = tool.description;
  j["version"] = tool.version;
  j["author"] = tool.author;
  j["parameters"] = nlohmann::json::array();
  for (const auto& p : tool.parameters) j["parameters"].push_back(ToJson(p));
  j["server_id"] = tool.server_id;
  j["created_at"] = FormatTimestamp(tool.created_at);
  j["updated_at"] = FormatTimestamp(tool.updated_at);
  j["metadata"] = MetadataToJson(tool.metadata);
  return j;
}

nlohmann::json ToJson(const Server& server) {
  nlohmann::json j;
  j["id"] = server.id;
  j["name"] = server.name;
  j["description"] = server.description;
  j["version"] = server.version;
  j["url"] = server.url;
  j["type"] = ServerTypeName(server.type);
  j["status"] = ServerStatusName(server.status);
  j["tools"] = nlohmann::json::array();
  for (const auto& t : server.tools) j["tools"].push_back(ToJson(t));
  j["created_at"] = FormatTimestamp(server.created_at);
  j["updated_at"] = FormatTimestamp(server.updated_at);
  j["metadata"] = MetadataToJson(server.metadata);
  return j;
}

nlohmann::json ToJson(const ToolResult& result) {
  nlohmann::json j;
  j["tool_id"] = result.tool_id;
  j["status"] = ToolExecutionStatusName(result.status);
  if (!result.result.is_null()) j["result"] = result.result;
  if (!result.error.empty()) j["error"] = result.error;
  j["start_time"] = FormatTimestamp(result.start_time);
  j["end_time"] = FormatTimestamp(result.end_time);
  return j;
}

bool FromJson(const nlohmann::json& j, ToolParameter* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "parameter must be an object";
    return false;
  }
  ToolParameter p;
  p.name = GetString(j, "name");
  p.type = GetString(j, "type");
  p.description = GetString(j, "description");
  if (j.contains("required") && j["required"].is_boolean()) p.required = j["required"].get<bool>();
  if (j.contains("default")) p.default_value = j["default"];
  *out = std::move(p);
  return true;
}

bool FromJson(const nlohmann::json& j, Tool* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "tool must be an object";
    return false;
  }
  Tool t;
  t.id = GetString(j, "id");
  t.name = GetString(j, "name");
  t.description = GetString(j, "description");
  t.version = GetString(j, "version");
  t.author = GetString(j, "author");
  t.server_id = GetString(j, "server_id");
  if (j.contains("parameters") && j["parameters"].is_array()) {
    for (const auto& pj : j["parameters"]) {
      ToolParameter p;
      if (!FromJson(pj, &p, err)) return false;
      t.parameters.push_back(std::move(p));
    }
  }
  t.created_at = GetTimestamp(j, "created_at");
  t.updated_at = GetTimestamp(j, "updated_at");
  if (j.contains("metadata")) t.metadata = MetadataFromJson(j["metadata"]);
  *out = std::move(t);
  return true;
}

bool FromJson(const nlohmann::json& j, Server* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "server must be an object";
    return false;
  }
  Server s;
  s.id = GetString(j, "id");
  s.name = GetString(j, "name");
  s.description = GetString(j, "description");
  s.version = GetString(j, "version");
  s.url = GetString(j, "url");
  if (auto type = GetString(j, "type"); !type.empty()) {
    auto parsed = ParseServerType(type);
    if (!parsed) {
      if (err) *err = "unsupported server type: " + type;
      return false;
    }
    s.type = *parsed;
  }
  if (auto status = ParseServerStatus(GetString(j, "status"))) s.status = *status;
  if (j.contains("tools") && j["tools"].is_array()) {
    for (const auto& tj : j["tools"]) {
      Tool t;
      if (!FromJson(tj, &t, err)) return false;
      s.tools.push_back(std::move(t));
    }
  }
  s.created_at = GetTimestamp(j, "created_at");
  s.updated_at = GetTimestamp(j, "updated_at");
  if (j.contains("metadata")) s.metadata = MetadataFromJson(j["metadata"]);
  *out = std::move(s);
  return true;
}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

}  // namespace orchestrator
