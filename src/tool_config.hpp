#pragma once

#include "errors.hpp"
#include "mcp_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orchestrator {

// Declarative tool file: <dir>/tools/*.json, or embedded in a server file.
struct ToolConfig {
  std::string id;
  std::string name;
  std::string description;
  std::string version;
  std::string author;
  // Optional owner. Without it the tool is registered as dangling.
  std::string server_id;
  std::vector<ToolParameter> parameters;
  Metadata metadata;

  // Seconds.
  int64_t timeout = 0;
  int retry_count = 0;
  int64_t retry_delay = 0;
  int concurrency = 0;
  int rate_limit = 0;

  bool require_auth = false;
  std::vector<std::string> allow_roles;
  std::vector<std::string> allow_ips;

  std::string log_level;
  std::string log_file;
  std::string log_format;
  int log_max_size = 0;
  int log_max_files = 0;
};

// Declarative server file: <dir>/servers/*.json.
struct ServerConfig {
  std::string id;
  std::string name;
  std::string description;
  std::string version;
  std::string type;
  std::string url;
  Metadata metadata;
  std::vector<ToolConfig> tools;

  int port = 0;
  std::string host;
  bool ssl_enabled = false;
  std::string ssl_cert_file;
  std::string ssl_key_file;
  std::vector<std::string> allowed_origins;
  std::vector<std::string> allowed_methods;
  std::vector<std::string> allowed_headers;
  int64_t max_request_size = 0;
  // Seconds.
  int64_t read_timeout = 0;
  int64_t write_timeout = 0;
  int64_t idle_timeout = 0;
  int64_t shutdown_timeout = 0;
};

bool ValidateToolConfig(const ToolConfig& cfg, Error* err);
bool ValidateServerConfig(const ServerConfig& cfg, Error* err);

nlohmann::json ToJson(const ToolConfig& cfg);
nlohmann::json ToJson(const ServerConfig& cfg);
bool FromJson(const nlohmann::json& j, ToolConfig* out, std::string* err);
bool FromJson(const nlohmann::json& j, ServerConfig* out, std::string* err);

// Read + parse + validate. Every failure is reported as kConfigInvalid.
std::optional<ToolConfig> LoadToolConfig(const std::string& path, Error* err);
std::optional<ServerConfig> LoadServerConfig(const std::string& path, Error* err);

bool SaveToolConfig(const ToolConfig& cfg, const std::string& path, Error* err);
bool SaveServerConfig(const ServerConfig& cfg, const std::string& path, Error* err);

}  // namespace orchestrator
