#include "tool_config.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

namespace orchestrator {
namespace {

static bool ReadString(const nlohmann::json& j, const char* key, std::string* out, std::string* err) {
  if (!j.contains(key) || j[key].is_null()) return true;
  if (!j[key].is_string()) {
    if (err) *err = std::string("field ") + key + " must be a string";
    return false;
  }
  *out = j[key].get<std::string>();
  return true;
}

template <typename T>
static bool ReadInt(const nlohmann::json& j, const char* key, T* out, std::string* err) {
  if (!j.contains(key) || j[key].is_null()) return true;
  if (!j[key].is_number_integer()) {
    if (err) *err = std::string("field ") + key + " must be an integer";
    return false;
  }
  const auto& v = j[key];
  const bool too_wide = v.is_number_unsigned() &&
                        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  const int64_t n = too_wide ? 0 : v.get<int64_t>();
  if (too_wide || n < std::numeric_limits<T>::min() || n > std::numeric_limits<T>::max()) {
    if (err) *err = std::string("field ") + key + " must be an integer in range";
    return false;
  }
  *out = static_cast<T>(n);
  return true;
}

static bool ReadBool(const nlohmann::json& j, const char* key, bool* out, std::string* err) {
  if (!j.contains(key) || j[key].is_null()) return true;
  if (!j[key].is_boolean()) {
    if (err) *err = std::string("field ") + key + " must be a boolean";
    return false;
  }
  *out = j[key].get<bool>();
  return true;
}

static bool ReadStringList(const nlohmann::json& j, const char* key, std::vector<std::string>* out,
                           std::string* err) {
  if (!j.contains(key) || j[key].is_null()) return true;
  if (!j[key].is_array()) {
    if (err) *err = std::string("field ") + key + " must be an array of strings";
    return false;
  }
  for (const auto& v : j[key]) {
    if (!v.is_string()) {
      if (err) *err = std::string("field ") + key + " must be an array of strings";
      return false;
    }
    out->push_back(v.get<std::string>());
  }
  return true;
}

static bool ReadMetadata(const nlohmann::json& j, Metadata* out, std::string* err) {
  if (!j.contains("metadata") || j["metadata"].is_null()) return true;
  if (!j["metadata"].is_object()) {
    if (err) *err = "field metadata must be an object of strings";
    return false;
  }
  for (auto it = j["metadata"].begin(); it != j["metadata"].end(); ++it) {
    if (!it.value().is_string()) {
      if (err) *err = "metadata." + it.key() + " must be a string";
      return false;
    }
    (*out)[it.key()] = it.value().get<std::string>();
  }
  return true;
}

static nlohmann::json MetadataJson(const Metadata& m) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [k, v] : m) out[k] = v;
  return out;
}

static std::optional<nlohmann::json> ReadJsonFile(const std::string& path, const char* what, Error* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    SetError(err, ErrorCode::kConfigInvalid, std::string("failed to read ") + what + " config: " + path);
    return std::nullopt;
  }
  std::stringstream buf;
  buf << in.rdbuf();
  auto j = nlohmann::json::parse(buf.str(), nullptr, false);
  if (j.is_discarded()) {
    SetError(err, ErrorCode::kConfigInvalid, std::string("failed to parse ") + what + " config: " + path);
    return std::nullopt;
  }
  return j;
}

static bool WriteJsonFile(const nlohmann::json& j, const std::string& path, const char* what, Error* err) {
  std::filesystem::path p(path);
  std::error_code ec;
  if (!p.parent_path().empty()) {
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) return SetError(err, ErrorCode::kPersistenceFailure, "failed to create directory: " + ec.message());
  }
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) return SetError(err, ErrorCode::kPersistenceFailure, std::string("failed to write ") + what + " config");
  out << j.dump(2);
  out.flush();
  if (!out) return SetError(err, ErrorCode::kPersistenceFailure, std::string("failed to write ") + what + " config");
  return true;
}

}  // namespace

bool ValidateToolConfig(const ToolConfig& cfg, Error* err) {
  auto invalid = [err](std::string msg) { return SetError(err, ErrorCode::kConfigInvalid, std::move(msg)); };
  if (cfg.id.empty()) return invalid("tool ID is required");
  if (cfg.name.empty()) return invalid("tool name is required");
  if (cfg.version.empty()) return invalid("tool version is required");

  for (size_t i = 0; i < cfg.parameters.size(); i++) {
    const auto& p = cfg.parameters[i];
    if (p.name.empty()) return invalid("parameter name is required at index " + std::to_string(i));
    if (p.type.empty()) return invalid("parameter type is required for parameter " + p.name);
  }

  if (cfg.timeout < 0) return invalid("timeout must be non-negative");
  if (cfg.retry_count < 0) return invalid("retry count must be non-negative");
  if (cfg.retry_delay < 0) return invalid("retry delay must be non-negative");
  if (cfg.concurrency < 0) return invalid("concurrency must be non-negative");
  if (cfg.rate_limit < 0) return invalid("rate limit must be non-negative");
  if (cfg.log_max_size < 0) return invalid("log max size must be non-negative");
  if (cfg.log_max_files < 0) return invalid("log max files must be non-negative");
  return true;
}

bool ValidateServerConfig(const ServerConfig& cfg, Error* err) {
  auto invalid = [err](std::string msg) { return SetError(err, ErrorCode::kConfigInvalid, std::move(msg)); };
  if (cfg.id.empty()) return invalid("server ID is required");
  if (cfg.name.empty()) return invalid("server name is required");
  if (cfg.version.empty()) return invalid("server version is required");
  if (cfg.type.empty()) return invalid("server type is required");
  if (!ParseServerType(cfg.type)) return invalid("unsupported server type: " + cfg.type);

  for (size_t i = 0; i < cfg.tools.size(); i++) {
    Error tool_err;
    if (!ValidateToolConfig(cfg.tools[i], &tool_err)) {
      return invalid("invalid tool config at index " + std::to_string(i) + ": " + tool_err.message);
    }
  }

  if (cfg.port < 0 || cfg.port > 65535) return invalid("invalid port number");
  if (cfg.ssl_enabled) {
    if (cfg.ssl_cert_file.empty()) return invalid("SSL certificate file is required when SSL is enabled");
    if (cfg.ssl_key_file.empty()) return invalid("SSL key file is required when SSL is enabled");
  }
  if (cfg.max_request_size < 0) return invalid("max request size must be non-negative");
  if (cfg.read_timeout < 0) return invalid("read timeout must be non-negative");
  if (cfg.write_timeout < 0) return invalid("write timeout must be non-negative");
  if (cfg.idle_timeout < 0) return invalid("idle timeout must be non-negative");
  if (cfg.shutdown_timeout < 0) return invalid("shutdown timeout must be non-negative");
  return true;
}

nlohmann::json ToJson(const ToolConfig& cfg) {
  nlohmann::json j;
  j["id"] = cfg.id;
  j["name"] = cfg.name;
  j["description"] = cfg.description;
  j["version"] = cfg.version;
  j["author"] = cfg.author;
  if (!cfg.server_id.empty()) j["server_id"] = cfg.server_id;
  j["parameters"] = nlohmann::json::array();
  for (const auto& p : cfg.parameters) j["parameters"].push_back(ToJson(p));
  j["metadata"] = MetadataJson(cfg.metadata);
  if (cfg.timeout) j["timeout"] = cfg.timeout;
  if (cfg.retry_count) j["retry_count"] = cfg.retry_count;
  if (cfg.retry_delay) j["retry_delay"] = cfg.retry_delay;
  if (cfg.concurrency) j["concurrency"] = cfg.concurrency;
  if (cfg.rate_limit) j["rate_limit"] = cfg.rate_limit;
  if (cfg.require_auth) j["require_auth"] = true;
  if (!cfg.allow_roles.empty()) j["allow_roles"] = cfg.allow_roles;
  if (!cfg.allow_ips.empty()) j["allow_ips"] = cfg.allow_ips;
  if (!cfg.log_level.empty()) j["log_level"] = cfg.log_level;
  if (!cfg.log_file.empty()) j["log_file"] = cfg.log_file;
  if (!cfg.log_format.empty()) j["log_format"] = cfg.log_format;
  if (cfg.log_max_size) j["log_max_size"] = cfg.log_max_size;
  if (cfg.log_max_files) j["log_max_files"] = cfg.log_max_files;
  return j;
}

nlohmann::json ToJson(const ServerConfig& cfg) {
  nlohmann::json j;
  j["id"] = cfg.id;
  j["name"] = cfg.name;
  j["description"] = cfg.description;
  j["version"] = cfg.version;
  j["type"] = cfg.type;
  if (!cfg.url.empty()) j["url"] = cfg.url;
  j["metadata"] = MetadataJson(cfg.metadata);
  j["tools"] = nlohmann::json::array();
  for (const auto& t : cfg.tools) j["tools"].push_back(ToJson(t));
  if (cfg.port) j["port"] = cfg.port;
  if (!cfg.host.empty()) j["host"] = cfg.host;
  if (cfg.ssl_enabled) j["ssl_enabled"] = true;
  if (!cfg.ssl_cert_file.empty()) j["ssl_cert_file"] = cfg.ssl_cert_file;
  if (!cfg.ssl_key_file.empty()) j["ssl_key_file"] = cfg.ssl_key_file;
  if (!cfg.allowed_origins.empty()) j["allowed_origins"] = cfg.allowed_origins;
  if (!cfg.allowed_methods.empty()) j["allowed_methods"] = cfg.allowed_methods;
  if (!cfg.allowed_headers.empty()) j["allowed_headers"] = cfg.allowed_headers;
  if (cfg.max_request_size) j["max_request_size"] = cfg.max_request_size;
  if (cfg.read_timeout) j["read_timeout"] = cfg.read_timeout;
  if (cfg.write_timeout) j["write_timeout"] = cfg.write_timeout;
  if (cfg.idle_timeout) j["idle_timeout"] = cfg.idle_timeout;
  if (cfg.shutdown_timeout) j["shutdown_timeout"] = cfg.shutdown_timeout;
  return j;
}

bool FromJson(const nlohmann::json& j, ToolConfig* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "tool config must be a json object";
    return false;
  }
  ToolConfig c;
  if (!ReadString(j, "id", &c.id, err) || !ReadString(j, "name", &c.name, err) ||
      !ReadString(j, "description", &c.description, err) || !ReadString(j, "version", &c.version, err) ||
      !ReadString(j, "author", &c.author, err) || !ReadString(j, "server_id", &c.server_id, err) ||
      !ReadMetadata(j, &c.metadata, err)) {
    return false;
  }
  if (j.contains("parameters") && !j["parameters"].is_null()) {
    if (!j["parameters"].is_array()) {
      if (err) *err = "field parameters must be an array";
      return false;
    }
    for (const auto& pj : j["parameters"]) {
      ToolParameter p;
      if (!FromJson(pj, &p, err)) return false;
      c.parameters.push_back(std::move(p));
    }
  }
  if (!ReadInt(j, "timeout", &c.timeout, err) || !ReadInt(j, "retry_count", &c.retry_count, err) ||
      !ReadInt(j, "retry_delay", &c.retry_delay, err) || !ReadInt(j, "concurrency", &c.concurrency, err) ||
      !ReadInt(j, "rate_limit", &c.rate_limit, err) || !ReadBool(j, "require_auth", &c.require_auth, err) ||
      !ReadStringList(j, "allow_roles", &c.allow_roles, err) || !ReadStringList(j, "allow_ips", &c.allow_ips, err) ||
      !ReadString(j, "log_level", &c.log_level, err) || !ReadString(j, "log_file", &c.log_file, err) ||
      !ReadString(j, "log_format", &c.log_format, err) || !ReadInt(j, "log_max_size", &c.log_max_size, err) ||
      !ReadInt(j, "log_max_files", &c.log_max_files, err)) {
    return false;
  }
  *out = std::move(c);
  return true;
}

bool FromJson(const nlohmann::json& j, ServerConfig* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "server config must be a json object";
    return false;
  }
  ServerConfig c;
  if (!ReadString(j, "id", &c.id, err) || !ReadString(j, "name", &c.name, err) ||
      !ReadString(j, "description", &c.description, err) || !ReadString(j, "version", &c.version, err) ||
      !ReadString(j, "type", &c.type, err) || !ReadString(j, "url", &c.url, err) ||
      !ReadMetadata(j, &c.metadata, err)) {
    return false;
  }
  if (j.contains("tools") && !j["tools"].is_null()) {
    if (!j["tools"].is_array()) {
      if (err) *err = "field tools must be an array";
      return false;
    }
    for (const auto& tj : j["tools"]) {
      ToolConfig t;
      if (!FromJson(tj, &t, err)) return false;
      c.tools.push_back(std::move(t));
    }
  }
  if (!ReadInt(j, "port", &c.port, err) || !ReadString(j, "host", &c.host, err) ||
      !ReadBool(j, "ssl_enabled", &c.ssl_enabled, err) || !ReadString(j, "ssl_cert_file", &c.ssl_cert_file, err) ||
      !ReadString(j, "ssl_key_file", &c.ssl_key_file, err) ||
      !ReadStringList(j, "allowed_origins", &c.allowed_origins, err) ||
      !ReadStringList(j, "allowed_methods", &c.allowed_methods, err) ||
      !ReadStringList(j, "allowed_headers", &c.allowed_headers, err) ||
      !ReadInt(j, "max_request_size", &c.max_request_size, err) || !ReadInt(j, "read_timeout", &c.read_timeout, err) ||
      !ReadInt(j, "write_timeout", &c.write_timeout, err) || !ReadInt(j, "idle_timeout", &c.idle_timeout, err) ||
      !ReadInt(j, "shutdown_timeout", &c.shutdown_timeout, err)) {
    return false;
  }
  *out = std::move(c);
  return true;
}

std::optional<ToolConfig> LoadToolConfig(const std::string& path, Error* err) {
  auto j = ReadJsonFile(path, "tool", err);
  if (!j) return std::nullopt;
  ToolConfig cfg;
  std::string why;
  if (!FromJson(*j, &cfg, &why)) {
    SetError(err, ErrorCode::kConfigInvalid, "failed to parse tool config: " + why);
    return std::nullopt;
  }
  if (!ValidateToolConfig(cfg, err)) {
    WrapError(err, "invalid tool config");
    return std::nullopt;
  }
  return cfg;
}

std::optional<ServerConfig> LoadServerConfig(const std::string& path, Error* err) {
  auto j = ReadJsonFile(path, "server", err);
  if (!j) return std::nullopt;
  ServerConfig cfg;
  std::string why;
  if (!FromJson(*j, &cfg, &why)) {
    SetError(err, ErrorCode::kConfigInvalid, "failed to parse server config: " + why);
    return std::nullopt;
  }
  if (!ValidateServerConfig(cfg, err)) {
    WrapError(err, "invalid server config");
    return std::nullopt;
  }
  return cfg;
}

bool SaveToolConfig(const ToolConfig& cfg, const std::string& path, Error* err) {
  return WriteJsonFile(ToJson(cfg), path, "tool", err);
}

bool SaveServerConfig(const ServerConfig& cfg, const std::string& path, Error* err) {
  return WriteJsonFile(ToJson(cfg), path, "server", err);
}

}  // namespace orchestrator
