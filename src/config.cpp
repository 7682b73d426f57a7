#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

namespace orchestrator {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParsePositiveInt(const std::string& s, long* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (!end || *end != '\0' || v <= 0) return false;
  *out = v;
  return true;
}

static std::string DefaultRegistryPath() {
  auto home = GetEnvStr("HOME");
  std::filesystem::path base = home.empty() ? std::filesystem::path(".") / "mcp_orchestrator"
                                            : std::filesystem::path(home) / ".mcp_orchestrator";
  return (base / "registry.json").string();
}

}  // namespace

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = ep.scheme == "https" && default_port == 80 ? 443 : default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::string SchemeHostPort(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port);
}

OrchestratorConfig LoadConfigFromEnv() {
  OrchestratorConfig cfg;

  if (auto host = GetEnvStr("MCP_ORCHESTRATOR_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("MCP_ORCHESTRATOR_LISTEN_PORT"); !port.empty()) cfg.listen.port = std::atoi(port.c_str());

  cfg.registry_path = GetEnvStr("MCP_ORCHESTRATOR_REGISTRY_PATH");
  if (cfg.registry_path.empty()) cfg.registry_path = DefaultRegistryPath();
  cfg.config_dir = GetEnvStr("MCP_ORCHESTRATOR_CONFIG_DIR");

  long seconds = 0;
  if (TryParsePositiveInt(GetEnvStr("MCP_ORCHESTRATOR_TIMEOUT_SECONDS"), &seconds)) {
    cfg.timeout = std::chrono::seconds(seconds);
  }
  if (TryParsePositiveInt(GetEnvStr("MCP_ORCHESTRATOR_HEALTH_INTERVAL_SECONDS"), &seconds)) {
    cfg.health_interval = std::chrono::seconds(seconds);
  }
  if (auto approve = GetEnvStr("MCP_ORCHESTRATOR_AUTO_APPROVE"); !approve.empty()) {
    bool b = false;
    if (TryParseBool(approve, &b)) cfg.auto_approve = b;
  }

  return cfg;
}

}  // namespace orchestrator
