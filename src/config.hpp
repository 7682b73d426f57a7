#pragma once

#include <chrono>
#include <string>

namespace orchestrator {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8090;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

struct OrchestratorConfig {
  HttpListenConfig listen;
  std::string registry_path;
  std::string config_dir;
  std::chrono::seconds timeout{30};
  bool auto_approve = false;
  std::chrono::seconds health_interval{30};
};

OrchestratorConfig LoadConfigFromEnv();

// Splits "scheme://host:port/path" into its parts. Missing port falls back to default_port.
HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

// "scheme://host:port", the form httplib::Client accepts.
std::string SchemeHostPort(const HttpEndpoint& ep);

bool TryParseBool(const std::string& s, bool* out);

}  // namespace orchestrator
