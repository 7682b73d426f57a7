#include "remote_runner.hpp"

#include <iostream>
#include <utility>

namespace orchestrator {

RemoteServerRunner::RemoteServerRunner(Server server, RunnerOptions opts)
    : server_(std::move(server)), opts_(opts) {}

std::string RemoteServerRunner::HealthUrl() const {
  auto it = server_.metadata.find("health_url");
  if (it != server_.metadata.end() && !it->second.empty()) return it->second;
  std::string base = server_.url;
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + "/health";
}

bool RemoteServerRunner::Start(const CallContext& ctx, Error* err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (status_ == ServerStatus::kRunning) return true;
  }

  // Probe without holding the lock so Status() stays responsive.
  Error probe_err;
  const bool ok = HealthCheck(ctx, &probe_err);

  std::lock_guard<std::mutex> lock(mu_);
  if (!ok) {
    status_ = ServerStatus::kError;
    std::cout << "[runner] start id=" << server_.id << " remote=" << HealthUrl() << " ok=0 error=" << probe_err.message
              << "\n";
    return SetError(err, ErrorCode::kExecutionFailure, "server is not accessible: " + probe_err.message);
  }
  status_ = ServerStatus::kRunning;
  std::cout << "[runner] start id=" << server_.id << " remote=" << HealthUrl() << " ok=1\n";
  return true;
}

bool RemoteServerRunner::Stop(const CallContext&, Error*) {
  std::lock_guard<std::mutex> lock(mu_);
  if (status_ == ServerStatus::kStopped) return true;
  status_ = ServerStatus::kStopped;
  std::cout << "[runner] stop id=" << server_.id << "\n";
  return true;
}

ServerStatus RemoteServerRunner::Status() const {
  std::lock_guard<std::mutex> lock(mu_);
  return status_;
}

bool RemoteServerRunner::HealthCheck(const CallContext& ctx, Error* err) {
  return ProbeHealth(ctx, HealthUrl(), opts_.probe_timeout, err);
}

}  // namespace orchestrator
