#pragma once

#include "runner.hpp"

#include <mutex>

namespace orchestrator {

// A remote server is never spawned: Start is a reachability probe, Stop only flips the status.
class RemoteServerRunner : public IServerRunner {
 public:
  RemoteServerRunner(Server server, RunnerOptions opts = {});

  bool Start(const CallContext& ctx, Error* err) override;
  bool Stop(const CallContext& ctx, Error* err) override;
  ServerStatus Status() const override;
  bool HealthCheck(const CallContext& ctx, Error* err) override;

  std::string HealthUrl() const;

 private:
  Server server_;
  RunnerOptions opts_;
  mutable std::mutex mu_;
  ServerStatus status_ = ServerStatus::kStopped;
};

}  // namespace orchestrator
