#pragma once

#include "runner.hpp"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace orchestrator {

// Supervises `/bin/sh -c <start_cmd>` in its own process group.
// Metadata: start_cmd (required), work_dir, env ("K=V" pairs separated by ',' or ';'), health_url.
class LocalServerRunner : public IServerRunner {
 public:
  LocalServerRunner(Server server, RunnerOptions opts = {});
  ~LocalServerRunner() override;

  LocalServerRunner(const LocalServerRunner&) = delete;
  LocalServerRunner& operator=(const LocalServerRunner&) = delete;

  bool Start(const CallContext& ctx, Error* err) override;
  bool Stop(const CallContext& ctx, Error* err) override;
  ServerStatus Status() const override;
  bool HealthCheck(const CallContext& ctx, Error* err) override;

  pid_t Pid() const;

 private:
  void Supervise(CallContext start_ctx);
  void Teardown(std::unique_lock<std::mutex>& lock);
  void ReapLocked(bool block);

  Server server_;
  RunnerOptions opts_;

  // Serializes Start/Stop so a teardown that drops mu_ to join cannot interleave with another spawn.
  std::mutex lifecycle_mu_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  ServerStatus status_ = ServerStatus::kStopped;
  pid_t pid_ = -1;
  bool reaped_ = true;
  bool stop_requested_ = false;
  std::thread supervisor_;
};

std::vector<std::string> ParseEnvAssignments(const std::string& list);

}  // namespace orchestrator
