#include "local_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace orchestrator {
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);

static std::string Trim(std::string s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.pop_back();
  return s;
}

static std::string MetadataValue(const Server& server, const char* key) {
  auto it = server.metadata.find(key);
  return it == server.metadata.end() ? std::string() : it->second;
}

static std::vector<std::string> BuildEnvironment(const std::vector<std::string>& extra) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) {
    std::string entry(*e);
    const auto key = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (const auto& x : extra) {
      if (x.compare(0, key.size() + 1, key + "=") == 0) {
        overridden = true;
        break;
      }
    }
    if (!overridden) out.push_back(std::move(entry));
  }
  out.insert(out.end(), extra.begin(), extra.end());
  return out;
}

}  // namespace

std::vector<std::string> ParseEnvAssignments(const std::string& list) {
  std::vector<std::string> out;
  std::string cur;
  auto flush = [&]() {
    auto v = Trim(cur);
    cur.clear();
    if (v.empty() || v.find('=') == std::string::npos || v.front() == '=') return;
    out.push_back(std::move(v));
  };
  for (char c : list) {
    if (c == ',' || c == ';') {
      flush();
      continue;
    }
    cur.push_back(c);
  }
  flush();
  return out;
}

LocalServerRunner::LocalServerRunner(Server server, RunnerOptions opts)
    : server_(std::move(server)), opts_(opts) {}

LocalServerRunner::~LocalServerRunner() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::unique_lock<std::mutex> lock(mu_);
  Teardown(lock);
}

bool LocalServerRunner::Start(const CallContext& ctx, Error* err) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::unique_lock<std::mutex> lock(mu_);
  if (status_ == ServerStatus::kRunning) return true;

  const auto cmd = MetadataValue(server_, "start_cmd");
  if (cmd.empty()) {
    status_ = ServerStatus::kError;
    return SetError(err, ErrorCode::kInvalidArgument, "no start command specified for server " + server_.id);
  }

  // A previous run that ended in Error may still hold a process and a supervisor.
  Teardown(lock);

  if (ctx.Done()) {
    status_ = ServerStatus::kStopped;
    return SetError(err, ctx.Err() == ContextErr::kDeadlineExceeded ? ErrorCode::kTimeout : ErrorCode::kExecutionFailure,
                    "failed to start server: context done before spawn");
  }

  const auto work_dir = MetadataValue(server_, "work_dir");
  const auto env_strings = BuildEnvironment(ParseEnvAssignments(MetadataValue(server_, "env")));
  std::vector<char*> envp;
  envp.reserve(env_strings.size() + 1);
  for (const auto& e : env_strings) envp.push_back(const_cast<char*>(e.c_str()));
  envp.push_back(nullptr);
  const char* argv[] = {"sh", "-c", cmd.c_str(), nullptr};

  int exec_pipe[2] = {-1, -1};
  if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
    status_ = ServerStatus::kError;
    return SetError(err, ErrorCode::kExecutionFailure,
                    "failed to start server: pipe: " + std::string(std::strerror(errno)));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int e = errno;
    close(exec_pipe[0]);
    close(exec_pipe[1]);
    status_ = ServerStatus::kError;
    return SetError(err, ErrorCode::kExecutionFailure, "failed to start server: fork: " + std::string(std::strerror(e)));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    close(exec_pipe[0]);
    setpgid(0, 0);
    int child_errno = 0;
    if (!work_dir.empty() && chdir(work_dir.c_str()) != 0) {
      child_errno = errno;
    } else {
      execve("/bin/sh", const_cast<char* const*>(argv), envp.data());
      child_errno = errno;
    }
    ssize_t ignored = write(exec_pipe[1], &child_errno, sizeof(child_errno));
    (void)ignored;
    _exit(127);
  }

  close(exec_pipe[1]);
  setpgid(pid, pid);
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(exec_pipe[0]);

  if (n > 0) {
    waitpid(pid, nullptr, 0);
    status_ = ServerStatus::kError;
    std::cout << "[runner] start id=" << server_.id << " ok=0 error=" << std::strerror(child_errno) << "\n";
    return SetError(err, ErrorCode::kExecutionFailure,
                    "failed to start server: " + std::string(std::strerror(child_errno)));
  }

  pid_ = pid;
  reaped_ = false;
  stop_requested_ = false;
  status_ = ServerStatus::kRunning;
  supervisor_ = std::thread(&LocalServerRunner::Supervise, this, ctx);
  std::cout << "[runner] start id=" << server_.id << " pid=" << pid_ << " cmd=" << cmd << "\n";
  return true;
}

bool LocalServerRunner::Stop(const CallContext&, Error*) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::unique_lock<std::mutex> lock(mu_);
  if (status_ == ServerStatus::kStopped) return true;
  const auto pid = pid_;
  Teardown(lock);
  status_ = ServerStatus::kStopped;
  std::cout << "[runner] stop id=" << server_.id << " pid=" << pid << "\n";
  return true;
}

ServerStatus LocalServerRunner::Status() const {
  std::lock_guard<std::mutex> lock(mu_);
  return status_;
}

pid_t LocalServerRunner::Pid() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pid_;
}

bool LocalServerRunner::HealthCheck(const CallContext& ctx, Error* err) {
  const auto url = MetadataValue(server_, "health_url");
  if (url.empty()) return true;
  return ProbeHealth(ctx, url, opts_.probe_timeout, err);
}

void LocalServerRunner::Supervise(CallContext start_ctx) {
  std::unique_lock<std::mutex> lock(mu_);
  auto next_health = CallContext::Clock::now() + opts_.health_interval;
  while (!stop_requested_) {
    cv_.wait_for(lock, kPollInterval, [this] { return stop_requested_; });
    if (stop_requested_) break;

    ReapLocked(false);

    if (start_ctx.Done()) {
      if (!reaped_) kill(-pid_, SIGKILL);
      ReapLocked(true);
      status_ = ServerStatus::kStopped;
      std::cout << "[runner] context done id=" << server_.id << " pid=" << pid_ << " killed\n";
      break;
    }

    if (CallContext::Clock::now() < next_health) continue;
    next_health = CallContext::Clock::now() + opts_.health_interval;
    lock.unlock();
    Error herr;
    const bool healthy = HealthCheck(CallContext::Background(), &herr);
    lock.lock();
    if (!healthy && !stop_requested_ && status_ == ServerStatus::kRunning) {
      status_ = ServerStatus::kError;
      std::cout << "[runner] health id=" << server_.id << " ok=0 error=" << herr.message << "\n";
    }
  }
}

void LocalServerRunner::Teardown(std::unique_lock<std::mutex>& lock) {
  stop_requested_ = true;
  cv_.notify_all();
  if (supervisor_.joinable()) {
    auto t = std::move(supervisor_);
    lock.unlock();
    t.join();
    lock.lock();
  }
  if (pid_ > 0 && !reaped_) {
    if (kill(-pid_, SIGKILL) != 0) kill(pid_, SIGKILL);
    ReapLocked(true);
  }
}

void LocalServerRunner::ReapLocked(bool block) {
  if (pid_ <= 0 || reaped_) return;
  pid_t r = 0;
  do {
    r = waitpid(pid_, nullptr, block ? 0 : WNOHANG);
  } while (r < 0 && errno == EINTR);
  if (r == pid_ || (r < 0 && errno == ECHILD)) reaped_ = true;
}

}  // namespace orchestrator
