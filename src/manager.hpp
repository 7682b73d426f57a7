#pragma once

#include "call_context.hpp"
#include "errors.hpp"
#include "executors/executor.hpp"
#include "executors/local_executor.hpp"
#include "mcp_types.hpp"
#include "registry_store.hpp"
#include "runners/runner.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace orchestrator {

struct ManagerOptions {
  std::string registry_path;
  std::chrono::nanoseconds timeout{std::chrono::seconds(30)};
  RunnerOptions runner;
};

struct ConfigLoadFailure {
  std::string path;
  Error error;
};

struct ConfigLoadReport {
  std::vector<std::string> servers;
  std::vector<std::string> tools;
  std::vector<ConfigLoadFailure> failures;
};

// Registry of servers and tools plus the dispatcher that routes tool calls to per-server executors.
//
// Servers, tools, cached executors and runners share one reader/writer lock. Every mutation is
// written to the registry file before the write lock is released. Values handed out are copies.
class Manager {
 public:
  explicit Manager(ManagerOptions opts);
  ~Manager();

  Manager(const Manager&) = delete;
  Manager& operator=(const Manager&) = delete;

  // Restores the registry file if it exists. Restored servers come back stopped.
  bool Load(Error* err);

  // Stops every runner.
  void Shutdown();

  // Assigns an ID when missing and ingests embedded tools. Rejects an ID that is already registered.
  std::optional<Server> AddServer(const CallContext& ctx, Server server, Error* err);
  // Also removes every tool owned by the server.
  bool RemoveServer(const CallContext& ctx, const std::string& server_id, Error* err);
  std::optional<Server> GetServer(const CallContext& ctx, const std::string& server_id, Error* err) const;
  std::vector<Server> ListServers(const CallContext& ctx) const;
  bool StartServer(const CallContext& ctx, const std::string& server_id, Error* err);
  bool StopServer(const CallContext& ctx, const std::string& server_id, Error* err);

  std::optional<Tool> GetTool(const CallContext& ctx, const std::string& tool_id, Error* err) const;
  std::vector<Tool> ListTools(const CallContext& ctx) const;

  // Call-level failures: unknown tool, missing server, server not running, invalid parameters.
  // Anything that goes wrong once the invocation started is reported inside the returned result.
  std::optional<ToolResult> ExecuteTool(const CallContext& ctx,
                                        const std::string& tool_id,
                                        const nlohmann::json& params,
                                        Error* err);

  // Marketplace hooks; not implemented.
  std::vector<Tool> SearchTools(const CallContext& ctx, const std::string& query, Error* err);
  bool DownloadTool(const CallContext& ctx, const std::string& tool_id, Error* err);
  bool UpdateTool(const CallContext& ctx, const std::string& tool_id, Error* err);

  bool SetAutoApprove(const CallContext& ctx, bool enabled, Error* err);
  bool GetAutoApprove(const CallContext& ctx) const;
  bool SetTimeout(const CallContext& ctx, std::chrono::nanoseconds timeout, Error* err);
  std::chrono::nanoseconds GetTimeout(const CallContext& ctx) const;

  std::optional<Tool> RegisterLocalTool(const std::string& server_id, Tool tool, ToolHandler handler, Error* err);

  // A config entry whose ID is already registered replaces the stored definition.
  bool LoadServerFromConfig(const CallContext& ctx, const std::string& path, Error* err);
  bool LoadToolFromConfig(const CallContext& ctx, const std::string& path, Error* err);
  // Loads <dir>/servers/*.json then <dir>/tools/*.json. A bad file does not stop the scan; it is
  // listed in report->failures and the call returns false.
  bool LoadConfigsFromDirectory(const CallContext& ctx, const std::string& dir, ConfigLoadReport* report, Error* err);

 private:
  Server ViewLocked(const Server& server) const;
  ServerStatus EffectiveStatusLocked(const Server& server) const;
  bool PersistLocked(Error* err) const;
  std::shared_ptr<IServerRunner> RunnerForLocked(const Server& server);
  void UpsertToolLocked(Tool tool, Timestamp now);

  RegistryStore store_;
  RunnerOptions runner_opts_;

  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, Server> servers_;
  std::unordered_map<std::string, Tool> tools_;
  std::unordered_map<std::string, std::shared_ptr<IExecutor>> executors_;
  std::unordered_map<std::string, std::shared_ptr<IServerRunner>> runners_;
  bool auto_approve_ = false;
  std::chrono::nanoseconds timeout_;
};

}  // namespace orchestrator
