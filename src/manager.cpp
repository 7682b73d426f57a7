#include "manager.hpp"

#include "executors/http_executor.hpp"
#include "runners/local_runner.hpp"
#include "runners/remote_runner.hpp"
#include "tool_config.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace orchestrator {

namespace {

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string SanitizeJsonForLog(const nlohmann::json& body) {
  if (body.is_null()) return "null";
  if (!body.is_object()) return body.dump();
  auto j = body;
  for (const auto& key : {"api_key", "api-key", "apiKey", "authorization", "auth", "password", "token"}) {
    if (j.contains(key)) j[key] = "***";
  }
  return j.dump();
}

void LogToolCall(const std::string& tool_id, const std::string& server_id, const nlohmann::json& params) {
  std::cout << "[tool-call] id=" << tool_id << " server=" << server_id
            << " params=" << TruncateForLog(SanitizeJsonForLog(params), 2000) << "\n";
}

void LogToolResult(const ToolResult& r) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(r.end_time - r.start_time).count();
  std::cout << "[tool-result] id=" << r.tool_id << " status=" << ToolExecutionStatusName(r.status) << " ms=" << ms
            << " error=" << (r.error.empty() ? "-" : r.error)
            << " result=" << TruncateForLog(SanitizeJsonForLog(r.result), 2000) << "\n";
}

std::vector<std::string> JsonFilesIn(const std::filesystem::path& dir) {
  std::vector<std::string> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return out;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (it->path().extension() != ".json") continue;
    out.push_back(it->path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

Tool ToolFromConfig(const ToolConfig& cfg, const std::string& server_id, Timestamp now) {
  Tool t;
  t.id = cfg.id;
  t.name = cfg.name;
  t.description = cfg.description;
  t.version = cfg.version;
  t.author = cfg.author;
  t.parameters = cfg.parameters;
  t.server_id = server_id.empty() ? cfg.server_id : server_id;
  t.metadata = cfg.metadata;
  t.created_at = now;
  t.updated_at = now;
  return t;
}

Server ServerFromConfig(const ServerConfig& cfg, Timestamp now) {
  Server s;
  s.id = cfg.id;
  s.name = cfg.name;
  s.description = cfg.description;
  s.version = cfg.version;
  s.url = cfg.url;
  s.type = ParseServerType(cfg.type).value_or(ServerType::kLocal);
  s.status = ServerStatus::kStopped;
  s.metadata = cfg.metadata;
  s.created_at = now;
  s.updated_at = now;
  for (const auto& tc : cfg.tools) s.tools.push_back(ToolFromConfig(tc, cfg.id, now));
  return s;
}

}  // namespace

Manager::Manager(ManagerOptions opts)
    : store_(std::move(opts.registry_path)), runner_opts_(opts.runner), timeout_(opts.timeout) {}

Manager::~Manager() { Shutdown(); }

bool Manager::Load(Error* err) {
  Error load_err;
  auto snap = store_.Load(&load_err);
  if (!snap) {
    if (load_err.code == ErrorCode::kOk) return true;
    if (err) *err = load_err;
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  servers_.clear();
  tools_.clear();
  executors_.clear();
  runners_.clear();
  for (auto& kv : snap->servers) {
    auto s = std::move(kv.second);
    s.status = ServerStatus::kStopped;
    s.tools.clear();
    servers_.emplace(s.id, std::move(s));
  }
  tools_ = std::move(snap->tools);
  auto_approve_ = snap->auto_approve;
  if (snap->timeout >= std::chrono::milliseconds(1)) timeout_ = snap->timeout;
  std::cout << "[manager] load path=" << store_.Path() << " servers=" << servers_.size() << " tools=" << tools_.size()
            << "\n";
  return true;
}

void Manager::Shutdown() {
  std::vector<std::pair<std::string, std::shared_ptr<IServerRunner>>> runners;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    for (auto& kv : runners_) runners.emplace_back(kv.first, kv.second);
    runners_.clear();
  }
  for (auto& r : runners) {
    Error stop_err;
    if (!r.second->Stop(CallContext::Background(), &stop_err)) {
      std::cout << "[manager] shutdown id=" << r.first << " error=" << stop_err.message << "\n";
    }
  }
}

ServerStatus Manager::EffectiveStatusLocked(const Server& server) const {
  auto it = runners_.find(server.id);
  if (it == runners_.end()) return server.status;
  return it->second->Status();
}

Server Manager::ViewLocked(const Server& server) const {
  Server out = server;
  out.status = EffectiveStatusLocked(server);
  out.tools.clear();
  for (const auto& kv : tools_) {
    if (kv.second.server_id == server.id) out.tools.push_back(kv.second);
  }
  std::sort(out.tools.begin(), out.tools.end(), [](const Tool& a, const Tool& b) { return a.id < b.id; });
  return out;
}

bool Manager::PersistLocked(Error* err) const {
  RegistrySnapshot snap;
  for (const auto& kv : servers_) snap.servers.emplace(kv.first, ViewLocked(kv.second));
  snap.tools = tools_;
  snap.auto_approve = auto_approve_;
  snap.timeout = timeout_;
  if (store_.Save(snap, err)) return true;
  std::cout << "[manager] persist path=" << store_.Path() << " ok=0 error=" << (err ? err->message : "-") << "\n";
  return false;
}

std::shared_ptr<IServerRunner> Manager::RunnerForLocked(const Server& server) {
  auto it = runners_.find(server.id);
  if (it != runners_.end()) return it->second;
  std::shared_ptr<IServerRunner> runner;
  if (server.type == ServerType::kRemote) {
    runner = std::make_shared<RemoteServerRunner>(server, runner_opts_);
  } else {
    runner = std::make_shared<LocalServerRunner>(server, runner_opts_);
  }
  runners_.emplace(server.id, runner);
  return runner;
}

std::optional<Server> Manager::AddServer(const CallContext&, Server server, Error* err) {
  const auto now = std::chrono::system_clock::now();
  if (server.id.empty()) server.id = NewId("server");
  server.status = ServerStatus::kStopped;
  server.created_at = now;
  server.updated_at = now;

  std::vector<Tool> embedded = std::move(server.tools);
  server.tools.clear();
  for (auto& t : embedded) {
    if (t.id.empty()) t.id = NewId("tool");
    t.server_id = server.id;
    t.created_at = now;
    t.updated_at = now;
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  if (servers_.count(server.id)) {
    SetError(err, ErrorCode::kAlreadyExists, "server already exists: " + server.id);
    return std::nullopt;
  }
  for (const auto& t : embedded) {
    if (tools_.count(t.id)) {
      SetError(err, ErrorCode::kAlreadyExists, "tool already exists: " + t.id);
      return std::nullopt;
    }
  }
  const auto id = server.id;
  const auto tool_count = embedded.size();
  servers_.emplace(id, std::move(server));
  for (auto& t : embedded) tools_[t.id] = std::move(t);
  if (!PersistLocked(err)) return std::nullopt;
  std::cout << "[manager] add_server id=" << id << " type=" << ServerTypeName(servers_[id].type)
            << " tools=" << tool_count << "\n";
  return ViewLocked(servers_[id]);
}

bool Manager::RemoveServer(const CallContext& ctx, const std::string& server_id, Error* err) {
  std::shared_ptr<IServerRunner> runner;
  bool persisted = false;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (!servers_.count(server_id)) return SetError(err, ErrorCode::kNotFound, "server not found: " + server_id);
    servers_.erase(server_id);
    for (auto it = tools_.begin(); it != tools_.end();) {
      if (it->second.server_id == server_id) {
        it = tools_.erase(it);
      } else {
        ++it;
      }
    }
    executors_.erase(server_id);
    auto rit = runners_.find(server_id);
    if (rit != runners_.end()) {
      runner = rit->second;
      runners_.erase(rit);
    }
    persisted = PersistLocked(err);
  }
  if (runner) {
    Error stop_err;
    if (!runner->Stop(ctx, &stop_err)) {
      std::cout << "[manager] remove_server id=" << server_id << " stop_error=" << stop_err.message << "\n";
    }
  }
  if (persisted) std::cout << "[manager] remove_server id=" << server_id << "\n";
  return persisted;
}

std::optional<Server> Manager::GetServer(const CallContext&, const std::string& server_id, Error* err) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = servers_.find(server_id);
  if (it == servers_.end()) {
    SetError(err, ErrorCode::kNotFound, "server not found: " + server_id);
    return std::nullopt;
  }
  return ViewLocked(it->second);
}

std::vector<Server> Manager::ListServers(const CallContext&) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<Server> out;
  out.reserve(servers_.size());
  for (const auto& kv : servers_) out.push_back(ViewLocked(kv.second));
  std::sort(out.begin(), out.end(), [](const Server& a, const Server& b) { return a.id < b.id; });
  return out;
}

bool Manager::StartServer(const CallContext& ctx, const std::string& server_id, Error* err) {
  std::shared_ptr<IServerRunner> runner;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) return SetError(err, ErrorCode::kNotFound, "server not found: " + server_id);
    runner = RunnerForLocked(it->second);
  }

  Error start_err;
  const bool started = runner->Start(ctx, &start_err);

  std::unique_lock<std::shared_mutex> lock(mu_);
  auto it = servers_.find(server_id);
  if (it == servers_.end()) {
    // Removed while starting.
    lock.unlock();
    Error ignored;
    runner->Stop(CallContext::Background(), &ignored);
    return SetError(err, ErrorCode::kNotFound, "server not found: " + server_id);
  }
  it->second.status = started ? ServerStatus::kRunning : ServerStatus::kError;
  it->second.updated_at = std::chrono::system_clock::now();
  if (!started) {
    Error persist_err;
    if (!PersistLocked(&persist_err)) {
      std::cout << "[manager] start_server id=" << server_id << " persist_error=" << persist_err.message << "\n";
    }
    std::cout << "[manager] start_server id=" << server_id << " ok=0 error=" << start_err.message << "\n";
    return SetError(err, ErrorCode::kExecutionFailure, "failed to start server " + server_id + ": " + start_err.message);
  }
  if (!PersistLocked(err)) return false;
  std::cout << "[manager] start_server id=" << server_id << " ok=1\n";
  return true;
}

bool Manager::StopServer(const CallContext& ctx, const std::string& server_id, Error* err) {
  std::shared_ptr<IServerRunner> runner;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    if (!servers_.count(server_id)) return SetError(err, ErrorCode::kNotFound, "server not found: " + server_id);
    auto rit = runners_.find(server_id);
    if (rit != runners_.end()) runner = rit->second;
  }

  if (runner) {
    Error stop_err;
    if (!runner->Stop(ctx, &stop_err)) {
      return SetError(err, ErrorCode::kExecutionFailure, "failed to stop server " + server_id + ": " + stop_err.message);
    }
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  auto it = servers_.find(server_id);
  if (it == servers_.end()) return SetError(err, ErrorCode::kNotFound, "server not found: " + server_id);
  it->second.status = ServerStatus::kStopped;
  it->second.updated_at = std::chrono::system_clock::now();
  if (!PersistLocked(err)) return false;
  std::cout << "[manager] stop_server id=" << server_id << "\n";
  return true;
}

std::optional<Tool> Manager::GetTool(const CallContext&, const std::string& tool_id, Error* err) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = tools_.find(tool_id);
  if (it == tools_.end()) {
    SetError(err, ErrorCode::kNotFound, "tool not found: " + tool_id);
    return std::nullopt;
  }
  return it->second;
}

std::vector<Tool> Manager::ListTools(const CallContext&) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<Tool> out;
  out.reserve(tools_.size());
  for (const auto& kv : tools_) out.push_back(kv.second);
  std::sort(out.begin(), out.end(), [](const Tool& a, const Tool& b) { return a.id < b.id; });
  return out;
}

std::optional<ToolResult> Manager::ExecuteTool(const CallContext& ctx,
                                               const std::string& tool_id,
                                               const nlohmann::json& params,
                                               Error* err) {
  Tool tool;
  ServerType server_type = ServerType::kLocal;
  std::shared_ptr<IExecutor> executor;
  std::chrono::nanoseconds timeout{};
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto tit = tools_.find(tool_id);
    if (tit == tools_.end()) {
      SetError(err, ErrorCode::kNotFound, "tool not found: " + tool_id);
      return std::nullopt;
    }
    tool = tit->second;
    auto sit = servers_.find(tool.server_id);
    if (sit == servers_.end()) {
      SetError(err, ErrorCode::kNotFound, "server error: server not found: " + tool.server_id);
      return std::nullopt;
    }
    if (EffectiveStatusLocked(sit->second) != ServerStatus::kRunning) {
      SetError(err, ErrorCode::kPreconditionFailed, "server is not running");
      return std::nullopt;
    }
    server_type = sit->second.type;
    auto eit = executors_.find(tool.server_id);
    if (eit != executors_.end()) executor = eit->second;
    timeout = timeout_;
  }

  if (!executor) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto& slot = executors_[tool.server_id];
    if (!slot) {
      if (server_type == ServerType::kRemote) {
        slot = std::make_shared<HttpExecutor>(std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
      } else {
        slot = std::make_shared<LocalExecutor>();
      }
    }
    executor = slot;
  }

  const CallContext call_ctx =
      ctx.HasDeadline() ? ctx : ctx.WithTimeout(std::chrono::duration_cast<std::chrono::milliseconds>(timeout));

  LogToolCall(tool.id, tool.server_id, params);
  auto exec = executor->Execute(call_ctx, tool, params, err);
  if (!exec) {
    std::cout << "[tool-result] id=" << tool.id << " rejected error=" << (err ? err->message : "-") << "\n";
    return std::nullopt;
  }

  ToolResult out;
  out.tool_id = tool.id;
  out.status = exec->status;
  out.result = std::move(exec->result);
  out.error = std::move(exec->error);
  out.start_time = exec->start_time;
  out.end_time = exec->end_time;
  LogToolResult(out);
  return out;
}

std::vector<Tool> Manager::SearchTools(const CallContext&, const std::string&, Error* err) {
  SetError(err, ErrorCode::kNotImplemented, "not implemented");
  return {};
}

bool Manager::DownloadTool(const CallContext&, const std::string&, Error* err) {
  return SetError(err, ErrorCode::kNotImplemented, "not implemented");
}

bool Manager::UpdateTool(const CallContext&, const std::string&, Error* err) {
  return SetError(err, ErrorCode::kNotImplemented, "not implemented");
}

bool Manager::SetAutoApprove(const CallContext&, bool enabled, Error* err) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  auto_approve_ = enabled;
  return PersistLocked(err);
}

bool Manager::GetAutoApprove(const CallContext&) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return auto_approve_;
}

bool Manager::SetTimeout(const CallContext&, std::chrono::nanoseconds timeout, Error* err) {
  // Calls are bounded in whole milliseconds.
  if (timeout < std::chrono::milliseconds(1)) {
    return SetError(err, ErrorCode::kInvalidArgument, "timeout must be at least 1ms");
  }
  std::unique_lock<std::shared_mutex> lock(mu_);
  timeout_ = timeout;
  // Remote executors capture the timeout; local ones hold handlers and must survive.
  for (auto it = executors_.begin(); it != executors_.end();) {
    if (it->second->Type() == ServerType::kRemote) {
      it = executors_.erase(it);
    } else {
      ++it;
    }
  }
  return PersistLocked(err);
}

std::chrono::nanoseconds Manager::GetTimeout(const CallContext&) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return timeout_;
}

std::optional<Tool> Manager::RegisterLocalTool(const std::string& server_id,
                                               Tool tool,
                                               ToolHandler handler,
                                               Error* err) {
  if (!handler) {
    SetError(err, ErrorCode::kInvalidArgument, "handler is required");
    return std::nullopt;
  }
  std::unique_lock<std::shared_mutex> lock(mu_);
  auto sit = servers_.find(server_id);
  if (sit == servers_.end()) {
    SetError(err, ErrorCode::kNotFound, "server not found: " + server_id);
    return std::nullopt;
  }
  if (sit->second.type != ServerType::kLocal) {
    SetError(err, ErrorCode::kPreconditionFailed, "server is not a local server: " + server_id);
    return std::nullopt;
  }

  auto& slot = executors_[server_id];
  if (!slot) slot = std::make_shared<LocalExecutor>();
  auto local = std::dynamic_pointer_cast<LocalExecutor>(slot);
  if (!local) {
    SetError(err, ErrorCode::kInvalidArgument, "invalid executor type for server " + server_id);
    return std::nullopt;
  }

  const auto now = std::chrono::system_clock::now();
  if (tool.id.empty()) tool.id = NewId("tool");
  tool.server_id = server_id;
  auto existing = tools_.find(tool.id);
  tool.created_at = existing != tools_.end() ? existing->second.created_at : now;
  tool.updated_at = now;
  local->RegisterHandler(tool.id, std::move(handler));
  tools_[tool.id] = tool;
  if (!PersistLocked(err)) return std::nullopt;
  std::cout << "[manager] register_local_tool id=" << tool.id << " server=" << server_id << "\n";
  return tool;
}

void Manager::UpsertToolLocked(Tool tool, Timestamp now) {
  auto existing = tools_.find(tool.id);
  tool.created_at = existing != tools_.end() ? existing->second.created_at : now;
  tool.updated_at = now;
  tools_[tool.id] = std::move(tool);
}

// Config files are the source of truth for what they declare: an entry already in the registry (for example
// restored from a previous boot) is replaced in place. Runtime status, a running runner and registered
// handlers are kept.
bool Manager::LoadServerFromConfig(const CallContext&, const std::string& path, Error* err) {
  auto cfg = LoadServerConfig(path, err);
  if (!cfg) return false;
  const auto now = std::chrono::system_clock::now();
  auto server = ServerFromConfig(*cfg, now);
  std::vector<Tool> embedded = std::move(server.tools);
  server.tools.clear();

  std::shared_ptr<IServerRunner> stale_runner;
  bool replaced = false;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = servers_.find(server.id);
    if (it != servers_.end()) {
      replaced = true;
      server.created_at = it->second.created_at;
      server.status = it->second.status;
      auto rit = runners_.find(server.id);
      if (rit != runners_.end() && rit->second->Status() != ServerStatus::kRunning) {
        stale_runner = rit->second;
        runners_.erase(rit);
        server.status = ServerStatus::kStopped;
      }
      auto eit = executors_.find(server.id);
      if (eit != executors_.end() && eit->second->Type() != server.type) executors_.erase(eit);
      it->second = std::move(server);
    } else {
      servers_.emplace(cfg->id, std::move(server));
    }
    for (auto& t : embedded) UpsertToolLocked(std::move(t), now);
    if (!PersistLocked(err)) return false;
  }
  if (stale_runner) {
    Error ignored;
    stale_runner->Stop(CallContext::Background(), &ignored);
  }
  std::cout << "[config] server path=" << path << " id=" << cfg->id << (replaced ? " replaced=1" : "") << "\n";
  return true;
}

bool Manager::LoadToolFromConfig(const CallContext&, const std::string& path, Error* err) {
  auto cfg = LoadToolConfig(path, err);
  if (!cfg) return false;
  const auto now = std::chrono::system_clock::now();
  auto tool = ToolFromConfig(*cfg, "", now);

  std::unique_lock<std::shared_mutex> lock(mu_);
  const bool dangling = !servers_.count(tool.server_id);
  const bool replaced = tools_.count(tool.id) > 0;
  const auto id = tool.id;
  UpsertToolLocked(std::move(tool), now);
  if (!PersistLocked(err)) return false;
  std::cout << "[config] tool path=" << path << " id=" << id << (dangling ? " dangling=1" : "")
            << (replaced ? " replaced=1" : "") << "\n";
  return true;
}

bool Manager::LoadConfigsFromDirectory(const CallContext& ctx,
                                       const std::string& dir,
                                       ConfigLoadReport* report,
                                       Error* err) {
  ConfigLoadReport local_report;
  ConfigLoadReport& rep = report ? *report : local_report;
  const std::filesystem::path root(dir);

  for (const auto& path : JsonFilesIn(root / "servers")) {
    Error file_err;
    if (LoadServerFromConfig(ctx, path, &file_err)) {
      rep.servers.push_back(path);
    } else {
      std::cout << "[config] server path=" << path << " ok=0 error=" << file_err.message << "\n";
      rep.failures.push_back(ConfigLoadFailure{path, file_err});
    }
  }
  for (const auto& path : JsonFilesIn(root / "tools")) {
    Error file_err;
    if (LoadToolFromConfig(ctx, path, &file_err)) {
      rep.tools.push_back(path);
    } else {
      std::cout << "[config] tool path=" << path << " ok=0 error=" << file_err.message << "\n";
      rep.failures.push_back(ConfigLoadFailure{path, file_err});
    }
  }

  std::cout << "[config] dir=" << dir << " servers=" << rep.servers.size() << " tools=" << rep.tools.size()
            << " failures=" << rep.failures.size() << "\n";
  if (rep.failures.empty()) return true;
  return SetError(err, ErrorCode::kConfigInvalid,
                  std::to_string(rep.failures.size()) + " config file(s) failed to load from " + dir);
}

}  // namespace orchestrator
