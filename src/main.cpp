#include "call_context.hpp"
#include "config.hpp"
#include "manager.hpp"
#include "mcp_router.hpp"

#include <httplib.h>

#include <iostream>

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = orchestrator::LoadConfigFromEnv();

  orchestrator::ManagerOptions opts;
  opts.registry_path = cfg.registry_path;
  opts.timeout = cfg.timeout;
  opts.runner.health_interval = cfg.health_interval;
  orchestrator::Manager manager(opts);

  std::cout << "[orchestrator] registry=" << cfg.registry_path
            << " config_dir=" << (cfg.config_dir.empty() ? "<none>" : cfg.config_dir)
            << " timeout_s=" << cfg.timeout.count() << " health_interval_s=" << cfg.health_interval.count() << "\n";

  orchestrator::Error err;
  if (!manager.Load(&err)) {
    std::cout << "[orchestrator] load registry failed code=" << orchestrator::ErrorCodeName(err.code)
              << " error=" << err.message << "\n";
    return 1;
  }

  auto ctx = orchestrator::CallContext::Background();
  if (cfg.auto_approve && !manager.SetAutoApprove(ctx, true, &err)) {
    std::cout << "[orchestrator] auto_approve error=" << err.message << "\n";
  }

  if (!cfg.config_dir.empty()) {
    orchestrator::ConfigLoadReport report;
    orchestrator::Error dir_err;
    if (!manager.LoadConfigsFromDirectory(ctx, cfg.config_dir, &report, &dir_err)) {
      for (const auto& f : report.failures) {
        std::cout << "[config] failed path=" << f.path << " code=" << orchestrator::ErrorCodeName(f.error.code)
                  << " error=" << f.error.message << "\n";
      }
    }
  }

  httplib::Server server;
  orchestrator::McpRouter router(&manager);
  router.Register(&server);

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  manager.Shutdown();
  return ok ? 0 : 1;
}
