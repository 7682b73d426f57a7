#pragma once

#include "errors.hpp"
#include "mcp_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace orchestrator {

// The manager's durable state: {servers, tools, auto_approve, timeout}.
struct RegistrySnapshot {
  std::unordered_map<std::string, Server> servers;
  std::unordered_map<std::string, Tool> tools;
  bool auto_approve = false;
  std::chrono::nanoseconds timeout{std::chrono::seconds(30)};
};

nlohmann::json SnapshotToJson(const RegistrySnapshot& snapshot);
bool SnapshotFromJson(const nlohmann::json& j, RegistrySnapshot* out, std::string* err);

// Whole-file JSON store. Every Save rewrites the file through a temp file + rename and creates
// missing parent directories.
class RegistryStore {
 public:
  explicit RegistryStore(std::string path);

  const std::string& Path() const { return path_; }

  bool Save(const RegistrySnapshot& snapshot, Error* err) const;

  // nullopt with err->code == kOk means the file does not exist yet.
  std::optional<RegistrySnapshot> Load(Error* err) const;

 private:
  std::string path_;
};

}  // namespace orchestrator
