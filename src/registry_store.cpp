#include "registry_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace orchestrator {

nlohmann::json SnapshotToJson(const RegistrySnapshot& snapshot) {
  nlohmann::json out;
  out["servers"] = nlohmann::json::object();
  for (const auto& [id, server] : snapshot.servers) out["servers"][id] = ToJson(server);
  out["tools"] = nlohmann::json::object();
  for (const auto& [id, tool] : snapshot.tools) out["tools"][id] = ToJson(tool);
  out["auto_approve"] = snapshot.auto_approve;
  out["timeout"] = static_cast<int64_t>(snapshot.timeout.count());
  return out;
}

bool SnapshotFromJson(const nlohmann::json& j, RegistrySnapshot* out, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "registry must be a json object";
    return false;
  }
  RegistrySnapshot snap;
  if (j.contains("servers") && j["servers"].is_object()) {
    for (auto it = j["servers"].begin(); it != j["servers"].end(); ++it) {
      Server s;
      if (!FromJson(it.value(), &s, err)) return false;
      if (s.id.empty()) s.id = it.key();
      snap.servers.emplace(it.key(), std::move(s));
    }
  }
  if (j.contains("tools") && j["tools"].is_object()) {
    for (auto it = j["tools"].begin(); it != j["tools"].end(); ++it) {
      Tool t;
      if (!FromJson(it.value(), &t, err)) return false;
      if (t.id.empty()) t.id = it.key();
      snap.tools.emplace(it.key(), std::move(t));
    }
  }
  if (j.contains("auto_approve") && j["auto_approve"].is_boolean()) snap.auto_approve = j["auto_approve"].get<bool>();
  if (j.contains("timeout") && j["timeout"].is_number_integer()) {
    snap.timeout = std::chrono::nanoseconds(j["timeout"].get<int64_t>());
  }
  *out = std::move(snap);
  return true;
}

RegistryStore::RegistryStore(std::string path) : path_(std::move(path)) {}

bool RegistryStore::Save(const RegistrySnapshot& snapshot, Error* err) const {
  std::filesystem::path path(path_);
  std::error_code ec;
  auto dir = path.parent_path();
  if (!dir.empty()) {
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      return SetError(err, ErrorCode::kPersistenceFailure,
                      "failed to create directory " + dir.string() + ": " + ec.message());
    }
  }
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return SetError(err, ErrorCode::kPersistenceFailure, "failed to open " + tmp.string());
    out << SnapshotToJson(snapshot).dump(2);
    out.flush();
    if (!out) return SetError(err, ErrorCode::kPersistenceFailure, "failed to write " + tmp.string());
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return SetError(err, ErrorCode::kPersistenceFailure, "failed to replace " + path_ + ": " + ec.message());
  }
  return true;
}

std::optional<RegistrySnapshot> RegistryStore::Load(Error* err) const {
  std::filesystem::path p(path_);
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    if (err) *err = Error{};
    return std::nullopt;
  }
  std::ifstream in(p, std::ios::binary);
  if (!in) {
    SetError(err, ErrorCode::kPersistenceFailure, "failed to open " + path_);
    return std::nullopt;
  }
  std::stringstream buf;
  buf << in.rdbuf();
  auto j = nlohmann::json::parse(buf.str(), nullptr, false);
  if (j.is_discarded()) {
    SetError(err, ErrorCode::kPersistenceFailure, "failed to parse " + path_);
    return std::nullopt;
  }
  RegistrySnapshot snap;
  std::string why;
  if (!SnapshotFromJson(j, &snap, &why)) {
    SetError(err, ErrorCode::kPersistenceFailure, "invalid registry " + path_ + ": " + why);
    return std::nullopt;
  }
  return snap;
}

}  // namespace orchestrator
