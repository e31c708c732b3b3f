#include "sync_types.hpp"

#include <stdexcept>

namespace {

template<typename Enum, std::size_t N>
std::optional<Enum> lookup(std::string_view text, const std::pair<Enum, const char*> (&table)[N]) {
  for(const auto& entry : table) {
    if(text == entry.second) return entry.first;
  }
  return std::nullopt;
}

template<typename Enum, std::size_t N>
const char* name_of(Enum value, const std::pair<Enum, const char*> (&table)[N]) {
  for(const auto& entry : table) {
    if(entry.first == value) return entry.second;
  }
  return "unknown";
}

const std::pair<SyncDirection, const char*> kDirections[] = {
  {SyncDirection::Bidirectional, "bidirectional"},
  {SyncDirection::UploadOnly, "upload-only"},
  {SyncDirection::DownloadOnly, "download-only"},
};

const std::pair<ConflictResolution, const char*> kPolicies[] = {
  {ConflictResolution::LastWriteWins, "last-write-wins"},
  {ConflictResolution::Manual, "manual"},
  {ConflictResolution::LocalWins, "local-wins"},
  {ConflictResolution::RemoteWins, "remote-wins"},
};

const std::pair<ResolutionAction, const char*> kActions[] = {
  {ResolutionAction::Local, "local"},
  {ResolutionAction::Remote, "remote"},
  {ResolutionAction::Both, "both"},
  {ResolutionAction::Manual, "manual"},
};

const std::pair<SyncStatus, const char*> kStatuses[] = {
  {SyncStatus::Synced, "synced"},
  {SyncStatus::OutOfSync, "out-of-sync"},
  {SyncStatus::Syncing, "syncing"},
  {SyncStatus::Error, "error"},
  {SyncStatus::Conflict, "conflict"},
  {SyncStatus::Offline, "offline"},
};

const std::pair<SyncPhase, const char*> kPhases[] = {
  {SyncPhase::Scanning, "scanning"},
  {SyncPhase::Comparing, "comparing"},
  {SyncPhase::Transferring, "transferring"},
  {SyncPhase::Finalizing, "finalizing"},
};

const std::pair<SyncOutcome, const char*> kOutcomes[] = {
  {SyncOutcome::Success, "success"},
  {SyncOutcome::Error, "error"},
  {SyncOutcome::Cancelled, "cancelled"},
};

template<typename T>
T require(std::optional<T> value, const std::string& field, const std::string& text) {
  if(!value) throw std::runtime_error("Invalid " + field + ": " + text);
  return *value;
}

} // namespace

const char* to_string(SyncDirection direction) { return name_of(direction, kDirections); }
const char* to_string(ConflictResolution policy) { return name_of(policy, kPolicies); }
const char* to_string(ResolutionAction action) { return name_of(action, kActions); }
const char* to_string(SyncStatus status) { return name_of(status, kStatuses); }
const char* to_string(SyncPhase phase) { return name_of(phase, kPhases); }
const char* to_string(SyncOutcome outcome) { return name_of(outcome, kOutcomes); }

std::optional<SyncDirection> parse_sync_direction(std::string_view text){
  return lookup(text, kDirections);
}

std::optional<ConflictResolution> parse_conflict_resolution(std::string_view text){
  return lookup(text, kPolicies);
}

std::optional<ResolutionAction> parse_resolution_action(std::string_view text){
  return lookup(text, kActions);
}

std::optional<SyncStatus> parse_sync_status(std::string_view text){
  return lookup(text, kStatuses);
}

void to_json(nlohmann::json& j, const FileSnapshot& s){
  j = nlohmann::json{
    {"path", s.path},
    {"name", s.name},
    {"size", s.size},
    {"lastModified", s.last_modified},
    {"hash", s.hash},
    {"syncedAt", s.synced_at},
    {"configId", s.config_id}
  };
}

void from_json(const nlohmann::json& j, FileSnapshot& s){
  s.path = j.at("path").get<std::string>();
  s.name = j.value("name", std::string());
  s.size = j.value("size", uint64_t{0});
  s.last_modified = j.value("lastModified", int64_t{0});
  s.hash = j.value("hash", std::string());
  s.synced_at = j.value("syncedAt", int64_t{0});
  s.config_id = j.value("configId", std::string());
}

void to_json(nlohmann::json& j, const ConflictFile& c){
  j = nlohmann::json{{"path", c.path}, {"local", c.local}, {"remote", c.remote}};
  if(c.resolution) j["resolution"] = to_string(*c.resolution);
}

void from_json(const nlohmann::json& j, ConflictFile& c){
  c.path = j.at("path").get<std::string>();
  c.local = j.at("local").get<FileSnapshot>();
  c.remote = j.at("remote").get<FileSnapshot>();
  c.resolution.reset();
  if(j.contains("resolution") && j["resolution"].is_string()) {
    c.resolution = parse_resolution_action(j["resolution"].get<std::string>());
  }
}

void to_json(nlohmann::json& j, const SyncConfig& c){
  j = nlohmann::json{
    {"id", c.id},
    {"localFolder", c.local_folder},
    {"localFolderName", c.local_folder_name},
    {"peerId", c.peer_id},
    {"peerName", c.peer_name},
    {"sessionId", c.session_id},
    {"direction", to_string(c.direction)},
    {"conflictResolution", to_string(c.conflict_resolution)},
    {"createdAt", c.created_at},
    {"isActive", c.is_active}
  };
  if(c.last_synced_at) j["lastSyncedAt"] = *c.last_synced_at;
}

void from_json(const nlohmann::json& j, SyncConfig& c){
  c.id = j.at("id").get<std::string>();
  c.local_folder = j.value("localFolder", std::string());
  c.local_folder_name = j.value("localFolderName", std::string());
  c.peer_id = j.value("peerId", std::string());
  c.peer_name = j.value("peerName", std::string());
  c.session_id = j.value("sessionId", std::string());
  auto direction = j.value("direction", std::string("bidirectional"));
  c.direction = require(parse_sync_direction(direction), "direction", direction);
  auto policy = j.value("conflictResolution", std::string("last-write-wins"));
  c.conflict_resolution = require(parse_conflict_resolution(policy), "conflictResolution", policy);
  c.created_at = j.value("createdAt", int64_t{0});
  c.last_synced_at.reset();
  if(j.contains("lastSyncedAt") && j["lastSyncedAt"].is_number()) {
    c.last_synced_at = j["lastSyncedAt"].get<int64_t>();
  }
  c.is_active = j.value("isActive", true);
}

void to_json(nlohmann::json& j, const SyncState& s){
  j = nlohmann::json{
    {"configId", s.config_id},
    {"localSnapshot", s.local_snapshot},
    {"status", to_string(s.status)},
    {"lastCheckedAt", s.last_checked_at},
    {"pendingChanges", {
      {"local", s.pending_changes.local},
      {"remote", s.pending_changes.remote},
      {"conflicts", s.pending_changes.conflicts}
    }}
  };
  if(s.remote_snapshot) j["remoteSnapshot"] = *s.remote_snapshot;
  if(s.error) j["error"] = *s.error;
}

void from_json(const nlohmann::json& j, SyncState& s){
  s.config_id = j.at("configId").get<std::string>();
  s.local_snapshot = j.value("localSnapshot", std::vector<FileSnapshot>{});
  s.remote_snapshot.reset();
  if(j.contains("remoteSnapshot") && j["remoteSnapshot"].is_array()) {
    s.remote_snapshot = j["remoteSnapshot"].get<std::vector<FileSnapshot>>();
  }
  auto status = j.value("status", std::string("out-of-sync"));
  s.status = require(parse_sync_status(status), "status", status);
  s.last_checked_at = j.value("lastCheckedAt", int64_t{0});
  s.pending_changes = PendingChanges{};
  if(j.contains("pendingChanges")) {
    const auto& pending = j["pendingChanges"];
    s.pending_changes.local = pending.value("local", std::vector<FileSnapshot>{});
    s.pending_changes.remote = pending.value("remote", std::vector<FileSnapshot>{});
    s.pending_changes.conflicts = pending.value("conflicts", std::vector<ConflictFile>{});
  }
  s.error.reset();
  if(j.contains("error") && j["error"].is_string()) s.error = j["error"].get<std::string>();
}

void to_json(nlohmann::json& j, const SyncHistoryEntry& e){
  j = nlohmann::json{
    {"configId", e.config_id},
    {"timestamp", e.timestamp},
    {"duration", e.duration},
    {"filesAdded", e.files_added},
    {"filesModified", e.files_modified},
    {"filesDeleted", e.files_deleted},
    {"bytesTransferred", e.bytes_transferred},
    {"status", to_string(e.status)}
  };
  if(e.error) j["error"] = *e.error;
}

void from_json(const nlohmann::json& j, SyncHistoryEntry& e){
  e.config_id = j.at("configId").get<std::string>();
  e.timestamp = j.value("timestamp", int64_t{0});
  e.duration = j.value("duration", int64_t{0});
  e.files_added = j.value("filesAdded", std::size_t{0});
  e.files_modified = j.value("filesModified", std::size_t{0});
  e.files_deleted = j.value("filesDeleted", std::size_t{0});
  e.bytes_transferred = j.value("bytesTransferred", uint64_t{0});
  auto status = j.value("status", std::string("success"));
  e.status = require(lookup(status, kOutcomes), "status", status);
  e.error.reset();
  if(j.contains("error") && j["error"].is_string()) e.error = j["error"].get<std::string>();
}
