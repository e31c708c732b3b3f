#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// One file as observed at a point in time. Replaced, never edited, when the
// file changes. Unique per (config_id, path).
struct FileSnapshot {
  std::string path;          // relative to the sync root, '/' separated
  std::string name;
  uint64_t size = 0;
  int64_t last_modified = 0; // epoch ms
  std::string hash;          // sha256 hex
  int64_t synced_at = 0;     // epoch ms of the last successful sync, 0 = never
  std::string config_id;

  bool operator==(const FileSnapshot& other) const {
    return path == other.path && name == other.name && size == other.size &&
           last_modified == other.last_modified && hash == other.hash &&
           synced_at == other.synced_at && config_id == other.config_id;
  }
  bool operator!=(const FileSnapshot& other) const { return !(*this == other); }
};

enum class SyncDirection { Bidirectional, UploadOnly, DownloadOnly };

// Per-config policy applied to conflicts before they reach the user.
enum class ConflictResolution { LastWriteWins, Manual, LocalWins, RemoteWins };

// Per-file decision for one conflict.
enum class ResolutionAction { Local, Remote, Both, Manual };

enum class SyncStatus { Synced, OutOfSync, Syncing, Error, Conflict, Offline };

enum class SyncPhase { Scanning, Comparing, Transferring, Finalizing };

enum class SyncOutcome { Success, Error, Cancelled };

struct ConflictFile {
  std::string path;
  FileSnapshot local;
  FileSnapshot remote;
  std::optional<ResolutionAction> resolution;
};

struct ResolutionChoice {
  std::string path;
  ResolutionAction action = ResolutionAction::Manual;
};

struct SyncDiff {
  std::vector<FileSnapshot> local_only;
  std::vector<FileSnapshot> remote_only;
  std::vector<FileSnapshot> modified;  // holds the newer side of each pair
  std::vector<FileSnapshot> unchanged;
  std::vector<ConflictFile> conflicts;
};

struct SyncPlan {
  std::vector<FileSnapshot> upload;
  std::vector<FileSnapshot> download;
  std::vector<FileSnapshot> remove;
  std::vector<ConflictFile> conflicts;

  bool empty() const {
    return upload.empty() && download.empty() && remove.empty() && conflicts.empty();
  }
};

struct SyncConfig {
  std::string id;
  std::string local_folder;
  std::string local_folder_name;
  std::string peer_id;
  std::string peer_name;
  std::string session_id;
  SyncDirection direction = SyncDirection::Bidirectional;
  ConflictResolution conflict_resolution = ConflictResolution::LastWriteWins;
  int64_t created_at = 0;
  std::optional<int64_t> last_synced_at;
  bool is_active = true;
};

struct PendingChanges {
  std::vector<FileSnapshot> local;
  std::vector<FileSnapshot> remote;
  std::vector<ConflictFile> conflicts;
};

struct SyncState {
  std::string config_id;
  std::vector<FileSnapshot> local_snapshot;
  std::optional<std::vector<FileSnapshot>> remote_snapshot;
  SyncStatus status = SyncStatus::OutOfSync;
  int64_t last_checked_at = 0;
  PendingChanges pending_changes;
  std::optional<std::string> error;
};

struct SyncProgress {
  std::string config_id;
  SyncPhase phase = SyncPhase::Scanning;
  std::optional<std::string> current_file;
  std::size_t files_processed = 0;
  std::size_t total_files = 0;
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
  double speed = 0.0;
  double eta = 0.0;
};

struct SyncHistoryEntry {
  std::string config_id;
  int64_t timestamp = 0;
  int64_t duration = 0;
  std::size_t files_added = 0;
  std::size_t files_modified = 0;
  std::size_t files_deleted = 0;
  uint64_t bytes_transferred = 0;
  SyncOutcome status = SyncOutcome::Success;
  std::optional<std::string> error;
};

const char* to_string(SyncDirection direction);
const char* to_string(ConflictResolution policy);
const char* to_string(ResolutionAction action);
const char* to_string(SyncStatus status);
const char* to_string(SyncPhase phase);
const char* to_string(SyncOutcome outcome);

std::optional<SyncDirection> parse_sync_direction(std::string_view text);
std::optional<ConflictResolution> parse_conflict_resolution(std::string_view text);
std::optional<ResolutionAction> parse_resolution_action(std::string_view text);
std::optional<SyncStatus> parse_sync_status(std::string_view text);

void to_json(nlohmann::json& j, const FileSnapshot& s);
void from_json(const nlohmann::json& j, FileSnapshot& s);
void to_json(nlohmann::json& j, const ConflictFile& c);
void from_json(const nlohmann::json& j, ConflictFile& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void from_json(const nlohmann::json& j, SyncConfig& c);
void to_json(nlohmann::json& j, const SyncState& s);
void from_json(const nlohmann::json& j, SyncState& s);
void to_json(nlohmann::json& j, const SyncHistoryEntry& e);
void from_json(const nlohmann::json& j, SyncHistoryEntry& e);
