#pragma once

#include "sync_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Every sync message travels as {type, syncId, configId, data}. configId is
// the sender's own config id and is informational on the receiving side.
struct SyncEnvelope {
  std::string sync_id;
  std::string config_id;
};

struct SyncRequestMessage : SyncEnvelope {
  std::string folder_name;
  SyncDirection direction = SyncDirection::Bidirectional;
  ConflictResolution conflict_resolution = ConflictResolution::LastWriteWins;
};

struct SyncMetadataMessage : SyncEnvelope {
  std::vector<FileSnapshot> files;
};

// want=false announces an upload about to arrive as fileId; want=true asks
// the other side to send the file at path.
struct SyncFileMessage : SyncEnvelope {
  std::string path;
  bool want = false;
  std::string file_id;
};

struct SyncCompleteMessage : SyncEnvelope {
  std::vector<FileSnapshot> files;  // sender's baseline after the cycle
  std::size_t files_added = 0;
  std::size_t files_modified = 0;
  std::size_t files_deleted = 0;
  uint64_t bytes_transferred = 0;
  std::size_t unresolved_conflicts = 0;
};

// Conflicts as seen by the sender; local and remote are the sender's.
struct SyncConflictMessage : SyncEnvelope {
  std::vector<ConflictFile> conflicts;
};

struct SyncErrorMessage : SyncEnvelope {
  std::string error;
};

using SyncMessage = std::variant<SyncRequestMessage,
                                 SyncMetadataMessage,
                                 SyncFileMessage,
                                 SyncCompleteMessage,
                                 SyncConflictMessage,
                                 SyncErrorMessage>;

const char* message_type(const SyncMessage& msg);
bool is_sync_message_type(const std::string& type);

std::optional<SyncMessage> parse_sync_message(const nlohmann::json& j, std::string& error);
nlohmann::json serialize_sync_message(const SyncMessage& msg);
