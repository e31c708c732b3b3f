#include "sync_protocol.hpp"

#include "utils.hpp"

using json = nlohmann::json;

namespace {

std::string string_field(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return std::string();
  return it->get<std::string>();
}

const json& data_field(const json& j) {
  static const json empty = json::object();
  auto it = j.find("data");
  if(it == j.end() || !it->is_object()) return empty;
  return *it;
}

template<typename T>
std::vector<T> list_field(const json& data, const char* key) {
  std::vector<T> out;
  auto it = data.find(key);
  if(it == data.end() || !it->is_array()) return out;
  out.reserve(it->size());
  for(const auto& entry : *it) out.push_back(entry.get<T>());
  return out;
}

} // namespace

const char* message_type(const SyncMessage& msg){
  return std::visit(overloaded{
    [](const SyncRequestMessage&) { return "sync-request"; },
    [](const SyncMetadataMessage&) { return "sync-metadata"; },
    [](const SyncFileMessage&) { return "sync-file"; },
    [](const SyncCompleteMessage&) { return "sync-complete"; },
    [](const SyncConflictMessage&) { return "sync-conflict"; },
    [](const SyncErrorMessage&) { return "sync-error"; },
  }, msg);
}

bool is_sync_message_type(const std::string& type){
  return type.rfind("sync-", 0) == 0;
}

std::optional<SyncMessage> parse_sync_message(const json& j, std::string& error){
  if(!j.is_object()) {
    error = "Invalid message format";
    return std::nullopt;
  }
  const std::string type = string_field(j, "type");
  SyncEnvelope envelope{string_field(j, "syncId"), string_field(j, "configId")};
  if(envelope.sync_id.empty()) {
    error = "Missing syncId for " + type;
    return std::nullopt;
  }
  const json& data = data_field(j);

  try {
    if(type == "sync-request") {
      SyncRequestMessage msg;
      static_cast<SyncEnvelope&>(msg) = envelope;
      msg.folder_name = string_field(data, "folderName");
      auto direction = parse_sync_direction(data.value("direction", std::string("bidirectional")));
      auto policy = parse_conflict_resolution(data.value("conflictResolution", std::string("last-write-wins")));
      if(!direction || !policy) {
        error = "Invalid sync-request options";
        return std::nullopt;
      }
      msg.direction = *direction;
      msg.conflict_resolution = *policy;
      return SyncMessage{std::move(msg)};
    }
    if(type == "sync-metadata") {
      SyncMetadataMessage msg;
      static_cast<SyncEnvelope&>(msg) = envelope;
      msg.files = list_field<FileSnapshot>(data, "files");
      return SyncMessage{std::move(msg)};
    }
    if(type == "sync-file") {
      SyncFileMessage msg;
      static_cast<SyncEnvelope&>(msg) = envelope;
      msg.path = normalize_relative_path(string_field(data, "path"));
      if(!is_safe_relative_path(msg.path)) {
        error = "Unsafe path in sync-file: " + string_field(data, "path");
        return std::nullopt;
      }
      msg.want = data.value("want", false);
      msg.file_id = string_field(data, "fileId");
      return SyncMessage{std::move(msg)};
    }
    if(type == "sync-complete") {
      SyncCompleteMessage msg;
      static_cast<SyncEnvelope&>(msg) = envelope;
      msg.files = list_field<FileSnapshot>(data, "files");
      msg.files_added = data.value("filesAdded", std::size_t{0});
      msg.files_modified = data.value("filesModified", std::size_t{0});
      msg.files_deleted = data.value("filesDeleted", std::size_t{0});
      msg.bytes_transferred = data.value("bytesTransferred", uint64_t{0});
      msg.unresolved_conflicts = data.value("unresolvedConflicts", std::size_t{0});
      return SyncMessage{std::move(msg)};
    }
    if(type == "sync-conflict") {
      SyncConflictMessage msg;
      static_cast<SyncEnvelope&>(msg) = envelope;
      msg.conflicts = list_field<ConflictFile>(data, "conflicts");
      return SyncMessage{std::move(msg)};
    }
    if(type == "sync-error") {
      SyncErrorMessage msg;
      static_cast<SyncEnvelope&>(msg) = envelope;
      msg.error = string_field(data, "error");
      if(msg.error.empty()) msg.error = "Unspecified sync error";
      return SyncMessage{std::move(msg)};
    }
  } catch(const std::exception& e) {
    error = "Malformed " + type + ": " + e.what();
    return std::nullopt;
  }
  error = "Unknown message type: " + type;
  return std::nullopt;
}

json serialize_sync_message(const SyncMessage& msg){
  json data = std::visit(overloaded{
    [](const SyncRequestMessage& m) {
      return json{{"folderName", m.folder_name},
                  {"direction", to_string(m.direction)},
                  {"conflictResolution", to_string(m.conflict_resolution)}};
    },
    [](const SyncMetadataMessage& m) {
      return json{{"files", m.files}};
    },
    [](const SyncFileMessage& m) {
      json d{{"path", m.path}, {"want", m.want}};
      if(!m.file_id.empty()) d["fileId"] = m.file_id;
      return d;
    },
    [](const SyncCompleteMessage& m) {
      return json{{"files", m.files},
                  {"filesAdded", m.files_added},
                  {"filesModified", m.files_modified},
                  {"filesDeleted", m.files_deleted},
                  {"bytesTransferred", m.bytes_transferred},
                  {"unresolvedConflicts", m.unresolved_conflicts}};
    },
    [](const SyncConflictMessage& m) {
      return json{{"conflicts", m.conflicts}};
    },
    [](const SyncErrorMessage& m) {
      return json{{"error", m.error}};
    },
  }, msg);

  const SyncEnvelope& envelope = std::visit([](const auto& m) -> const SyncEnvelope& { return m; }, msg);
  return json{{"type", message_type(msg)},
              {"syncId", envelope.sync_id},
              {"configId", envelope.config_id},
              {"data", std::move(data)}};
}
