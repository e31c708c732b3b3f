#pragma once

#include "sync_types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Logger;

// Sync configs, baselines, states and history under
// <workspace>/.config/sync/. Every write replaces the whole file.
class SyncStorage {
public:
  static constexpr std::size_t kMaxHistoryEntries = 200;

  explicit SyncStorage(std::filesystem::path workspace, std::shared_ptr<Logger> logger = nullptr);

  // Reads configs.json and history.json. A missing file is an empty list.
  bool load(std::string& error);

  std::optional<SyncConfig> create_config(const std::string& local_folder,
                                          const std::string& peer_id,
                                          const std::string& peer_name,
                                          const std::string& session_id,
                                          SyncDirection direction,
                                          ConflictResolution policy,
                                          std::string& error);
  std::vector<SyncConfig> configs() const;
  std::optional<SyncConfig> config(const std::string& id) const;
  bool update_config(const SyncConfig& config, std::string& error);
  // Drops the config together with its baseline and state.
  bool remove_config(const std::string& id, std::string& error);

  std::vector<FileSnapshot> load_snapshot(const std::string& config_id) const;
  bool save_snapshot(const std::string& config_id, const std::vector<FileSnapshot>& files, std::string& error);

  std::optional<SyncState> load_state(const std::string& config_id) const;
  bool save_state(const SyncState& state, std::string& error);

  // Newest last. An empty config_id returns every entry.
  std::vector<SyncHistoryEntry> history(const std::string& config_id = std::string()) const;
  bool append_history(const SyncHistoryEntry& entry, std::string& error);

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path snapshot_path(const std::string& config_id) const;
  std::filesystem::path state_path(const std::string& config_id) const;
  bool write_json(const std::filesystem::path& path, const nlohmann::json& doc, std::string& error) const;
  std::optional<nlohmann::json> read_json(const std::filesystem::path& path, std::string& error) const;
  bool persist_configs(std::string& error);

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::vector<SyncConfig> configs_;
  std::vector<SyncHistoryEntry> history_;
};
