#include "sync_storage.hpp"

#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Config ids end up in file names.
bool is_safe_config_id(const std::string& id) {
  if(id.empty() || id.size() > 64) return false;
  return std::all_of(id.begin(), id.end(), [](unsigned char ch){
    return std::isalnum(ch) || ch == '-' || ch == '_';
  });
}

} // namespace

SyncStorage::SyncStorage(fs::path workspace, std::shared_ptr<Logger> logger)
  : root_(std::move(workspace) / ".config" / "sync"),
    logger_(std::move(logger)) {}

bool SyncStorage::load(std::string& error){
  std::vector<SyncConfig> configs;
  std::vector<SyncHistoryEntry> history;
  try {
    if(auto doc = read_json(root_ / "configs.json", error)) {
      if(!doc->is_array()) {
        error = "configs.json is not a list";
        return false;
      }
      configs = doc->get<std::vector<SyncConfig>>();
    } else if(!error.empty()) {
      return false;
    }
    if(auto doc = read_json(root_ / "history.json", error)) {
      if(doc->is_array()) history = doc->get<std::vector<SyncHistoryEntry>>();
    } else if(!error.empty()) {
      return false;
    }
  } catch(const std::exception& e) {
    error = std::string("Invalid sync storage: ") + e.what();
    return false;
  }
  std::lock_guard<std::mutex> lock(m_);
  configs_ = std::move(configs);
  history_ = std::move(history);
  log_debug(logger_.get(), "Loaded {} sync configs from {}", configs_.size(), root_.string());
  return true;
}

std::optional<SyncConfig> SyncStorage::create_config(const std::string& local_folder,
                                                     const std::string& peer_id,
                                                     const std::string& peer_name,
                                                     const std::string& session_id,
                                                     SyncDirection direction,
                                                     ConflictResolution policy,
                                                     std::string& error){
  std::error_code ec;
  fs::path folder = fs::absolute(local_folder, ec);
  if(ec || !fs::is_directory(folder, ec)) {
    error = "Not a directory: " + local_folder;
    return std::nullopt;
  }
  if(peer_id.empty()) {
    error = "Peer id required";
    return std::nullopt;
  }
  folder = folder.lexically_normal();
  std::string folder_name = folder.filename().string();
  if(folder_name.empty()) folder_name = folder.parent_path().filename().string();

  SyncConfig config;
  config.id = "sync-" + std::to_string(now_ms()) + "-" + random_token(9, "abcdefghijklmnopqrstuvwxyz0123456789");
  config.local_folder = folder.string();
  config.local_folder_name = folder_name;
  config.peer_id = peer_id;
  config.peer_name = peer_name;
  config.session_id = session_id;
  config.direction = direction;
  config.conflict_resolution = policy;
  config.created_at = now_ms();
  config.is_active = true;

  std::lock_guard<std::mutex> lock(m_);
  configs_.push_back(config);
  if(!persist_configs(error)) {
    configs_.pop_back();
    return std::nullopt;
  }
  log_info(logger_.get(), "Created sync config {} for {} with {}", config.id, config.local_folder, peer_id);
  return config;
}

std::vector<SyncConfig> SyncStorage::configs() const {
  std::lock_guard<std::mutex> lock(m_);
  return configs_;
}

std::optional<SyncConfig> SyncStorage::config(const std::string& id) const {
  std::lock_guard<std::mutex> lock(m_);
  for(const auto& config : configs_) {
    if(config.id == id) return config;
  }
  return std::nullopt;
}

bool SyncStorage::update_config(const SyncConfig& config, std::string& error){
  std::lock_guard<std::mutex> lock(m_);
  auto it = std::find_if(configs_.begin(), configs_.end(), [&](const SyncConfig& c){ return c.id == config.id; });
  if(it == configs_.end()) {
    error = "Unknown sync config: " + config.id;
    return false;
  }
  SyncConfig previous = *it;
  *it = config;
  if(!persist_configs(error)) {
    *it = previous;
    return false;
  }
  return true;
}

bool SyncStorage::remove_config(const std::string& id, std::string& error){
  std::lock_guard<std::mutex> lock(m_);
  auto it = std::find_if(configs_.begin(), configs_.end(), [&](const SyncConfig& c){ return c.id == id; });
  if(it == configs_.end()) {
    error = "Unknown sync config: " + id;
    return false;
  }
  SyncConfig removed = *it;
  configs_.erase(it);
  if(!persist_configs(error)) {
    configs_.push_back(removed);
    return false;
  }
  std::error_code ec;
  fs::remove(snapshot_path(id), ec);
  fs::remove(state_path(id), ec);
  log_info(logger_.get(), "Removed sync config {}", id);
  return true;
}

std::vector<FileSnapshot> SyncStorage::load_snapshot(const std::string& config_id) const {
  if(!is_safe_config_id(config_id)) return {};
  std::string error;
  auto doc = read_json(snapshot_path(config_id), error);
  if(!doc) {
    if(!error.empty()) log_warn(logger_.get(), "Ignoring baseline of {}: {}", config_id, error);
    return {};
  }
  try {
    return doc->get<std::vector<FileSnapshot>>();
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Ignoring baseline of {}: {}", config_id, e.what());
    return {};
  }
}

bool SyncStorage::save_snapshot(const std::string& config_id,
                                const std::vector<FileSnapshot>& files,
                                std::string& error){
  if(!is_safe_config_id(config_id)) {
    error = "Invalid config id: " + config_id;
    return false;
  }
  return write_json(snapshot_path(config_id), json(files), error);
}

std::optional<SyncState> SyncStorage::load_state(const std::string& config_id) const {
  if(!is_safe_config_id(config_id)) return std::nullopt;
  std::string error;
  auto doc = read_json(state_path(config_id), error);
  if(!doc) return std::nullopt;
  try {
    return doc->get<SyncState>();
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Ignoring state of {}: {}", config_id, e.what());
    return std::nullopt;
  }
}

bool SyncStorage::save_state(const SyncState& state, std::string& error){
  if(!is_safe_config_id(state.config_id)) {
    error = "Invalid config id: " + state.config_id;
    return false;
  }
  return write_json(state_path(state.config_id), json(state), error);
}

std::vector<SyncHistoryEntry> SyncStorage::history(const std::string& config_id) const {
  std::lock_guard<std::mutex> lock(m_);
  if(config_id.empty()) return history_;
  std::vector<SyncHistoryEntry> out;
  for(const auto& entry : history_) {
    if(entry.config_id == config_id) out.push_back(entry);
  }
  return out;
}

bool SyncStorage::append_history(const SyncHistoryEntry& entry, std::string& error){
  std::lock_guard<std::mutex> lock(m_);
  history_.push_back(entry);
  if(history_.size() > kMaxHistoryEntries) {
    history_.erase(history_.begin(), history_.end() - static_cast<std::ptrdiff_t>(kMaxHistoryEntries));
  }
  return write_json(root_ / "history.json", json(history_), error);
}

fs::path SyncStorage::snapshot_path(const std::string& config_id) const {
  return root_ / "snapshots" / (config_id + ".json");
}

fs::path SyncStorage::state_path(const std::string& config_id) const {
  return root_ / "states" / (config_id + ".json");
}

bool SyncStorage::persist_configs(std::string& error){
  return write_json(root_ / "configs.json", json(configs_), error);
}

bool SyncStorage::write_json(const fs::path& path, const json& doc, std::string& error) const {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if(ec) {
    error = "Unable to create " + path.parent_path().string() + ": " + ec.message();
    return false;
  }
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      error = "Unable to write " + tmp.string();
      return false;
    }
    out << doc.dump(2);
    if(!out) {
      error = "Unable to write " + tmp.string();
      return false;
    }
  }
  fs::rename(tmp, path, ec);
  if(ec) {
    error = "Unable to replace " + path.string() + ": " + ec.message();
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

std::optional<json> SyncStorage::read_json(const fs::path& path, std::string& error) const {
  error.clear();
  std::ifstream in(path);
  if(!in) return std::nullopt;
  try {
    json doc;
    in >> doc;
    return doc;
  } catch(const std::exception& e) {
    error = "Failed to parse " + path.string() + ": " + e.what();
    return std::nullopt;
  }
}
