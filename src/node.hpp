#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "peer_manager.hpp"
#include "server_warmup.hpp"
#include "signaling_client.hpp"
#include "sync_types.hpp"
#include "transfer_types.hpp"

class NodeCli;
class SettingsManager;
class SyncCoordinator;
class SyncStorage;
class TcpPeerTransportFactory;
class TransferEngine;

// One wingsync peer: relay link, direct peer links, file transfers and folder
// sync, all driven by a single io_context.
class Node {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool start_cli_thread = false;
    WarmupTiming warmup;
    std::chrono::milliseconds sync_response_timeout{30000};
  };

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t connected_peers = 0;
    std::size_t active_transfers = 0;
    std::size_t sync_configs = 0;
    std::size_t syncing = 0;
  };

  Node(std::shared_ptr<SettingsManager> settings, Options options);
  ~Node();

  // Throws std::runtime_error for unusable settings.
  void start();
  void run();
  void start_background();
  void stop();
  // Safe from any thread, including the console.
  void request_shutdown();

  void execute_command(const std::string& line);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  asio::io_context& io_context() { return io_; }

  LogListenerHandle add_log_listener(Logger::Listener listener);
  void remove_log_listener(LogListenerHandle handle);

  Stats stats() const;
  WarmupStatus warmup_status() const;
  SignalingClient::State signaling_state() const;

  const std::string& peer_id() const { return peer_id_; }
  const std::string& display_name() const { return display_name_; }
  const std::string& session_id() const { return session_id_; }
  const std::string& signaling_url() const { return signaling_url_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }
  std::filesystem::path received_dir() const { return options_.workspace_root / "received"; }

  // Peers
  std::vector<PeerInfo> peers() const;
  bool connect_peer(const std::string& peer_id, std::string& error);
  void disconnect_peer(const std::string& peer_id);

  // Transfers. send_file hashes on the calling thread.
  std::optional<std::string> send_file(const std::string& peer_id,
                                       const std::filesystem::path& path,
                                       std::string& error);
  std::vector<TransferProgress> transfers() const;
  bool cancel_transfer(const std::string& file_id);

  // Folder sync
  std::optional<SyncConfig> add_sync(const std::string& folder,
                                     const std::string& peer_id,
                                     SyncDirection direction,
                                     ConflictResolution policy,
                                     std::string& error);
  std::vector<SyncConfig> sync_configs() const;
  bool run_sync(const std::string& config_id, std::string& error);
  bool remove_sync(const std::string& config_id, std::string& error);
  bool set_sync_active(const std::string& config_id, bool active, std::string& error);
  std::optional<SyncState> sync_state(const std::string& config_id) const;
  std::vector<SyncHistoryEntry> sync_history(const std::string& config_id = std::string()) const;
  bool resolve_conflicts(const std::string& config_id,
                         const std::vector<ResolutionChoice>& resolutions,
                         std::string& error);

private:
  void ensure_workspace() const;
  void wire_callbacks();
  void route_peer_message(const std::string& peer_id, const nlohmann::json& message);
  void on_peer_state(const std::string& peer_id, ConnectionState state, const std::string& reason);
  std::optional<std::filesystem::path> destination_for(const std::string& peer_id, const TransferMetadata& metadata);
  void schedule_sync_tick();
  void run_scheduled_syncs();
  void start_cli();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::steady_timer> sync_timer_;

  std::shared_ptr<ServerWarmup> warmup_;
  std::shared_ptr<SignalingClient> signaling_;
  std::shared_ptr<TcpPeerTransportFactory> transport_factory_;
  std::shared_ptr<PeerManager> peer_manager_;
  std::shared_ptr<TransferEngine> transfers_;
  std::shared_ptr<SyncStorage> storage_;
  std::shared_ptr<SyncCoordinator> coordinator_;
  std::unique_ptr<NodeCli> cli_;

  std::atomic<bool> started_{false};
  bool cli_thread_running_ = false;
  std::string peer_id_;
  std::string display_name_;
  std::string session_id_;
  std::string signaling_url_;
  std::chrono::seconds sync_interval_{0};
  std::atomic<WarmupStatus> warmup_status_{WarmupStatus::Idle};
};
