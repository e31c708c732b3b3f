#pragma once

#include "hashing.hpp"
#include "sync_protocol.hpp"
#include "sync_storage.hpp"
#include "sync_types.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class Logger;

// Runs folder sync cycles over peer links. The side that calls start_sync
// drives every transfer; the other side answers with its snapshot, serves
// requested files and stores what it is sent.
//
//   initiator                          responder
//   sync-request        ------------>  scan
//                       <------------  sync-metadata
//   compare, plan, apply policy
//   [sync-conflict]     ------------>
//   sync-file + transfer ----------->  (per upload)
//   sync-file want      ------------>  transfer back (per download)
//   rescan, baseline
//   sync-complete       ------------>  rescan, baseline
class SyncCoordinator : public std::enable_shared_from_this<SyncCoordinator> {
public:
  using SendFn = std::function<bool(const std::string& peer_id, const nlohmann::json& message)>;
  using PeerOnlineFn = std::function<bool(const std::string& peer_id)>;
  using ProgressCallback = std::function<void(const SyncProgress& progress)>;
  using StateCallback = std::function<void(const SyncState& state)>;
  using FinishedCallback = std::function<void(const SyncConfig& config, const SyncHistoryEntry& entry)>;

  struct Options {
    std::chrono::milliseconds response_timeout{30000};
    std::size_t hash_chunk_size = kDefaultHashChunkSize;
    std::size_t worker_threads = 2;
  };

  SyncCoordinator(asio::io_context& io,
                  std::shared_ptr<SyncStorage> storage,
                  std::shared_ptr<TransferEngine> transfers,
                  SendFn send,
                  PeerOnlineFn peer_online,
                  Options options,
                  std::shared_ptr<Logger> logger);
  ~SyncCoordinator();

  void set_progress_callback(ProgressCallback cb) { progress_callback_ = std::move(cb); }
  void set_state_callback(StateCallback cb) { state_callback_ = std::move(cb); }
  void set_finished_callback(FinishedCallback cb) { finished_callback_ = std::move(cb); }

  // Any thread. False with a reason when the config is unknown, paused,
  // already syncing or its peer is offline.
  bool start_sync(const std::string& config_id, std::string& error);
  // Records per-path choices for the pending conflicts and runs a new cycle
  // that applies them.
  bool resolve_conflicts(const std::string& config_id,
                         const std::vector<ResolutionChoice>& resolutions,
                         std::string& error);
  bool cancel_sync(const std::string& config_id);

  // io thread.
  void handle_message(const std::string& peer_id, const SyncMessage& msg);
  void report_malformed(const std::string& peer_id, const nlohmann::json& raw, const std::string& error);
  void on_peer_disconnected(const std::string& peer_id);

  // Transfer engine hooks, io thread. destination_for returns nullopt for
  // transfers that do not belong to a running cycle.
  static bool is_sync_transfer(const TransferMetadata& metadata);
  std::optional<std::filesystem::path> destination_for(const std::string& peer_id, const TransferMetadata& metadata);
  void on_transfer_progress(const std::string& peer_id, TransferDirection direction, const TransferProgress& progress);
  void on_transfer_finished(const std::string& peer_id,
                            TransferDirection direction,
                            const TransferMetadata& metadata,
                            const TransferProgress& progress,
                            const std::filesystem::path& local_path);

  std::optional<SyncState> state(const std::string& config_id) const;
  bool is_syncing(const std::string& config_id) const;

  // Waits for background scans and hashing to finish.
  void shutdown();

private:
  enum class JobKind { Upload, Download };

  struct Job {
    JobKind kind = JobKind::Upload;
    FileSnapshot file;
    // Set when the upload is a renamed copy of a conflicting local file.
    std::optional<std::string> copy_from;
    bool is_new = false;
  };

  struct Run {
    explicit Run(asio::io_context& io) : timer(io) {}

    std::string sync_id;
    SyncConfig config;
    std::string peer_id;
    bool initiator = false;
    bool finished = false;
    int64_t started_at = 0;
    CancelToken cancel;
    asio::steady_timer timer;
    std::vector<ResolutionChoice> user_choices;

    std::vector<FileSnapshot> local;
    std::vector<FileSnapshot> remote;
    std::vector<ConflictFile> unresolved;
    std::deque<Job> jobs;
    std::optional<Job> current;
    std::string current_file_id;

    std::size_t total_files = 0;
    uint64_t total_bytes = 0;
    std::size_t files_done = 0;
    std::size_t files_added = 0;
    std::size_t files_modified = 0;
    std::size_t files_deleted = 0;
    uint64_t bytes_done = 0;
  };

  using RunPtr = std::shared_ptr<Run>;
  using ScanDone = std::function<void(std::optional<std::vector<FileSnapshot>> files, std::string error)>;

  RunPtr find_run_by_sync_id(const std::string& sync_id) const;
  RunPtr find_run_by_file(const std::string& file_id) const;
  std::optional<SyncConfig> config_for_request(const std::string& peer_id, const SyncRequestMessage& msg) const;

  void scan(const RunPtr& run, ScanDone done);
  void arm_timer(const RunPtr& run, const std::string& reason);

  void on_request(const std::string& peer_id, const SyncRequestMessage& msg);
  void on_metadata(const RunPtr& run, const SyncMetadataMessage& msg);
  void on_file(const RunPtr& run, const SyncFileMessage& msg);
  void on_conflict(const RunPtr& run, const SyncConflictMessage& msg);
  void on_complete(const RunPtr& run, const SyncCompleteMessage& msg);

  void plan(const RunPtr& run);
  void next_job(const RunPtr& run);
  void serve_file(const RunPtr& run, const std::string& path);
  void finalize(const RunPtr& run);
  // Rescans, merges with the other side and stores the stamped baseline.
  void rebuild_baseline(const RunPtr& run, std::vector<FileSnapshot> other_side, ScanDone done);
  void fail(const RunPtr& run, const std::string& reason, bool notify_peer, SyncStatus status = SyncStatus::Error);
  void complete(const RunPtr& run, SyncOutcome outcome, SyncStatus status, const std::string& error);

  void update_state(const std::string& config_id, const std::function<void(SyncState&)>& mutate);
  void emit_progress(const RunPtr& run, SyncPhase phase, uint64_t in_flight = 0, double speed = 0.0);
  void send(const std::string& peer_id, const SyncMessage& msg);
  nlohmann::json transfer_context(const RunPtr& run, const FileSnapshot& file) const;

  asio::io_context& io_;
  std::shared_ptr<SyncStorage> storage_;
  std::shared_ptr<TransferEngine> transfers_;
  SendFn send_;
  PeerOnlineFn peer_online_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::thread_pool workers_;

  mutable std::mutex m_;
  // Held across mutate and save so states_ and states/<id>.json agree.
  std::mutex state_save_m_;
  std::unordered_map<std::string, RunPtr> runs_;  // by config id
  std::unordered_map<std::string, SyncState> states_;
  std::unordered_map<std::string, std::vector<ResolutionChoice>> pending_choices_;

  ProgressCallback progress_callback_;
  StateCallback state_callback_;
  FinishedCallback finished_callback_;
};
