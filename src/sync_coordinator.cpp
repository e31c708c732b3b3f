#include "sync_coordinator.hpp"

#include "folder_scanner.hpp"
#include "log.hpp"
#include "sync_engine.hpp"

#include <algorithm>
#include <limits>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string new_sync_id() {
  return "run-" + std::to_string(now_ms()) + "-" + random_token(6, "abcdefghijklmnopqrstuvwxyz0123456789");
}

std::string context_string(const json& context, const char* key) {
  auto it = context.find(key);
  if(it == context.end() || !it->is_string()) return std::string();
  return it->get<std::string>();
}

int64_t context_int(const json& context, const char* key) {
  auto it = context.find(key);
  if(it == context.end() || !it->is_number_integer()) return 0;
  return it->get<int64_t>();
}

std::unordered_map<std::string, const FileSnapshot*> by_path(const std::vector<FileSnapshot>& files) {
  std::unordered_map<std::string, const FileSnapshot*> index;
  for(const auto& file : files) index[file.path] = &file;
  return index;
}

// Paths still in dispute keep their previous baseline entry so the next
// cycle sees the same conflict; everything else is stamped as synced now.
std::vector<FileSnapshot> stamp_baseline(const std::string& config_id,
                                         const std::vector<FileSnapshot>& rescanned,
                                         const std::vector<FileSnapshot>& other_side,
                                         const std::vector<FileSnapshot>& previous,
                                         const std::unordered_set<std::string>& disputed,
                                         int64_t now) {
  auto previous_index = by_path(previous);
  std::vector<FileSnapshot> baseline;
  for(auto& file : merge_snapshots(rescanned, other_side)) {
    if(disputed.count(file.path)) {
      auto it = previous_index.find(file.path);
      if(it != previous_index.end()) baseline.push_back(*it->second);
      continue;
    }
    file.synced_at = now;
    file.config_id = config_id;
    baseline.push_back(std::move(file));
  }
  return baseline;
}

} // namespace

SyncCoordinator::SyncCoordinator(asio::io_context& io,
                                 std::shared_ptr<SyncStorage> storage,
                                 std::shared_ptr<TransferEngine> transfers,
                                 SendFn send,
                                 PeerOnlineFn peer_online,
                                 Options options,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    storage_(std::move(storage)),
    transfers_(std::move(transfers)),
    send_(std::move(send)),
    peer_online_(std::move(peer_online)),
    options_(options),
    logger_(std::move(logger)),
    workers_(std::max<std::size_t>(1, options.worker_threads)) {}

SyncCoordinator::~SyncCoordinator(){
  shutdown();
}

void SyncCoordinator::shutdown(){
  {
    std::lock_guard<std::mutex> lock(m_);
    for(auto& [id, run] : runs_) run->cancel.cancel();
  }
  workers_.join();
}

bool SyncCoordinator::is_sync_transfer(const TransferMetadata& metadata){
  return !context_string(metadata.context, "syncId").empty();
}

bool SyncCoordinator::start_sync(const std::string& config_id, std::string& error){
  auto config = storage_->config(config_id);
  if(!config) {
    error = "Unknown sync config: " + config_id;
    return false;
  }
  if(!config->is_active) {
    error = "Sync config " + config_id + " is paused";
    return false;
  }
  if(is_syncing(config_id)) {
    error = "Sync already in progress for " + config_id;
    return false;
  }
  if(peer_online_ && !peer_online_(config->peer_id)) {
    error = "Peer " + config->peer_id + " is offline";
    update_state(config_id, [&](SyncState& s){
      s.status = SyncStatus::Offline;
      s.error = error;
      s.last_checked_at = now_ms();
    });
    return false;
  }

  auto run = std::make_shared<Run>(io_);
  run->sync_id = new_sync_id();
  run->config = *config;
  run->peer_id = config->peer_id;
  run->initiator = true;
  run->started_at = now_ms();
  {
    std::lock_guard<std::mutex> lock(m_);
    if(runs_.count(config_id)) {
      error = "Sync already in progress for " + config_id;
      return false;
    }
    auto choices = pending_choices_.find(config_id);
    if(choices != pending_choices_.end()) {
      run->user_choices = std::move(choices->second);
      pending_choices_.erase(choices);
    }
    runs_[config_id] = run;
  }

  log_info(logger_.get(), "Sync {} started: {} <-> {}", run->sync_id, config->local_folder, config->peer_id);
  update_state(config_id, [](SyncState& s){
    s.status = SyncStatus::Syncing;
    s.error.reset();
  });

  auto self = shared_from_this();
  asio::post(io_, [self, run]{
    self->emit_progress(run, SyncPhase::Scanning);
    self->scan(run, [self, run](std::optional<std::vector<FileSnapshot>> files, std::string scan_error){
      if(run->finished) return;
      if(!files) {
        self->fail(run, scan_error, false);
        return;
      }
      run->local = std::move(*files);
      SyncRequestMessage request;
      request.sync_id = run->sync_id;
      request.config_id = run->config.id;
      request.folder_name = run->config.local_folder_name;
      request.direction = run->config.direction;
      request.conflict_resolution = run->config.conflict_resolution;
      self->send(run->peer_id, request);
      self->arm_timer(run, "Peer did not answer the sync request");
    });
  });
  return true;
}

bool SyncCoordinator::resolve_conflicts(const std::string& config_id,
                                        const std::vector<ResolutionChoice>& resolutions,
                                        std::string& error){
  auto current = state(config_id);
  if(!current || current->pending_changes.conflicts.empty()) {
    error = "No pending conflicts for " + config_id;
    return false;
  }
  std::unordered_set<std::string> disputed;
  for(const auto& conflict : current->pending_changes.conflicts) disputed.insert(conflict.path);
  for(const auto& choice : resolutions) {
    if(!disputed.count(choice.path)) {
      error = "No conflict on " + choice.path;
      return false;
    }
  }
  {
    std::lock_guard<std::mutex> lock(m_);
    auto& stored = pending_choices_[config_id];
    for(const auto& choice : resolutions) {
      auto it = std::find_if(stored.begin(), stored.end(), [&](const ResolutionChoice& c){ return c.path == choice.path; });
      if(it != stored.end()) {
        it->action = choice.action;
      } else {
        stored.push_back(choice);
      }
    }
  }
  return start_sync(config_id, error);
}

bool SyncCoordinator::cancel_sync(const std::string& config_id){
  RunPtr run;
  {
    std::lock_guard<std::mutex> lock(m_);
    auto it = runs_.find(config_id);
    if(it == runs_.end()) return false;
    run = it->second;
  }
  run->cancel.cancel();
  auto self = shared_from_this();
  asio::post(io_, [self, run]{
    if(run->finished) return;
    if(!run->current_file_id.empty()) self->transfers_->cancel(run->current_file_id, "sync cancelled");
    SyncErrorMessage notice;
    notice.sync_id = run->sync_id;
    notice.config_id = run->config.id;
    notice.error = "Sync cancelled";
    self->send(run->peer_id, notice);
    self->complete(run, SyncOutcome::Cancelled, SyncStatus::OutOfSync, "Sync cancelled");
  });
  return true;
}

void SyncCoordinator::handle_message(const std::string& peer_id, const SyncMessage& msg){
  if(const auto* request = std::get_if<SyncRequestMessage>(&msg)) {
    on_request(peer_id, *request);
    return;
  }
  const SyncEnvelope& envelope = std::visit([](const auto& m) -> const SyncEnvelope& { return m; }, msg);
  auto run = find_run_by_sync_id(envelope.sync_id);
  if(!run || run->finished || run->peer_id != peer_id) {
    log_debug(logger_.get(), "Ignoring {} for unknown sync {}", message_type(msg), envelope.sync_id);
    return;
  }
  std::visit(overloaded{
    [](const SyncRequestMessage&) {},
    [&](const SyncMetadataMessage& m) { on_metadata(run, m); },
    [&](const SyncFileMessage& m) { on_file(run, m); },
    [&](const SyncCompleteMessage& m) { on_complete(run, m); },
    [&](const SyncConflictMessage& m) { on_conflict(run, m); },
    [&](const SyncErrorMessage& m) { fail(run, "Peer reported: " + m.error, false); },
  }, msg);
}

void SyncCoordinator::report_malformed(const std::string& peer_id, const json& raw, const std::string& error){
  log_warn(logger_.get(), "Malformed sync message from {}: {}", peer_id, error);
  if(raw.is_object() && context_string(raw, "type") == "sync-error") return;
  SyncErrorMessage reply;
  reply.sync_id = raw.is_object() ? context_string(raw, "syncId") : std::string();
  if(reply.sync_id.empty()) reply.sync_id = "unknown";
  reply.error = error;
  send(peer_id, reply);
}

void SyncCoordinator::on_peer_disconnected(const std::string& peer_id){
  std::vector<RunPtr> affected;
  {
    std::lock_guard<std::mutex> lock(m_);
    for(const auto& [id, run] : runs_) {
      if(run->peer_id == peer_id) affected.push_back(run);
    }
  }
  for(const auto& run : affected) fail(run, "Peer disconnected", false, SyncStatus::Offline);
}

void SyncCoordinator::on_request(const std::string& peer_id, const SyncRequestMessage& msg){
  auto reject = [&](const std::string& reason){
    log_warn(logger_.get(), "Rejecting sync {} from {}: {}", msg.sync_id, peer_id, reason);
    SyncErrorMessage reply;
    reply.sync_id = msg.sync_id;
    reply.config_id = msg.config_id;
    reply.error = reason;
    send(peer_id, reply);
  };
  if(find_run_by_sync_id(msg.sync_id)) return;
  auto config = config_for_request(peer_id, msg);
  if(!config) {
    reject("No sync configured for this peer");
    return;
  }

  auto run = std::make_shared<Run>(io_);
  run->sync_id = msg.sync_id;
  run->config = *config;
  run->peer_id = peer_id;
  run->initiator = false;
  run->started_at = now_ms();
  bool busy = false;
  {
    std::lock_guard<std::mutex> lock(m_);
    busy = runs_.count(config->id) > 0;
    if(!busy) runs_[config->id] = run;
  }
  if(busy) {
    reject("Sync already in progress");
    return;
  }

  log_info(logger_.get(), "Sync {} requested by {} for {}", msg.sync_id, peer_id, config->local_folder);
  update_state(config->id, [](SyncState& s){
    s.status = SyncStatus::Syncing;
    s.error.reset();
  });
  emit_progress(run, SyncPhase::Scanning);
  auto self = shared_from_this();
  scan(run, [self, run](std::optional<std::vector<FileSnapshot>> files, std::string scan_error){
    if(run->finished) return;
    if(!files) {
      self->fail(run, scan_error, true);
      return;
    }
    run->local = std::move(*files);
    SyncMetadataMessage reply;
    reply.sync_id = run->sync_id;
    reply.config_id = run->config.id;
    reply.files = run->local;
    self->send(run->peer_id, reply);
    self->update_state(run->config.id, [&](SyncState& s){
      s.local_snapshot = run->local;
      s.last_checked_at = now_ms();
    });
  });
}

void SyncCoordinator::on_metadata(const RunPtr& run, const SyncMetadataMessage& msg){
  if(!run->initiator) return;
  run->timer.cancel();
  run->remote = msg.files;
  plan(run);
}

void SyncCoordinator::plan(const RunPtr& run){
  emit_progress(run, SyncPhase::Comparing);
  const SyncConfig& config = run->config;
  const SyncDiff diff = compare_snapshots(run->local, run->remote);
  const SyncPlan base = calculate_sync_plan(diff, config.direction);
  auto local_index = by_path(run->local);
  auto remote_index = by_path(run->remote);

  std::unordered_set<std::string> new_paths;
  for(const auto& file : diff.local_only) new_paths.insert(file.path);
  for(const auto& file : diff.remote_only) new_paths.insert(file.path);

  std::unordered_map<std::string, ResolutionAction> chosen;
  for(const auto& choice : resolutions_for_policy(base.conflicts, config.conflict_resolution)) {
    chosen[choice.path] = choice.action;
  }
  for(const auto& choice : run->user_choices) chosen[choice.path] = choice.action;
  std::vector<ResolutionChoice> choices;
  choices.reserve(chosen.size());
  for(const auto& [path, action] : chosen) choices.push_back(ResolutionChoice{path, action});

  const int64_t now = now_ms();
  const SyncPlan resolved = apply_conflict_resolutions(base.conflicts, choices, now);
  std::unordered_map<std::string, std::string> copies;
  for(const auto& conflict : base.conflicts) {
    auto it = chosen.find(conflict.path);
    if(it != chosen.end() && it->second == ResolutionAction::Both) {
      copies[conflict_copy_path(conflict.local.path, "local", now)] = conflict.local.path;
    }
  }

  auto push = [&](JobKind kind, const FileSnapshot& file){
    Job job;
    job.kind = kind;
    job.file = file;
    job.is_new = new_paths.count(file.path) > 0;
    if(kind == JobKind::Upload) {
      auto copy = copies.find(file.path);
      if(copy != copies.end()) {
        job.copy_from = copy->second;
        job.is_new = true;
      }
    }
    run->total_bytes += file.size;
    run->jobs.push_back(std::move(job));
  };

  // A modified entry travels from whichever side holds the newer version;
  // one-way configs always keep their own side authoritative.
  for(const auto& file : base.upload) {
    auto remote = remote_index.find(file.path);
    auto local = local_index.find(file.path);
    const bool remote_newer = config.direction == SyncDirection::Bidirectional
      && remote != remote_index.end() && local != local_index.end()
      && *remote->second == file && local->second->hash != file.hash;
    if(remote_newer) {
      push(JobKind::Download, file);
    } else {
      push(JobKind::Upload, local != local_index.end() ? *local->second : file);
    }
  }
  for(const auto& file : base.download) {
    auto remote = remote_index.find(file.path);
    push(JobKind::Download, remote != remote_index.end() ? *remote->second : file);
  }
  // Resolved conflicts run whatever the direction. Uploads go first so a
  // "both" copy exists before the remote version replaces the original.
  for(const auto& file : resolved.upload) push(JobKind::Upload, file);
  for(const auto& file : resolved.download) push(JobKind::Download, file);
  run->unresolved = resolved.conflicts;
  run->total_files = run->jobs.size();

  std::vector<FileSnapshot> pending_local;
  std::vector<FileSnapshot> pending_remote;
  for(const auto& job : run->jobs) {
    if(job.kind == JobKind::Upload) pending_local.push_back(job.file);
    if(job.kind == JobKind::Download) pending_remote.push_back(job.file);
  }
  log_info(logger_.get(), "Sync {}: {} to upload, {} to download, {} unresolved",
           run->sync_id, pending_local.size(), pending_remote.size(), run->unresolved.size());
  update_state(config.id, [&](SyncState& s){
    s.local_snapshot = run->local;
    s.remote_snapshot = run->remote;
    s.last_checked_at = now;
    s.pending_changes.local = std::move(pending_local);
    s.pending_changes.remote = std::move(pending_remote);
    s.pending_changes.conflicts = run->unresolved;
  });

  if(!run->unresolved.empty()) {
    SyncConflictMessage notice;
    notice.sync_id = run->sync_id;
    notice.config_id = config.id;
    notice.conflicts = run->unresolved;
    send(run->peer_id, notice);
  }
  next_job(run);
}

void SyncCoordinator::next_job(const RunPtr& run){
  if(run->finished || run->cancel.cancelled()) return;
  run->current_file_id.clear();
  if(run->jobs.empty()) {
    run->current.reset();
    finalize(run);
    return;
  }
  run->current = std::move(run->jobs.front());
  run->jobs.pop_front();
  const Job job = *run->current;
  const fs::path root = run->config.local_folder;
  emit_progress(run, SyncPhase::Transferring);
  auto self = shared_from_this();

  switch(job.kind) {
    case JobKind::Download: {
      SyncFileMessage want;
      want.sync_id = run->sync_id;
      want.config_id = run->config.id;
      want.path = job.file.path;
      want.want = true;
      send(run->peer_id, want);
      arm_timer(run, "Peer did not send " + job.file.path);
      return;
    }
    case JobKind::Upload: {
      SyncFileMessage announce;
      announce.sync_id = run->sync_id;
      announce.config_id = run->config.id;
      announce.path = job.file.path;
      send(run->peer_id, announce);
      json context = transfer_context(run, job.file);
      asio::post(workers_, [self, run, job, context, root]{
        std::string error;
        const fs::path source = root / job.file.path;
        if(job.copy_from) {
          std::error_code ec;
          fs::copy_file(root / *job.copy_from, source, fs::copy_options::overwrite_existing, ec);
          if(ec) {
            error = "Unable to copy " + *job.copy_from + ": " + ec.message();
          } else if(!set_file_mtime_ms(source, job.file.last_modified, error)) {
            log_warn(self->logger_.get(), "{}", error);
            error.clear();
          }
        }
        std::optional<std::string> file_id;
        if(error.empty()) file_id = self->transfers_->send_file(run->peer_id, source, job.file.path, context, error);
        const std::string path = job.file.path;
        asio::post(self->io_, [self, run, file_id, error, path]{
          if(run->finished) return;
          if(!file_id) {
            self->fail(run, error, true);
            return;
          }
          if(run->current && run->current->file.path == path && run->current_file_id.empty()) {
            run->current_file_id = *file_id;
          }
        });
      });
      return;
    }
  }
}

void SyncCoordinator::on_file(const RunPtr& run, const SyncFileMessage& msg){
  if(run->initiator) return;
  if(msg.want) {
    serve_file(run, msg.path);
  } else {
    log_debug(logger_.get(), "Sync {}: expecting {}", run->sync_id, msg.path);
  }
}

void SyncCoordinator::serve_file(const RunPtr& run, const std::string& path){
  auto index = by_path(run->local);
  auto it = index.find(path);
  if(it == index.end()) {
    fail(run, "Requested file is not part of this folder: " + path, true);
    return;
  }
  const FileSnapshot file = *it->second;
  json context = transfer_context(run, file);
  const fs::path source = fs::path(run->config.local_folder) / path;
  auto self = shared_from_this();
  asio::post(workers_, [self, run, file, context, source]{
    std::string error;
    auto file_id = self->transfers_->send_file(run->peer_id, source, file.path, context, error);
    if(file_id) return;
    asio::post(self->io_, [self, run, error, path = file.path]{
      if(!run->finished) self->fail(run, "Unable to send " + path + ": " + error, true);
    });
  });
}

void SyncCoordinator::on_conflict(const RunPtr& run, const SyncConflictMessage& msg){
  if(run->initiator) return;
  run->unresolved.clear();
  for(const auto& conflict : msg.conflicts) {
    ConflictFile mine;
    mine.path = conflict.path;
    mine.local = conflict.remote;
    mine.remote = conflict.local;
    run->unresolved.push_back(std::move(mine));
  }
  log_warn(logger_.get(), "Sync {}: {} conflicts left for manual resolution", run->sync_id, run->unresolved.size());
  update_state(run->config.id, [&](SyncState& s){
    s.pending_changes.conflicts = run->unresolved;
  });
}

void SyncCoordinator::on_complete(const RunPtr& run, const SyncCompleteMessage& msg){
  if(run->initiator) return;
  emit_progress(run, SyncPhase::Finalizing);
  run->files_added = msg.files_added;
  run->files_modified = msg.files_modified;
  run->files_deleted = msg.files_deleted;
  run->bytes_done = msg.bytes_transferred;
  run->remote = msg.files;
  auto self = shared_from_this();
  rebuild_baseline(run, msg.files, [self, run](std::optional<std::vector<FileSnapshot>> baseline, std::string error){
    if(run->finished) return;
    if(!baseline) {
      self->complete(run, SyncOutcome::Error, SyncStatus::Error, error);
      return;
    }
    run->local = std::move(*baseline);
    self->complete(run, SyncOutcome::Success,
                   run->unresolved.empty() ? SyncStatus::Synced : SyncStatus::Conflict, std::string());
  });
}

void SyncCoordinator::finalize(const RunPtr& run){
  emit_progress(run, SyncPhase::Finalizing);
  auto self = shared_from_this();
  rebuild_baseline(run, run->remote, [self, run](std::optional<std::vector<FileSnapshot>> baseline, std::string error){
    if(run->finished) return;
    if(!baseline) {
      self->fail(run, error, true);
      return;
    }
    run->local = std::move(*baseline);
    SyncCompleteMessage done;
    done.sync_id = run->sync_id;
    done.config_id = run->config.id;
    done.files = run->local;
    done.files_added = run->files_added;
    done.files_modified = run->files_modified;
    done.files_deleted = run->files_deleted;
    done.bytes_transferred = run->bytes_done;
    done.unresolved_conflicts = run->unresolved.size();
    self->send(run->peer_id, done);
    self->complete(run, SyncOutcome::Success,
                   run->unresolved.empty() ? SyncStatus::Synced : SyncStatus::Conflict, std::string());
  });
}

void SyncCoordinator::rebuild_baseline(const RunPtr& run, std::vector<FileSnapshot> other_side, ScanDone done){
  std::unordered_set<std::string> disputed;
  for(const auto& conflict : run->unresolved) disputed.insert(conflict.path);
  auto self = shared_from_this();
  asio::post(workers_, [self, run, other_side = std::move(other_side), disputed = std::move(disputed), done = std::move(done)]{
    std::string error;
    const auto previous = self->storage_->load_snapshot(run->config.id);
    ScanOptions scan_options;
    scan_options.hash_chunk_size = self->options_.hash_chunk_size;
    scan_options.cancel = run->cancel;
    auto files = scan_folder(run->config.local_folder, run->config.id, previous, error, self->logger_.get(), scan_options);
    std::optional<std::vector<FileSnapshot>> baseline;
    if(files) {
      auto stamped = stamp_baseline(run->config.id, *files, other_side, previous, disputed, now_ms());
      if(self->storage_->save_snapshot(run->config.id, stamped, error)) baseline = std::move(stamped);
    }
    asio::post(self->io_, [done, baseline = std::move(baseline), error]() mutable {
      done(std::move(baseline), error);
    });
  });
}

void SyncCoordinator::scan(const RunPtr& run, ScanDone done){
  auto self = shared_from_this();
  asio::post(workers_, [self, run, done = std::move(done)]{
    std::string error;
    const auto previous = self->storage_->load_snapshot(run->config.id);
    ScanOptions scan_options;
    scan_options.hash_chunk_size = self->options_.hash_chunk_size;
    scan_options.cancel = run->cancel;
    auto files = scan_folder(run->config.local_folder, run->config.id, previous, error, self->logger_.get(), scan_options);
    asio::post(self->io_, [done, files = std::move(files), error]() mutable {
      done(std::move(files), error);
    });
  });
}

void SyncCoordinator::arm_timer(const RunPtr& run, const std::string& reason){
  run->timer.expires_after(options_.response_timeout);
  std::weak_ptr<SyncCoordinator> weak = shared_from_this();
  run->timer.async_wait([weak, run, reason](const asio::error_code& ec){
    if(ec) return;
    auto self = weak.lock();
    if(!self || run->finished) return;
    self->fail(run, reason, true);
  });
}

std::optional<fs::path> SyncCoordinator::destination_for(const std::string& peer_id, const TransferMetadata& metadata){
  if(!is_sync_transfer(metadata)) return std::nullopt;
  auto run = find_run_by_sync_id(context_string(metadata.context, "syncId"));
  if(!run || run->finished || run->peer_id != peer_id) return std::nullopt;
  const std::string path = normalize_relative_path(context_string(metadata.context, "path"));
  if(!is_safe_relative_path(path)) {
    log_warn(logger_.get(), "Sync {}: refusing unsafe path {}", run->sync_id, path);
    return std::nullopt;
  }
  if(run->initiator) {
    if(!run->current || run->current->kind != JobKind::Download || run->current->file.path != path) {
      return std::nullopt;
    }
    run->timer.cancel();
  }
  run->current_file_id = metadata.file_id;
  return fs::path(run->config.local_folder) / path;
}

void SyncCoordinator::on_transfer_progress(const std::string&, TransferDirection, const TransferProgress& progress){
  if(progress.state != TransferState::Active) return;
  auto run = find_run_by_file(progress.file_id);
  if(!run || run->finished) return;
  emit_progress(run, SyncPhase::Transferring, progress.bytes_transferred, progress.speed);
}

void SyncCoordinator::on_transfer_finished(const std::string& peer_id,
                                           TransferDirection direction,
                                           const TransferMetadata& metadata,
                                           const TransferProgress& progress,
                                           const fs::path& local_path){
  if(!is_sync_transfer(metadata)) return;
  auto run = find_run_by_sync_id(context_string(metadata.context, "syncId"));
  if(!run || run->finished || run->peer_id != peer_id) return;
  const std::string path = normalize_relative_path(context_string(metadata.context, "path"));
  const bool ok = progress.state == TransferState::Completed;

  if(ok && direction == TransferDirection::Receive) {
    const int64_t mtime = context_int(metadata.context, "lastModified");
    std::string error;
    if(mtime > 0 && !set_file_mtime_ms(local_path, mtime, error)) log_warn(logger_.get(), "{}", error);
  }

  if(!run->initiator) {
    if(ok) {
      ++run->files_done;
      run->bytes_done += metadata.size;
    } else {
      log_warn(logger_.get(), "Sync {}: {} of {} failed: {}", run->sync_id, to_string(direction), path, progress.error);
    }
    run->current_file_id.clear();
    emit_progress(run, SyncPhase::Transferring);
    return;
  }

  if(!run->current || run->current->file.path != path) return;
  if(!ok) {
    fail(run, "Transfer of " + path + " failed: " + progress.error, true);
    return;
  }
  ++run->files_done;
  run->bytes_done += metadata.size;
  if(run->current->is_new) {
    ++run->files_added;
  } else {
    ++run->files_modified;
  }
  next_job(run);
}

void SyncCoordinator::fail(const RunPtr& run, const std::string& reason, bool notify_peer, SyncStatus status){
  if(run->finished) return;
  log_error(logger_.get(), "Sync {} of {} failed: {}", run->sync_id, run->config.local_folder, reason);
  if(!run->current_file_id.empty()) transfers_->cancel(run->current_file_id, reason);
  if(notify_peer) {
    SyncErrorMessage notice;
    notice.sync_id = run->sync_id;
    notice.config_id = run->config.id;
    notice.error = reason;
    send(run->peer_id, notice);
  }
  complete(run, SyncOutcome::Error, status, reason);
}

void SyncCoordinator::complete(const RunPtr& run, SyncOutcome outcome, SyncStatus status, const std::string& error){
  if(run->finished) return;
  run->finished = true;
  run->cancel.cancel();
  run->timer.cancel();
  {
    std::lock_guard<std::mutex> lock(m_);
    auto it = runs_.find(run->config.id);
    if(it != runs_.end() && it->second == run) runs_.erase(it);
  }

  const int64_t now = now_ms();
  SyncConfig config = run->config;
  if(outcome == SyncOutcome::Success) {
    if(auto latest = storage_->config(config.id)) config = *latest;
    config.last_synced_at = now;
    std::string save_error;
    if(!storage_->update_config(config, save_error)) log_warn(logger_.get(), "{}", save_error);
  }

  update_state(config.id, [&](SyncState& s){
    s.status = status;
    s.last_checked_at = now;
    if(error.empty()) {
      s.error.reset();
    } else {
      s.error = error;
    }
    if(outcome == SyncOutcome::Success) {
      s.local_snapshot = run->local;
      s.remote_snapshot = run->remote;
      s.pending_changes.local.clear();
      s.pending_changes.remote.clear();
      s.pending_changes.conflicts = run->unresolved;
    }
  });

  SyncHistoryEntry entry;
  entry.config_id = config.id;
  entry.timestamp = now;
  entry.duration = now - run->started_at;
  entry.files_added = run->files_added;
  entry.files_modified = run->files_modified;
  entry.files_deleted = run->files_deleted;
  entry.bytes_transferred = run->bytes_done;
  entry.status = outcome;
  if(!error.empty()) entry.error = error;
  std::string history_error;
  if(!storage_->append_history(entry, history_error)) log_warn(logger_.get(), "{}", history_error);

  if(outcome == SyncOutcome::Success) {
    log_info(logger_.get(), "Sync {} finished: {} added, {} modified, {} bytes{}", run->sync_id,
             entry.files_added, entry.files_modified, entry.bytes_transferred,
             run->unresolved.empty() ? "" : ", conflicts pending");
  }
  if(finished_callback_) finished_callback_(config, entry);
}

void SyncCoordinator::update_state(const std::string& config_id, const std::function<void(SyncState&)>& mutate){
  SyncState snapshot;
  std::unique_lock<std::mutex> save_lock(state_save_m_);
  {
    std::lock_guard<std::mutex> lock(m_);
    auto it = states_.find(config_id);
    if(it == states_.end()) {
      SyncState initial;
      if(auto stored = storage_->load_state(config_id)) initial = std::move(*stored);
      initial.config_id = config_id;
      it = states_.emplace(config_id, std::move(initial)).first;
    }
    mutate(it->second);
    snapshot = it->second;
  }
  std::string error;
  if(!storage_->save_state(snapshot, error)) log_warn(logger_.get(), "{}", error);
  save_lock.unlock();
  if(state_callback_) state_callback_(snapshot);
}

std::optional<SyncState> SyncCoordinator::state(const std::string& config_id) const {
  {
    std::lock_guard<std::mutex> lock(m_);
    auto it = states_.find(config_id);
    if(it != states_.end()) return it->second;
  }
  return storage_->load_state(config_id);
}

bool SyncCoordinator::is_syncing(const std::string& config_id) const {
  std::lock_guard<std::mutex> lock(m_);
  return runs_.count(config_id) > 0;
}

void SyncCoordinator::emit_progress(const RunPtr& run, SyncPhase phase, uint64_t in_flight, double speed){
  if(!progress_callback_) return;
  SyncProgress progress;
  progress.config_id = run->config.id;
  progress.phase = phase;
  if(run->current) progress.current_file = run->current->file.path;
  progress.files_processed = run->files_done;
  progress.total_files = run->total_files;
  progress.bytes_transferred = run->bytes_done + in_flight;
  progress.total_bytes = run->total_bytes;
  progress.speed = speed;
  const uint64_t remaining = progress.total_bytes > progress.bytes_transferred
    ? progress.total_bytes - progress.bytes_transferred
    : 0;
  if(remaining == 0) {
    progress.eta = 0.0;
  } else if(speed > 0.0) {
    progress.eta = static_cast<double>(remaining) / speed;
  } else {
    progress.eta = std::numeric_limits<double>::infinity();
  }
  progress_callback_(progress);
}

void SyncCoordinator::send(const std::string& peer_id, const SyncMessage& msg){
  if(!send_ || !send_(peer_id, serialize_sync_message(msg))) {
    log_debug(logger_.get(), "{} to {} not delivered", message_type(msg), peer_id);
  }
}

json SyncCoordinator::transfer_context(const RunPtr& run, const FileSnapshot& file) const {
  return json{{"syncId", run->sync_id},
              {"configId", run->config.id},
              {"path", file.path},
              {"lastModified", file.last_modified}};
}

SyncCoordinator::RunPtr SyncCoordinator::find_run_by_sync_id(const std::string& sync_id) const {
  if(sync_id.empty()) return nullptr;
  std::lock_guard<std::mutex> lock(m_);
  for(const auto& [id, run] : runs_) {
    if(run->sync_id == sync_id) return run;
  }
  return nullptr;
}

SyncCoordinator::RunPtr SyncCoordinator::find_run_by_file(const std::string& file_id) const {
  if(file_id.empty()) return nullptr;
  std::lock_guard<std::mutex> lock(m_);
  for(const auto& [id, run] : runs_) {
    if(run->current_file_id == file_id) return run;
  }
  return nullptr;
}

std::optional<SyncConfig> SyncCoordinator::config_for_request(const std::string& peer_id,
                                                              const SyncRequestMessage& msg) const {
  std::vector<SyncConfig> candidates;
  for(const auto& config : storage_->configs()) {
    if(config.is_active && config.peer_id == peer_id) candidates.push_back(config);
  }
  for(const auto& config : candidates) {
    if(config.local_folder_name == msg.folder_name) return config;
  }
  if(candidates.size() == 1) return candidates.front();
  return std::nullopt;
}
