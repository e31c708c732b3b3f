#include "sync_engine.hpp"

#include "utils.hpp"

#include <unordered_map>
#include <unordered_set>

namespace {

using SnapshotIndex = std::unordered_map<std::string, const FileSnapshot*>;

// Last entry wins for a repeated path.
SnapshotIndex index_by_path(const std::vector<FileSnapshot>& files) {
  SnapshotIndex index;
  index.reserve(files.size());
  for(const auto& file : files) index[file.path] = &file;
  return index;
}

bool changed_since_sync(const FileSnapshot& file) {
  return file.last_modified > file.synced_at;
}

void append(std::vector<FileSnapshot>& out, const std::vector<FileSnapshot>& in) {
  out.insert(out.end(), in.begin(), in.end());
}

std::string with_suffix(const std::string& file_name, const std::string& suffix) {
  auto dot = file_name.rfind('.');
  if(dot == std::string::npos || dot == 0) return file_name + suffix;
  return file_name.substr(0, dot) + suffix + file_name.substr(dot);
}

} // namespace

SyncDiff compare_snapshots(const std::vector<FileSnapshot>& local,
                           const std::vector<FileSnapshot>& remote){
  SyncDiff diff;
  auto local_index = index_by_path(local);
  auto remote_index = index_by_path(remote);
  std::unordered_set<std::string> seen;

  for(const auto& entry : local) {
    if(!seen.insert(entry.path).second) continue;
    const FileSnapshot& local_file = *local_index[entry.path];
    auto it = remote_index.find(entry.path);
    if(it == remote_index.end()) {
      diff.local_only.push_back(local_file);
      continue;
    }
    const FileSnapshot& remote_file = *it->second;
    if(local_file.hash == remote_file.hash) {
      diff.unchanged.push_back(local_file);
    } else if(changed_since_sync(local_file) && changed_since_sync(remote_file)) {
      diff.conflicts.push_back(ConflictFile{entry.path, local_file, remote_file, std::nullopt});
    } else if(remote_file.last_modified > local_file.last_modified) {
      diff.modified.push_back(remote_file);
    } else {
      diff.modified.push_back(local_file);
    }
  }

  for(const auto& entry : remote) {
    if(!seen.insert(entry.path).second) continue;
    diff.remote_only.push_back(*remote_index[entry.path]);
  }
  return diff;
}

SyncPlan calculate_sync_plan(const SyncDiff& diff, SyncDirection direction){
  SyncPlan plan;
  switch(direction) {
    case SyncDirection::Bidirectional:
      append(plan.upload, diff.local_only);
      append(plan.upload, diff.modified);
      append(plan.download, diff.remote_only);
      break;
    case SyncDirection::UploadOnly:
      append(plan.upload, diff.local_only);
      append(plan.upload, diff.modified);
      break;
    case SyncDirection::DownloadOnly:
      append(plan.download, diff.remote_only);
      append(plan.download, diff.modified);
      break;
  }
  plan.conflicts = diff.conflicts;
  return plan;
}

std::string conflict_copy_path(const std::string& path, std::string_view tag, int64_t now_ms){
  const std::string suffix = " (" + std::string(tag) + "-" + filename_timestamp(now_ms) + ")";
  auto slash = path.rfind('/');
  if(slash == std::string::npos) return with_suffix(path, suffix);
  return path.substr(0, slash + 1) + with_suffix(path.substr(slash + 1), suffix);
}

SyncPlan apply_conflict_resolutions(const std::vector<ConflictFile>& conflicts,
                                    const std::vector<ResolutionChoice>& resolutions,
                                    int64_t now_ms){
  std::unordered_map<std::string, ResolutionAction> chosen;
  for(const auto& choice : resolutions) chosen[choice.path] = choice.action;

  SyncPlan plan;
  for(const auto& conflict : conflicts) {
    auto it = chosen.find(conflict.path);
    if(it == chosen.end() || it->second == ResolutionAction::Manual) {
      plan.conflicts.push_back(conflict);
      continue;
    }
    switch(it->second) {
      case ResolutionAction::Local:
        plan.upload.push_back(conflict.local);
        break;
      case ResolutionAction::Remote:
        plan.download.push_back(conflict.remote);
        break;
      case ResolutionAction::Both: {
        FileSnapshot copy = conflict.local;
        copy.path = conflict_copy_path(conflict.local.path, "local", now_ms);
        copy.name = conflict_copy_path(conflict.local.name, "local", now_ms);
        plan.upload.push_back(std::move(copy));
        plan.download.push_back(conflict.remote);
        break;
      }
      case ResolutionAction::Manual:
        break;
    }
  }
  return plan;
}

std::vector<FileSnapshot> merge_snapshots(const std::vector<FileSnapshot>& local,
                                          const std::vector<FileSnapshot>& remote){
  std::vector<FileSnapshot> merged;
  std::unordered_map<std::string, std::size_t> position;
  merged.reserve(local.size() + remote.size());

  for(const auto& file : local) {
    auto it = position.find(file.path);
    if(it == position.end()) {
      position.emplace(file.path, merged.size());
      merged.push_back(file);
    } else {
      merged[it->second] = file;
    }
  }
  for(const auto& file : remote) {
    auto it = position.find(file.path);
    if(it == position.end()) {
      position.emplace(file.path, merged.size());
      merged.push_back(file);
    } else if(file.last_modified > merged[it->second].last_modified) {
      merged[it->second] = file;
    }
  }
  return merged;
}

std::vector<ResolutionChoice> resolutions_for_policy(const std::vector<ConflictFile>& conflicts,
                                                     ConflictResolution policy){
  std::vector<ResolutionChoice> choices;
  if(policy == ConflictResolution::Manual) return choices;
  choices.reserve(conflicts.size());
  for(const auto& conflict : conflicts) {
    ResolutionAction action = ResolutionAction::Local;
    if(policy == ConflictResolution::RemoteWins) {
      action = ResolutionAction::Remote;
    } else if(policy == ConflictResolution::LastWriteWins &&
              conflict.remote.last_modified > conflict.local.last_modified) {
      action = ResolutionAction::Remote;
    }
    choices.push_back(ResolutionChoice{conflict.path, action});
  }
  return choices;
}
