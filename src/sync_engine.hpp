#pragma once

#include "sync_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Reconciliation of two snapshot sets. Everything here is pure: no I/O, no
// clock unless a timestamp is passed in.

// Partitions the union of paths into exactly one bucket each. A path whose
// hashes differ is a conflict when both sides changed after their own
// synced_at; otherwise it is "modified" and carries the newer side (local
// on equal timestamps).
SyncDiff compare_snapshots(const std::vector<FileSnapshot>& local,
                           const std::vector<FileSnapshot>& remote);

// Deletions are not propagated: a path missing on one side is local_only or
// remote_only, never a removal, so plan.remove is always empty.
SyncPlan calculate_sync_plan(const SyncDiff& diff, SyncDirection direction);

// Turns per-path choices into transfers. Conflicts without a choice, or
// with a manual one, stay in the plan's conflicts.
SyncPlan apply_conflict_resolutions(const std::vector<ConflictFile>& conflicts,
                                    const std::vector<ResolutionChoice>& resolutions,
                                    int64_t now_ms);

// Union keyed by path; the remote entry replaces the local one only when its
// last_modified is strictly greater.
std::vector<FileSnapshot> merge_snapshots(const std::vector<FileSnapshot>& local,
                                          const std::vector<FileSnapshot>& remote);

// "dir/c.txt" -> "dir/c (local-2026-10-18T12-00-00).txt"
std::string conflict_copy_path(const std::string& path, std::string_view tag, int64_t now_ms);

// Choices implied by a config policy. Manual yields none.
std::vector<ResolutionChoice> resolutions_for_policy(const std::vector<ConflictFile>& conflicts,
                                                     ConflictResolution policy);
