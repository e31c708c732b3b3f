#pragma once

#include "sync_types.hpp"
#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

class Logger;

// Modification time in epoch milliseconds, straight from stat(2).
std::optional<int64_t> file_mtime_ms(const std::filesystem::path& path, std::string& error);
bool set_file_mtime_ms(const std::filesystem::path& path, int64_t epoch_ms, std::string& error);

// Directory names never descended into. Dot-files are skipped as well.
bool is_ignored_entry(const std::filesystem::path& name);

struct ScanOptions {
  std::size_t hash_chunk_size = 1024 * 1024;
  CancelToken cancel;
};

// Snapshots of every regular file below root. Entries of previous whose size
// and mtime still match keep their hash; synced_at is carried over by path.
// Unreadable files are logged and left out. nullopt when root is not a
// readable directory or the scan was cancelled.
std::optional<std::vector<FileSnapshot>> scan_folder(const std::filesystem::path& root,
                                                     const std::string& config_id,
                                                     const std::vector<FileSnapshot>& previous,
                                                     std::string& error,
                                                     Logger* logger = nullptr,
                                                     const ScanOptions& options = ScanOptions());
