#include "folder_scanner.hpp"

#include "hashing.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <unordered_map>

namespace fs = std::filesystem;

std::optional<int64_t> file_mtime_ms(const fs::path& path, std::string& error){
  struct stat info{};
  if(::stat(path.c_str(), &info) != 0) {
    error = "stat " + path.string() + ": " + std::strerror(errno);
    return std::nullopt;
  }
  return static_cast<int64_t>(info.st_mtim.tv_sec) * 1000 + info.st_mtim.tv_nsec / 1000000;
}

bool set_file_mtime_ms(const fs::path& path, int64_t epoch_ms, std::string& error){
  struct timespec times[2];
  times[0].tv_sec = 0;
  times[0].tv_nsec = UTIME_OMIT;
  times[1].tv_sec = static_cast<time_t>(epoch_ms / 1000);
  times[1].tv_nsec = static_cast<long>((epoch_ms % 1000) * 1000000);
  if(::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
    error = "utimensat " + path.string() + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

bool is_ignored_entry(const fs::path& name){
  const std::string text = name.filename().string();
  if(text.empty()) return true;
  if(text == ".config" || text == ".wingsync") return true;
  if(text.size() > 14 && text.compare(text.size() - 14, 14, ".wingsync-part") == 0) return true;
  return text.front() == '.';
}

std::optional<std::vector<FileSnapshot>> scan_folder(const fs::path& root,
                                                     const std::string& config_id,
                                                     const std::vector<FileSnapshot>& previous,
                                                     std::string& error,
                                                     Logger* logger,
                                                     const ScanOptions& options){
  std::error_code ec;
  if(!fs::is_directory(root, ec)) {
    error = "Not a directory: " + root.string();
    return std::nullopt;
  }

  std::unordered_map<std::string, const FileSnapshot*> known;
  for(const auto& snap : previous) known[snap.path] = &snap;

  std::vector<FileSnapshot> out;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if(ec) {
    error = "Unable to read " + root.string() + ": " + ec.message();
    return std::nullopt;
  }
  std::size_t reused = 0;
  fs::recursive_directory_iterator end;
  for(; it != end; it.increment(ec)) {
    if(options.cancel.cancelled()) {
      error = "Scan cancelled";
      return std::nullopt;
    }
    const auto& entry = *it;
    if(is_ignored_entry(entry.path())) {
      if(entry.is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    if(!entry.is_regular_file(ec)) continue;

    std::string stat_error;
    auto mtime = file_mtime_ms(entry.path(), stat_error);
    const uint64_t size = entry.file_size(ec);
    if(!mtime || ec) {
      log_warn(logger, "Skipping {}: {}", entry.path().string(), mtime ? ec.message() : stat_error);
      ec.clear();
      continue;
    }

    FileSnapshot snap;
    snap.path = normalize_relative_path(fs::relative(entry.path(), root, ec).generic_string());
    if(ec || snap.path.empty()) {
      ec.clear();
      continue;
    }
    snap.name = entry.path().filename().string();
    snap.size = size;
    snap.last_modified = *mtime;
    snap.config_id = config_id;

    auto prev = known.find(snap.path);
    if(prev != known.end()) {
      snap.synced_at = prev->second->synced_at;
      if(!prev->second->hash.empty() &&
         metadata_fingerprint(prev->second->size, prev->second->last_modified) ==
           metadata_fingerprint(snap.size, snap.last_modified)) {
        snap.hash = prev->second->hash;
        ++reused;
      }
    }
    if(snap.hash.empty()) {
      std::string hash_error;
      auto digest = file_digest(entry.path(), hash_error, options.hash_chunk_size);
      if(!digest) {
        log_warn(logger, "Skipping {}: {}", entry.path().string(), hash_error);
        continue;
      }
      snap.hash = *digest;
    }
    out.push_back(std::move(snap));
  }
  if(ec) log_warn(logger, "Scan of {} stopped early: {}", root.string(), ec.message());

  std::sort(out.begin(), out.end(), [](const FileSnapshot& a, const FileSnapshot& b){
    return a.path < b.path;
  });
  log_debug(logger, "Scanned {}: {} files, {} hashes reused", root.string(), out.size(), reused);
  return out;
}
