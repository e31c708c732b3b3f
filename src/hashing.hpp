#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// openssl/evp.h is kept out of this header.
struct evp_md_ctx_st;

inline constexpr std::size_t kDefaultHashChunkSize = 1024 * 1024;

// Raised when the byte source fails while being digested. Hashing itself
// cannot fail; callers only ever see the underlying read problem.
class ReadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

std::string hex_from_bytes(const unsigned char* data, std::size_t len);
std::string hex_from_bytes(const std::vector<unsigned char>& bytes);

std::vector<unsigned char> sha256_bytes(std::string_view data);
std::string sha256_hex(std::string_view data);

// Cheap 32-bit rolling hash over "<size>-<last_modified>". Only good for
// spotting files whose metadata has not moved since the last scan.
std::string metadata_fingerprint(uint64_t size, int64_t last_modified);

class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();

  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(const void* data, std::size_t len);
  void update(std::string_view data) { update(data.data(), data.size()); }

  // Finalizes and returns the lower-case hex digest. The stream cannot be
  // updated afterwards.
  std::string finish_hex();

  std::uint64_t bytes_consumed() const { return consumed_; }

private:
  evp_md_ctx_st* ctx_ = nullptr;
  bool finished_ = false;
  std::uint64_t consumed_ = 0;
};

// Hashes the stream in chunk_size pieces. Equivalent to sha256_hex over the
// whole content; throws ReadError when the stream goes bad.
std::string chunked_digest(std::istream& in, std::size_t chunk_size = kDefaultHashChunkSize);

std::optional<std::string> file_digest(const std::filesystem::path& path,
                                       std::string& error,
                                       std::size_t chunk_size = kDefaultHashChunkSize);
