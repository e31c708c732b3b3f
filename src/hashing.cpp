#include "hashing.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const unsigned char* data, std::size_t len){
  std::ostringstream oss;
  for(std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string hex_from_bytes(const std::vector<unsigned char>& bytes){
  return hex_from_bytes(bytes.data(), bytes.size());
}

std::vector<unsigned char> sha256_bytes(std::string_view data){
  std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
  return out;
}

std::string sha256_hex(std::string_view data){
  return hex_from_bytes(sha256_bytes(data));
}

std::string metadata_fingerprint(uint64_t size, int64_t last_modified){
  const std::string metadata = std::to_string(size) + "-" + std::to_string(last_modified);
  uint32_t hash = 0;
  for(unsigned char ch : metadata) {
    hash = (hash << 5) - hash + ch;
  }
  int64_t signed_hash = static_cast<int32_t>(hash);
  if(signed_hash < 0) signed_hash = -signed_hash;
  std::ostringstream oss;
  oss << std::hex << signed_hash;
  return oss.str();
}

Sha256Stream::Sha256Stream()
  : ctx_(EVP_MD_CTX_new()) {
  if(!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("Unable to initialise SHA-256 context");
  }
}

Sha256Stream::~Sha256Stream(){
  EVP_MD_CTX_free(ctx_);
}

void Sha256Stream::update(const void* data, std::size_t len){
  if(finished_) throw std::logic_error("Sha256Stream updated after finish");
  if(len == 0) return;
  EVP_DigestUpdate(ctx_, data, len);
  consumed_ += len;
}

std::string Sha256Stream::finish_hex(){
  if(finished_) throw std::logic_error("Sha256Stream finished twice");
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  EVP_DigestFinal_ex(ctx_, digest, &digest_len);
  finished_ = true;
  return hex_from_bytes(digest, digest_len);
}

std::string chunked_digest(std::istream& in, std::size_t chunk_size){
  if(chunk_size == 0) chunk_size = kDefaultHashChunkSize;
  Sha256Stream hasher;
  std::vector<char> buffer(chunk_size);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got > 0) hasher.update(buffer.data(), static_cast<std::size_t>(got));
  }
  if(in.bad()) {
    throw ReadError("stream read failed after " + std::to_string(hasher.bytes_consumed()) + " bytes");
  }
  return hasher.finish_hex();
}

std::optional<std::string> file_digest(const std::filesystem::path& path,
                                       std::string& error,
                                       std::size_t chunk_size){
  std::ifstream file(path, std::ios::binary);
  if(!file) {
    error = "Cannot open " + path.string();
    return std::nullopt;
  }
  try {
    return chunked_digest(file, chunk_size);
  } catch(const ReadError& e) {
    error = "Failed reading " + path.string() + ": " + e.what();
    return std::nullopt;
  }
}
