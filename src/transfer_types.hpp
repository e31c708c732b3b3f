#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>

inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

// One ordered fragment of a file on the wire.
struct ChunkData {
  uint64_t sequence_number = 0;
  std::string file_id;
  std::string data;
  bool is_last_chunk = false;
};

enum class TransferState { Active, Completed, Error, Cancelled };
enum class TransferDirection { Send, Receive };

struct TransferProgress {
  std::string file_id;
  std::string file_name;
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
  double percentage = 0.0;  // 0..100
  double speed = 0.0;       // bytes per second over the trailing window
  double eta = std::numeric_limits<double>::infinity();  // seconds
  TransferState state = TransferState::Active;
  std::string error;
};

// Sent before the first chunk. hash covers the whole artifact.
struct TransferMetadata {
  std::string file_id;
  std::string file_name;
  uint64_t size = 0;
  std::string hash;
  std::size_t chunk_size = kDefaultChunkSize;
  uint64_t total_chunks = 0;
  // Opaque to the engine; the sync coordinator puts its routing data here.
  nlohmann::json context = nlohmann::json::object();
};

struct TransferMetadataMessage { TransferMetadata metadata; };
struct TransferChunkMessage { ChunkData chunk; };
// Receiver acknowledges a chunk; the sender keeps a bounded window in flight.
struct TransferAckMessage { std::string file_id; uint64_t sequence_number = 0; };
// Receiver's verdict after reassembly and hash comparison.
struct TransferCompleteMessage { std::string file_id; bool success = false; std::string error; };
struct TransferCancelMessage { std::string file_id; std::string reason; };

using TransferMessage = std::variant<TransferMetadataMessage,
                                     TransferChunkMessage,
                                     TransferAckMessage,
                                     TransferCompleteMessage,
                                     TransferCancelMessage>;

const char* to_string(TransferState state);
const char* to_string(TransferDirection direction);
