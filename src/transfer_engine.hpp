#pragma once

#include "hashing.hpp"
#include "transfer_types.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class Logger;

bool is_transfer_message_type(const std::string& type);
std::optional<TransferMessage> parse_transfer_message(const nlohmann::json& j, std::string& error);
nlohmann::json serialize_transfer_message(const TransferMessage& msg);

uint64_t chunk_count(uint64_t size, std::size_t chunk_size);

// ceil(size / chunk_size) chunks numbered from 0, the final one flagged. An
// empty payload still yields one empty final chunk.
std::vector<ChunkData> split_into_chunks(std::string_view payload,
                                         std::size_t chunk_size,
                                         const std::string& file_id);

// Accepts chunks in any order and hands them to the sink strictly in
// sequence. Out-of-order chunks wait in memory until the gap closes.
class ReassemblyBuffer {
public:
  using Sink = std::function<bool(std::string_view bytes)>;
  enum class Accept { Ok, Duplicate, AfterLast, SinkFailed };

  explicit ReassemblyBuffer(Sink sink);

  Accept accept(ChunkData chunk);
  bool complete() const;
  uint64_t bytes_received() const { return bytes_received_; }
  uint64_t next_expected() const { return next_expected_; }
  std::size_t buffered_chunks() const { return pending_.size(); }
  // Drops every waiting chunk.
  void clear();

private:
  Sink sink_;
  std::map<uint64_t, std::string> pending_;
  uint64_t next_expected_ = 0;
  std::optional<uint64_t> last_sequence_;
  uint64_t bytes_received_ = 0;
};

// Reassembles in memory and checks the digest. nullopt with error set on a
// gap, a missing final chunk or a hash mismatch.
std::optional<std::string> reassemble(std::vector<ChunkData> chunks,
                                      const std::string& expected_hash,
                                      std::string& error);

class ProgressMeter {
public:
  using Clock = std::chrono::steady_clock;

  ProgressMeter(std::string file_id,
                std::string file_name,
                uint64_t total_bytes,
                std::chrono::milliseconds window = std::chrono::milliseconds(3000));

  const TransferProgress& update(uint64_t bytes_transferred, Clock::time_point now);
  const TransferProgress& finish(TransferState state, std::string error = std::string());
  const TransferProgress& progress() const { return progress_; }

private:
  TransferProgress progress_;
  std::chrono::milliseconds window_;
  std::deque<std::pair<Clock::time_point, uint64_t>> samples_;
};

// Where an incoming file is written until its hash checks out.
std::filesystem::path partial_path(const std::filesystem::path& destination);

// dir/<name>, or dir/<stem> (n)<ext> when that name is held by an existing
// file or by the partial file of a transfer still in flight.
std::filesystem::path unique_destination(const std::filesystem::path& dir,
                                         const std::string& file_name,
                                         const std::string& fallback_name);

// Moves files between connected peers. Every method may be called from any
// thread; the protocol work happens on the io_context.
class TransferEngine : public std::enable_shared_from_this<TransferEngine> {
public:
  using SendFn = std::function<bool(const std::string& peer_id, const nlohmann::json& message)>;
  using ProgressCallback = std::function<void(const std::string& peer_id,
                                              TransferDirection direction,
                                              const TransferProgress& progress)>;
  // Chooses where an incoming file is written; nullopt refuses it.
  using DestinationResolver = std::function<std::optional<std::filesystem::path>(
    const std::string& peer_id, const TransferMetadata& metadata)>;
  using CompletionCallback = std::function<void(const std::string& peer_id,
                                                TransferDirection direction,
                                                const TransferMetadata& metadata,
                                                const TransferProgress& progress,
                                                const std::filesystem::path& local_path)>;

  struct Options {
    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t window_chunks = 8;
    std::chrono::milliseconds speed_window{3000};
    // Finished transfers kept for transfers()/transfer(); older ones are dropped.
    std::size_t finished_kept = 50;
    bool debug = false;
  };

  TransferEngine(asio::io_context& io, SendFn send, Options options, std::shared_ptr<Logger> logger);

  void set_progress_callback(ProgressCallback cb) { progress_callback_ = std::move(cb); }
  void set_destination_resolver(DestinationResolver resolver) { destination_resolver_ = std::move(resolver); }
  void set_completion_callback(CompletionCallback cb) { completion_callback_ = std::move(cb); }

  // Hashes the file on the calling thread, then streams it. Returns the id
  // the progress and completion callbacks will report.
  std::optional<std::string> send_file(const std::string& peer_id,
                                       const std::filesystem::path& path,
                                       const std::string& remote_name,
                                       nlohmann::json context,
                                       std::string& error);

  void handle_message(const std::string& peer_id, const TransferMessage& msg);

  bool cancel(const std::string& file_id, const std::string& reason = "cancelled");
  // Fails every transfer with this peer; the link is already gone.
  void abort_peer(const std::string& peer_id, const std::string& reason);

  std::vector<TransferProgress> transfers() const;
  std::optional<TransferProgress> transfer(const std::string& file_id) const;

private:
  struct Outgoing {
    std::string peer_id;
    TransferMetadata metadata;
    std::filesystem::path path;
    std::ifstream in;
    uint64_t next_sequence = 0;
    uint64_t acked_chunks = 0;
    uint64_t bytes_acked = 0;
    std::unique_ptr<ProgressMeter> meter;
    CancelToken cancel;
  };

  struct Incoming {
    std::string peer_id;
    TransferMetadata metadata;
    std::filesystem::path destination;
    std::filesystem::path part_path;
    std::ofstream out;
    std::unique_ptr<Sha256Stream> hasher;
    std::unique_ptr<ReassemblyBuffer> buffer;
    std::unique_ptr<ProgressMeter> meter;
  };

  void start_outgoing(std::shared_ptr<Outgoing> transfer);
  void pump(const std::shared_ptr<Outgoing>& transfer);
  void on_metadata(const std::string& peer_id, const TransferMetadata& metadata);
  void on_chunk(const std::string& peer_id, ChunkData chunk);
  void on_ack(const std::string& peer_id, const TransferAckMessage& ack);
  void on_complete(const std::string& peer_id, const TransferCompleteMessage& result);
  void on_cancel(const std::string& peer_id, const TransferCancelMessage& cancel);
  void finish_incoming(const std::string& file_id);
  void end_outgoing(const std::string& file_id, TransferState state, const std::string& error);
  void end_incoming(const std::string& file_id, TransferState state, const std::string& error);
  void emit(const std::string& peer_id, TransferDirection direction, const TransferProgress& progress);
  void send(const std::string& peer_id, const TransferMessage& msg);

  asio::io_context& io_;
  SendFn send_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  // io thread only
  std::unordered_map<std::string, std::shared_ptr<Outgoing>> outgoing_;
  std::unordered_map<std::string, std::shared_ptr<Incoming>> incoming_;

  mutable std::mutex progress_mutex_;
  std::map<std::string, TransferProgress> progress_;
  std::deque<std::string> finished_order_;

  ProgressCallback progress_callback_;
  DestinationResolver destination_resolver_;
  CompletionCallback completion_callback_;
};
