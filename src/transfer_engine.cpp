#include "transfer_engine.hpp"

#include "base64.h"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kPartSuffix = ".wingsync-part";

std::string new_file_id() {
  return "xfer-" + std::to_string(now_ms()) + "-" + random_token(8, "abcdefghijklmnopqrstuvwxyz0123456789");
}

std::string string_field(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return std::string();
  return it->get<std::string>();
}

uint64_t uint_field(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_number_integer()) return 0;
  auto value = it->get<int64_t>();
  return value < 0 ? 0 : static_cast<uint64_t>(value);
}

} // namespace

const char* to_string(TransferState state){
  switch(state) {
    case TransferState::Active: return "active";
    case TransferState::Completed: return "completed";
    case TransferState::Error: return "error";
    case TransferState::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* to_string(TransferDirection direction){
  return direction == TransferDirection::Send ? "send" : "receive";
}

bool is_transfer_message_type(const std::string& type){
  return type.rfind("transfer-", 0) == 0;
}

std::optional<TransferMessage> parse_transfer_message(const json& j, std::string& error){
  if(!j.is_object()) {
    error = "Invalid message format";
    return std::nullopt;
  }
  const std::string type = string_field(j, "type");
  const std::string file_id = string_field(j, "fileId");
  if(file_id.empty()) {
    error = "Missing fileId for " + type;
    return std::nullopt;
  }

  if(type == "transfer-metadata") {
    TransferMetadata meta;
    meta.file_id = file_id;
    meta.file_name = string_field(j, "fileName");
    meta.size = uint_field(j, "size");
    meta.hash = string_field(j, "hash");
    meta.chunk_size = static_cast<std::size_t>(uint_field(j, "chunkSize"));
    meta.total_chunks = uint_field(j, "totalChunks");
    auto ctx = j.find("context");
    if(ctx != j.end() && ctx->is_object()) meta.context = *ctx;
    if(meta.hash.empty() || meta.chunk_size == 0) {
      error = "Incomplete transfer metadata";
      return std::nullopt;
    }
    return TransferMessage{TransferMetadataMessage{std::move(meta)}};
  }
  if(type == "transfer-chunk") {
    ChunkData chunk;
    chunk.file_id = file_id;
    chunk.sequence_number = uint_field(j, "sequenceNumber");
    chunk.is_last_chunk = j.value("isLastChunk", false);
    try {
      chunk.data = base64_decode(string_field(j, "data"));
    } catch(const std::exception& e) {
      error = std::string("Invalid chunk payload: ") + e.what();
      return std::nullopt;
    }
    return TransferMessage{TransferChunkMessage{std::move(chunk)}};
  }
  if(type == "transfer-ack") {
    return TransferMessage{TransferAckMessage{file_id, uint_field(j, "sequenceNumber")}};
  }
  if(type == "transfer-complete") {
    return TransferMessage{TransferCompleteMessage{file_id, j.value("success", false), string_field(j, "error")}};
  }
  if(type == "transfer-cancel") {
    return TransferMessage{TransferCancelMessage{file_id, string_field(j, "reason")}};
  }
  error = "Unknown message type: " + type;
  return std::nullopt;
}

json serialize_transfer_message(const TransferMessage& msg){
  return std::visit(overloaded{
    [](const TransferMetadataMessage& m) {
      const auto& meta = m.metadata;
      return json{{"type", "transfer-metadata"},
                  {"fileId", meta.file_id},
                  {"fileName", meta.file_name},
                  {"size", meta.size},
                  {"hash", meta.hash},
                  {"chunkSize", meta.chunk_size},
                  {"totalChunks", meta.total_chunks},
                  {"context", meta.context}};
    },
    [](const TransferChunkMessage& m) {
      const auto& chunk = m.chunk;
      return json{{"type", "transfer-chunk"},
                  {"fileId", chunk.file_id},
                  {"sequenceNumber", chunk.sequence_number},
                  {"isLastChunk", chunk.is_last_chunk},
                  {"data", base64_encode(reinterpret_cast<const unsigned char*>(chunk.data.data()), chunk.data.size())}};
    },
    [](const TransferAckMessage& m) {
      return json{{"type", "transfer-ack"}, {"fileId", m.file_id}, {"sequenceNumber", m.sequence_number}};
    },
    [](const TransferCompleteMessage& m) {
      json j{{"type", "transfer-complete"}, {"fileId", m.file_id}, {"success", m.success}};
      if(!m.error.empty()) j["error"] = m.error;
      return j;
    },
    [](const TransferCancelMessage& m) {
      return json{{"type", "transfer-cancel"}, {"fileId", m.file_id}, {"reason", m.reason}};
    },
  }, msg);
}

uint64_t chunk_count(uint64_t size, std::size_t chunk_size){
  if(chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
  if(size == 0) return 1;
  return (size + chunk_size - 1) / chunk_size;
}

std::vector<ChunkData> split_into_chunks(std::string_view payload,
                                         std::size_t chunk_size,
                                         const std::string& file_id){
  const uint64_t total = chunk_count(payload.size(), chunk_size);
  std::vector<ChunkData> chunks;
  chunks.reserve(static_cast<std::size_t>(total));
  for(uint64_t seq = 0; seq < total; ++seq) {
    ChunkData chunk;
    chunk.sequence_number = seq;
    chunk.file_id = file_id;
    const std::size_t offset = static_cast<std::size_t>(seq * chunk_size);
    chunk.data = std::string(payload.substr(offset, chunk_size));
    chunk.is_last_chunk = (seq + 1 == total);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

ReassemblyBuffer::ReassemblyBuffer(Sink sink)
  : sink_(std::move(sink)) {}

ReassemblyBuffer::Accept ReassemblyBuffer::accept(ChunkData chunk){
  const uint64_t seq = chunk.sequence_number;
  if(seq < next_expected_ || pending_.count(seq)) return Accept::Duplicate;
  if(last_sequence_ && seq > *last_sequence_) return Accept::AfterLast;
  if(chunk.is_last_chunk) {
    if(!pending_.empty() && pending_.rbegin()->first > seq) return Accept::AfterLast;
    last_sequence_ = seq;
  }
  pending_.emplace(seq, std::move(chunk.data));
  while(!pending_.empty() && pending_.begin()->first == next_expected_) {
    auto node = pending_.begin();
    if(!sink_(node->second)) return Accept::SinkFailed;
    bytes_received_ += node->second.size();
    pending_.erase(node);
    ++next_expected_;
  }
  return Accept::Ok;
}

bool ReassemblyBuffer::complete() const {
  return last_sequence_ && next_expected_ == *last_sequence_ + 1;
}

void ReassemblyBuffer::clear(){
  pending_.clear();
}

std::optional<std::string> reassemble(std::vector<ChunkData> chunks,
                                      const std::string& expected_hash,
                                      std::string& error){
  std::string out;
  ReassemblyBuffer buffer([&out](std::string_view bytes){
    out.append(bytes.data(), bytes.size());
    return true;
  });
  for(auto& chunk : chunks) {
    if(buffer.accept(std::move(chunk)) == ReassemblyBuffer::Accept::AfterLast) {
      error = "chunk beyond the final chunk";
      return std::nullopt;
    }
  }
  if(!buffer.complete()) {
    error = "missing chunk " + std::to_string(buffer.next_expected());
    return std::nullopt;
  }
  const std::string actual = sha256_hex(out);
  if(actual != expected_hash) {
    error = "integrity check failed: expected " + expected_hash + ", got " + actual;
    return std::nullopt;
  }
  return out;
}

ProgressMeter::ProgressMeter(std::string file_id,
                             std::string file_name,
                             uint64_t total_bytes,
                             std::chrono::milliseconds window)
  : window_(window) {
  progress_.file_id = std::move(file_id);
  progress_.file_name = std::move(file_name);
  progress_.total_bytes = total_bytes;
}

const TransferProgress& ProgressMeter::update(uint64_t bytes_transferred, Clock::time_point now){
  progress_.bytes_transferred = std::min(bytes_transferred, progress_.total_bytes);
  samples_.emplace_back(now, progress_.bytes_transferred);
  while(samples_.size() > 1 && now - samples_.front().first > window_) samples_.pop_front();

  const auto& oldest = samples_.front();
  const double seconds = std::chrono::duration<double>(now - oldest.first).count();
  progress_.speed = seconds > 0.0
    ? static_cast<double>(progress_.bytes_transferred - oldest.second) / seconds
    : 0.0;

  const uint64_t remaining = progress_.total_bytes - progress_.bytes_transferred;
  if(remaining == 0) {
    progress_.eta = 0.0;
  } else if(progress_.speed > 0.0) {
    progress_.eta = static_cast<double>(remaining) / progress_.speed;
  } else {
    progress_.eta = std::numeric_limits<double>::infinity();
  }
  progress_.percentage = progress_.total_bytes == 0
    ? 100.0
    : 100.0 * static_cast<double>(progress_.bytes_transferred) / static_cast<double>(progress_.total_bytes);
  return progress_;
}

const TransferProgress& ProgressMeter::finish(TransferState state, std::string error){
  progress_.state = state;
  progress_.error = std::move(error);
  if(state == TransferState::Completed) {
    progress_.bytes_transferred = progress_.total_bytes;
    progress_.percentage = 100.0;
    progress_.eta = 0.0;
  }
  return progress_;
}

TransferEngine::TransferEngine(asio::io_context& io, SendFn send, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    send_(std::move(send)),
    options_(options),
    logger_(std::move(logger)) {
  if(options_.chunk_size == 0) options_.chunk_size = kDefaultChunkSize;
  if(options_.window_chunks == 0) options_.window_chunks = 1;
}

fs::path partial_path(const fs::path& destination){
  return destination.string() + kPartSuffix;
}

fs::path unique_destination(const fs::path& dir, const std::string& file_name, const std::string& fallback_name){
  std::string name = fs::path(file_name).filename().string();
  if(name.empty() || name == "." || name == "..") name = fallback_name;
  const std::string stem = fs::path(name).stem().string();
  const std::string ext = fs::path(name).extension().string();
  auto taken = [](const fs::path& candidate){
    std::error_code ec;
    return fs::exists(candidate, ec) || fs::exists(partial_path(candidate), ec);
  };
  fs::path candidate = dir / name;
  for(int n = 1; taken(candidate) && n < 1000; ++n) {
    candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
  }
  return candidate;
}

std::optional<std::string> TransferEngine::send_file(const std::string& peer_id,
                                                     const fs::path& path,
                                                     const std::string& remote_name,
                                                     json context,
                                                     std::string& error){
  std::error_code ec;
  if(!fs::is_regular_file(path, ec)) {
    error = "Not a regular file: " + path.string();
    return std::nullopt;
  }
  const uint64_t size = fs::file_size(path, ec);
  if(ec) {
    error = "Unable to stat " + path.string() + ": " + ec.message();
    return std::nullopt;
  }
  auto hash = file_digest(path, error, options_.chunk_size);
  if(!hash) return std::nullopt;

  auto transfer = std::make_shared<Outgoing>();
  transfer->peer_id = peer_id;
  transfer->path = path;
  auto& meta = transfer->metadata;
  meta.file_id = new_file_id();
  meta.file_name = remote_name.empty() ? path.filename().string() : remote_name;
  meta.size = size;
  meta.hash = *hash;
  meta.chunk_size = options_.chunk_size;
  meta.total_chunks = chunk_count(size, options_.chunk_size);
  meta.context = context.is_object() ? std::move(context) : json::object();
  transfer->meter = std::make_unique<ProgressMeter>(meta.file_id, meta.file_name, size, options_.speed_window);

  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_[meta.file_id] = transfer->meter->progress();
  }
  std::string file_id = meta.file_id;
  auto self = shared_from_this();
  asio::post(io_, [self, transfer]() mutable {
    self->start_outgoing(std::move(transfer));
  });
  return file_id;
}

void TransferEngine::start_outgoing(std::shared_ptr<Outgoing> transfer){
  const std::string file_id = transfer->metadata.file_id;
  outgoing_[file_id] = transfer;
  if(transfer->cancel.cancelled()) {
    end_outgoing(file_id, TransferState::Cancelled, "cancelled");
    return;
  }
  transfer->in.open(transfer->path, std::ios::binary);
  if(!transfer->in) {
    end_outgoing(file_id, TransferState::Error, "Unable to open " + transfer->path.string());
    return;
  }
  log_info(logger_.get(), "Sending {} ({} bytes, {} chunks) to {}",
           transfer->metadata.file_name, transfer->metadata.size,
           transfer->metadata.total_chunks, transfer->peer_id);
  send(transfer->peer_id, TransferMetadataMessage{transfer->metadata});
  emit(transfer->peer_id, TransferDirection::Send, transfer->meter->update(0, ProgressMeter::Clock::now()));
  pump(transfer);
}

void TransferEngine::pump(const std::shared_ptr<Outgoing>& transfer){
  const auto& meta = transfer->metadata;
  std::string buf;
  while(transfer->next_sequence < meta.total_chunks
        && transfer->next_sequence - transfer->acked_chunks < options_.window_chunks) {
    if(transfer->cancel.cancelled()) return;
    const uint64_t offset = transfer->next_sequence * meta.chunk_size;
    const auto length = static_cast<std::size_t>(
      std::min<uint64_t>(meta.chunk_size, meta.size - std::min(offset, meta.size)));
    buf.resize(length);
    if(length > 0 && !transfer->in.read(buf.data(), static_cast<std::streamsize>(length))) {
      send(transfer->peer_id, TransferCancelMessage{meta.file_id, "sender read failed"});
      end_outgoing(meta.file_id, TransferState::Error, "Read failed on " + transfer->path.string());
      return;
    }
    ChunkData chunk;
    chunk.file_id = meta.file_id;
    chunk.sequence_number = transfer->next_sequence;
    chunk.is_last_chunk = (transfer->next_sequence + 1 == meta.total_chunks);
    chunk.data = buf;
    if(!send_(transfer->peer_id, serialize_transfer_message(TransferChunkMessage{std::move(chunk)}))) {
      end_outgoing(meta.file_id, TransferState::Error, "Peer link unavailable");
      return;
    }
    ++transfer->next_sequence;
  }
}

void TransferEngine::handle_message(const std::string& peer_id, const TransferMessage& msg){
  std::visit(overloaded{
    [&](const TransferMetadataMessage& m) { on_metadata(peer_id, m.metadata); },
    [&](const TransferChunkMessage& m) { on_chunk(peer_id, m.chunk); },
    [&](const TransferAckMessage& m) { on_ack(peer_id, m); },
    [&](const TransferCompleteMessage& m) { on_complete(peer_id, m); },
    [&](const TransferCancelMessage& m) { on_cancel(peer_id, m); },
  }, msg);
}

void TransferEngine::on_metadata(const std::string& peer_id, const TransferMetadata& metadata){
  if(incoming_.count(metadata.file_id)) {
    log_debug(logger_.get(), "Duplicate metadata for {} ignored", metadata.file_id);
    return;
  }
  auto reject = [&](const std::string& reason){
    log_warn(logger_.get(), "Refusing {} from {}: {}", metadata.file_name, peer_id, reason);
    send(peer_id, TransferCompleteMessage{metadata.file_id, false, reason});
  };

  if(metadata.chunk_size == 0 || metadata.total_chunks != chunk_count(metadata.size, metadata.chunk_size)) {
    reject("Inconsistent chunk layout");
    return;
  }
  std::optional<fs::path> destination;
  if(destination_resolver_) destination = destination_resolver_(peer_id, metadata);
  if(!destination) {
    reject("No destination for incoming file");
    return;
  }

  auto transfer = std::make_shared<Incoming>();
  transfer->peer_id = peer_id;
  transfer->metadata = metadata;
  transfer->destination = *destination;
  transfer->part_path = partial_path(*destination);

  std::error_code ec;
  if(destination->has_parent_path()) fs::create_directories(destination->parent_path(), ec);
  if(ec) {
    reject("Unable to create " + destination->parent_path().string() + ": " + ec.message());
    return;
  }
  transfer->out.open(transfer->part_path, std::ios::binary | std::ios::trunc);
  if(!transfer->out) {
    reject("Unable to write " + transfer->part_path.string());
    return;
  }
  transfer->hasher = std::make_unique<Sha256Stream>();
  Incoming* raw = transfer.get();
  transfer->buffer = std::make_unique<ReassemblyBuffer>([raw](std::string_view bytes){
    raw->out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if(!raw->out) return false;
    raw->hasher->update(bytes);
    return true;
  });
  transfer->meter = std::make_unique<ProgressMeter>(metadata.file_id, metadata.file_name,
                                                    metadata.size, options_.speed_window);
  incoming_[metadata.file_id] = transfer;
  log_info(logger_.get(), "Receiving {} ({} bytes) from {}", metadata.file_name, metadata.size, peer_id);
  emit(peer_id, TransferDirection::Receive, transfer->meter->update(0, ProgressMeter::Clock::now()));
}

void TransferEngine::on_chunk(const std::string& peer_id, ChunkData chunk){
  auto it = incoming_.find(chunk.file_id);
  if(it == incoming_.end() || it->second->peer_id != peer_id) {
    log_debug(logger_.get(), "Chunk for unknown transfer {} dropped", chunk.file_id);
    return;
  }
  auto transfer = it->second;
  const std::string file_id = chunk.file_id;
  const uint64_t seq = chunk.sequence_number;
  if(seq >= transfer->metadata.total_chunks
     || chunk.is_last_chunk != (seq + 1 == transfer->metadata.total_chunks)) {
    send(peer_id, TransferCompleteMessage{file_id, false, "Chunk sequence out of range"});
    end_incoming(file_id, TransferState::Error, "Chunk sequence out of range");
    return;
  }

  switch(transfer->buffer->accept(std::move(chunk))) {
    case ReassemblyBuffer::Accept::Ok:
    case ReassemblyBuffer::Accept::Duplicate:
      break;
    case ReassemblyBuffer::Accept::AfterLast:
      send(peer_id, TransferCompleteMessage{file_id, false, "Chunk beyond the final chunk"});
      end_incoming(file_id, TransferState::Error, "Chunk beyond the final chunk");
      return;
    case ReassemblyBuffer::Accept::SinkFailed:
      send(peer_id, TransferCompleteMessage{file_id, false, "Receiver write failed"});
      end_incoming(file_id, TransferState::Error, "Write failed on " + transfer->part_path.string());
      return;
  }
  send(peer_id, TransferAckMessage{file_id, seq});
  emit(peer_id, TransferDirection::Receive,
       transfer->meter->update(transfer->buffer->bytes_received(), ProgressMeter::Clock::now()));
  if(transfer->buffer->complete()) finish_incoming(file_id);
}

void TransferEngine::finish_incoming(const std::string& file_id){
  auto it = incoming_.find(file_id);
  if(it == incoming_.end()) return;
  auto transfer = it->second;
  transfer->out.close();
  if(transfer->out.fail()) {
    send(transfer->peer_id, TransferCompleteMessage{file_id, false, "Receiver write failed"});
    end_incoming(file_id, TransferState::Error, "Write failed on " + transfer->part_path.string());
    return;
  }
  const std::string actual = transfer->hasher->finish_hex();
  if(actual != transfer->metadata.hash || transfer->buffer->bytes_received() != transfer->metadata.size) {
    const std::string reason = "Integrity check failed: expected " + transfer->metadata.hash + ", got " + actual;
    send(transfer->peer_id, TransferCompleteMessage{file_id, false, reason});
    end_incoming(file_id, TransferState::Error, reason);
    return;
  }

  std::error_code ec;
  fs::rename(transfer->part_path, transfer->destination, ec);
  if(ec) {
    fs::remove(transfer->destination, ec);
    ec.clear();
    fs::rename(transfer->part_path, transfer->destination, ec);
  }
  if(ec) {
    const std::string reason = "Unable to place " + transfer->destination.string() + ": " + ec.message();
    send(transfer->peer_id, TransferCompleteMessage{file_id, false, reason});
    end_incoming(file_id, TransferState::Error, reason);
    return;
  }
  send(transfer->peer_id, TransferCompleteMessage{file_id, true, std::string()});
  end_incoming(file_id, TransferState::Completed, std::string());
}

void TransferEngine::on_ack(const std::string& peer_id, const TransferAckMessage& ack){
  auto it = outgoing_.find(ack.file_id);
  if(it == outgoing_.end() || it->second->peer_id != peer_id) return;
  auto transfer = it->second;
  const auto& meta = transfer->metadata;
  transfer->acked_chunks = std::max(transfer->acked_chunks, ack.sequence_number + 1);
  transfer->bytes_acked = std::min<uint64_t>(meta.size, transfer->acked_chunks * meta.chunk_size);
  emit(peer_id, TransferDirection::Send,
       transfer->meter->update(transfer->bytes_acked, ProgressMeter::Clock::now()));
  pump(transfer);
}

void TransferEngine::on_complete(const std::string& peer_id, const TransferCompleteMessage& result){
  auto it = outgoing_.find(result.file_id);
  if(it == outgoing_.end() || it->second->peer_id != peer_id) return;
  if(result.success) {
    end_outgoing(result.file_id, TransferState::Completed, std::string());
  } else {
    end_outgoing(result.file_id, TransferState::Error,
                 result.error.empty() ? std::string("Receiver rejected the file") : result.error);
  }
}

void TransferEngine::on_cancel(const std::string& peer_id, const TransferCancelMessage& cancel){
  const std::string reason = cancel.reason.empty() ? std::string("cancelled by peer") : cancel.reason;
  auto out = outgoing_.find(cancel.file_id);
  if(out != outgoing_.end() && out->second->peer_id == peer_id) {
    end_outgoing(cancel.file_id, TransferState::Cancelled, reason);
  }
  auto in = incoming_.find(cancel.file_id);
  if(in != incoming_.end() && in->second->peer_id == peer_id) {
    end_incoming(cancel.file_id, TransferState::Cancelled, reason);
  }
}

bool TransferEngine::cancel(const std::string& file_id, const std::string& reason){
  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    auto it = progress_.find(file_id);
    if(it == progress_.end() || it->second.state != TransferState::Active) return false;
  }
  auto self = shared_from_this();
  asio::post(io_, [self, file_id, reason]{
    auto out = self->outgoing_.find(file_id);
    if(out != self->outgoing_.end()) {
      out->second->cancel.cancel();
      self->send(out->second->peer_id, TransferCancelMessage{file_id, reason});
      self->end_outgoing(file_id, TransferState::Cancelled, reason);
      return;
    }
    auto in = self->incoming_.find(file_id);
    if(in != self->incoming_.end()) {
      self->send(in->second->peer_id, TransferCancelMessage{file_id, reason});
      self->end_incoming(file_id, TransferState::Cancelled, reason);
    }
  });
  return true;
}

void TransferEngine::abort_peer(const std::string& peer_id, const std::string& reason){
  auto self = shared_from_this();
  asio::post(io_, [self, peer_id, reason]{
    std::vector<std::string> sends;
    std::vector<std::string> receives;
    for(const auto& [id, transfer] : self->outgoing_) {
      if(transfer->peer_id == peer_id) sends.push_back(id);
    }
    for(const auto& [id, transfer] : self->incoming_) {
      if(transfer->peer_id == peer_id) receives.push_back(id);
    }
    for(const auto& id : sends) self->end_outgoing(id, TransferState::Error, reason);
    for(const auto& id : receives) self->end_incoming(id, TransferState::Error, reason);
  });
}

void TransferEngine::end_outgoing(const std::string& file_id, TransferState state, const std::string& error){
  auto it = outgoing_.find(file_id);
  if(it == outgoing_.end()) return;
  auto transfer = it->second;
  outgoing_.erase(it);
  transfer->cancel.cancel();
  transfer->in.close();
  const auto& progress = transfer->meter->finish(state, error);
  if(state == TransferState::Completed) {
    log_info(logger_.get(), "Sent {} to {}", transfer->metadata.file_name, transfer->peer_id);
  } else {
    log_warn(logger_.get(), "Send of {} to {} {}: {}", transfer->metadata.file_name,
             transfer->peer_id, to_string(state), error);
  }
  emit(transfer->peer_id, TransferDirection::Send, progress);
  if(completion_callback_) {
    completion_callback_(transfer->peer_id, TransferDirection::Send, transfer->metadata, progress, transfer->path);
  }
}

void TransferEngine::end_incoming(const std::string& file_id, TransferState state, const std::string& error){
  auto it = incoming_.find(file_id);
  if(it == incoming_.end()) return;
  auto transfer = it->second;
  incoming_.erase(it);
  transfer->buffer->clear();
  if(transfer->out.is_open()) transfer->out.close();
  if(state != TransferState::Completed) {
    std::error_code ec;
    fs::remove(transfer->part_path, ec);
  }
  const auto& progress = transfer->meter->finish(state, error);
  if(state == TransferState::Completed) {
    log_info(logger_.get(), "Received {} from {}", transfer->metadata.file_name, transfer->peer_id);
  } else {
    log_warn(logger_.get(), "Receive of {} from {} {}: {}", transfer->metadata.file_name,
             transfer->peer_id, to_string(state), error);
  }
  emit(transfer->peer_id, TransferDirection::Receive, progress);
  if(completion_callback_) {
    const fs::path local = state == TransferState::Completed ? transfer->destination : fs::path();
    completion_callback_(transfer->peer_id, TransferDirection::Receive, transfer->metadata, progress, local);
  }
}

void TransferEngine::emit(const std::string& peer_id, TransferDirection direction, const TransferProgress& progress){
  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    progress_[progress.file_id] = progress;
    if(progress.state != TransferState::Active) {
      finished_order_.push_back(progress.file_id);
      while(finished_order_.size() > options_.finished_kept) {
        progress_.erase(finished_order_.front());
        finished_order_.pop_front();
      }
    }
  }
  if(options_.debug) {
    log_debug(logger_.get(), "{} {} {:.1f}% ({}/{})", to_string(direction), progress.file_name,
              progress.percentage, progress.bytes_transferred, progress.total_bytes);
  }
  if(progress_callback_) progress_callback_(peer_id, direction, progress);
}

void TransferEngine::send(const std::string& peer_id, const TransferMessage& msg){
  if(!send_(peer_id, serialize_transfer_message(msg))) {
    log_debug(logger_.get(), "Transfer message to {} not delivered", peer_id);
  }
}

std::vector<TransferProgress> TransferEngine::transfers() const {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  std::vector<TransferProgress> out;
  out.reserve(progress_.size());
  for(const auto& [id, progress] : progress_) out.push_back(progress);
  return out;
}

std::optional<TransferProgress> TransferEngine::transfer(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(progress_mutex_);
  auto it = progress_.find(file_id);
  if(it == progress_.end()) return std::nullopt;
  return it->second;
}
