#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"

#include <asio.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace wingsync::test;
namespace fs = std::filesystem;

namespace {

std::string make_payload(std::size_t size) {
  std::string payload;
  payload.reserve(size);
  for(std::size_t i = 0; i < size; ++i) payload += static_cast<char>((i * 31 + 7) % 256);
  return payload;
}

// Two engines joined by an in-process link. Messages from A go through the
// JSON codec and are delivered to B on the io_context, and the reverse.
struct LinkedEngines {
  struct Finished {
    TransferDirection direction;
    TransferMetadata metadata;
    TransferProgress progress;
    fs::path local_path;
  };

  LinkedEngines(TestContext& ctx, TransferEngine::Options options, fs::path inbox)
    : inbox_dir(std::move(inbox)) {
    auto logger_a = std::make_shared<Logger>("xfer-a");
    auto logger_b = std::make_shared<Logger>("xfer-b");
    ctx.logs.attach(logger_a);
    ctx.logs.attach(logger_b);

    a = std::make_shared<TransferEngine>(io, [this](const std::string&, const nlohmann::json& j){
      if(!link_up) return false;
      nlohmann::json copy = j;
      if(tamper) tamper(copy);
      deliver(copy, b, "peer-a");
      return true;
    }, options, logger_a);
    b = std::make_shared<TransferEngine>(io, [this](const std::string&, const nlohmann::json& j){
      if(!link_up) return false;
      deliver(j, a, "peer-b");
      return true;
    }, options, logger_b);

    a->set_completion_callback([this](const std::string&, TransferDirection d, const TransferMetadata& m,
                                      const TransferProgress& p, const fs::path& path){
      a_finished.push_back(Finished{d, m, p, path});
    });
    b->set_completion_callback([this](const std::string&, TransferDirection d, const TransferMetadata& m,
                                      const TransferProgress& p, const fs::path& path){
      b_finished.push_back(Finished{d, m, p, path});
    });
    b->set_progress_callback([this](const std::string&, TransferDirection, const TransferProgress& p){
      b_progress.push_back(p);
    });
    b->set_destination_resolver([this](const std::string& peer, const TransferMetadata& m) -> std::optional<fs::path> {
      if(peer != "peer-a" || refuse) return std::nullopt;
      received_context = m.context;
      if(unique_names) return unique_destination(inbox_dir, m.file_name, "file-" + m.file_id);
      return inbox_dir / m.file_name;
    });
  }

  void deliver(const nlohmann::json& j, const std::shared_ptr<TransferEngine>& to, const std::string& from) {
    asio::post(io, [to, from, j]{
      std::string error;
      auto msg = parse_transfer_message(j, error);
      if(msg) to->handle_message(from, *msg);
    });
  }

  void run() {
    io.restart();
    io.run();
  }

  asio::io_context io;
  fs::path inbox_dir;
  bool link_up = true;
  bool refuse = false;
  bool unique_names = false;
  std::function<void(nlohmann::json&)> tamper;
  nlohmann::json received_context;
  std::shared_ptr<TransferEngine> a;
  std::shared_ptr<TransferEngine> b;
  std::vector<Finished> a_finished;
  std::vector<Finished> b_finished;
  std::vector<TransferProgress> b_progress;
};

TransferEngine::Options small_chunks() {
  TransferEngine::Options options;
  options.chunk_size = 7;
  options.window_chunks = 2;
  return options;
}

bool test_chunk_layout(TestContext&) {
  WINGSYNC_CHECK(chunk_count(0, 4) == 1);
  WINGSYNC_CHECK(chunk_count(4, 4) == 1);
  WINGSYNC_CHECK(chunk_count(10, 4) == 3);

  auto chunks = split_into_chunks("abcdefghij", 4, "f1");
  WINGSYNC_CHECK(chunks.size() == 3);
  WINGSYNC_CHECK(chunks[0].data == "abcd" && !chunks[0].is_last_chunk);
  WINGSYNC_CHECK(chunks[2].data == "ij" && chunks[2].is_last_chunk);
  WINGSYNC_CHECK(chunks[2].sequence_number == 2 && chunks[2].file_id == "f1");

  auto empty = split_into_chunks("", 4, "f2");
  WINGSYNC_CHECK(empty.size() == 1);
  WINGSYNC_CHECK(empty[0].data.empty() && empty[0].is_last_chunk);
  return true;
}

bool test_reassembly_out_of_order(TestContext&) {
  std::string out;
  ReassemblyBuffer buffer([&out](std::string_view bytes){
    out.append(bytes.data(), bytes.size());
    return true;
  });
  auto chunks = split_into_chunks("hello chunked world", 5, "f");
  WINGSYNC_CHECK(chunks.size() == 4);
  WINGSYNC_CHECK(buffer.accept(chunks[3]) == ReassemblyBuffer::Accept::Ok);
  WINGSYNC_CHECK(buffer.accept(chunks[1]) == ReassemblyBuffer::Accept::Ok);
  WINGSYNC_CHECK(out.empty());
  WINGSYNC_CHECK(buffer.buffered_chunks() == 2);
  WINGSYNC_CHECK(buffer.accept(chunks[0]) == ReassemblyBuffer::Accept::Ok);
  WINGSYNC_CHECK(out == "hello chun");
  WINGSYNC_CHECK(buffer.accept(chunks[0]) == ReassemblyBuffer::Accept::Duplicate);
  WINGSYNC_CHECK(!buffer.complete());
  WINGSYNC_CHECK(buffer.accept(chunks[2]) == ReassemblyBuffer::Accept::Ok);
  WINGSYNC_CHECK(buffer.complete());
  WINGSYNC_CHECK(out == "hello chunked world");
  WINGSYNC_CHECK(buffer.bytes_received() == out.size());

  ChunkData stray;
  stray.sequence_number = 9;
  stray.data = "x";
  WINGSYNC_CHECK(buffer.accept(stray) == ReassemblyBuffer::Accept::AfterLast);
  return true;
}

bool test_reassemble_checks(TestContext&) {
  const std::string payload = make_payload(100);
  const std::string hash = sha256_hex(payload);
  std::string error;

  auto chunks = split_into_chunks(payload, 16, "f");
  std::reverse(chunks.begin(), chunks.end());
  auto whole = reassemble(chunks, hash, error);
  WINGSYNC_CHECK(whole && *whole == payload);

  auto gappy = split_into_chunks(payload, 16, "f");
  gappy.erase(gappy.begin() + 2);
  WINGSYNC_CHECK(!reassemble(gappy, hash, error));
  WINGSYNC_CHECK(error == "missing chunk 2");

  auto tampered = split_into_chunks(payload, 16, "f");
  tampered[1].data[0] ^= 0x1;
  WINGSYNC_CHECK(!reassemble(tampered, hash, error));
  WINGSYNC_CHECK(error.find("integrity check failed") != std::string::npos);
  return true;
}

bool test_progress_meter(TestContext&) {
  using namespace std::chrono_literals;
  ProgressMeter meter("f", "file.bin", 1000, 3000ms);
  auto t0 = ProgressMeter::Clock::now();
  auto p = meter.update(0, t0);
  WINGSYNC_CHECK(p.percentage == 0.0);
  WINGSYNC_CHECK(std::isinf(p.eta));

  p = meter.update(500, t0 + 1000ms);
  WINGSYNC_CHECK(p.percentage == 50.0);
  WINGSYNC_CHECK(std::fabs(p.speed - 500.0) < 1e-6);
  WINGSYNC_CHECK(std::fabs(p.eta - 1.0) < 1e-6);

  // Samples older than the window stop counting toward the speed.
  p = meter.update(600, t0 + 5000ms);
  WINGSYNC_CHECK(p.speed == 0.0);

  p = meter.finish(TransferState::Completed);
  WINGSYNC_CHECK(p.state == TransferState::Completed);
  WINGSYNC_CHECK(p.bytes_transferred == 1000 && p.percentage == 100.0 && p.eta == 0.0);

  ProgressMeter empty("g", "empty", 0);
  WINGSYNC_CHECK(empty.update(0, t0).percentage == 100.0);
  WINGSYNC_CHECK(empty.progress().eta == 0.0);
  return true;
}

bool test_codec_errors(TestContext&) {
  std::string error;
  WINGSYNC_CHECK(!parse_transfer_message(nlohmann::json::array(), error));
  WINGSYNC_CHECK(error == "Invalid message format");
  WINGSYNC_CHECK(!parse_transfer_message({{"type", "transfer-ack"}}, error));
  WINGSYNC_CHECK(error == "Missing fileId for transfer-ack");
  WINGSYNC_CHECK(!parse_transfer_message({{"type", "transfer-bogus"}, {"fileId", "f"}}, error));
  WINGSYNC_CHECK(error == "Unknown message type: transfer-bogus");
  WINGSYNC_CHECK(!parse_transfer_message({{"type", "transfer-metadata"}, {"fileId", "f"}, {"chunkSize", 4}}, error));
  WINGSYNC_CHECK(error == "Incomplete transfer metadata");

  ChunkData chunk;
  chunk.file_id = "f";
  chunk.sequence_number = 3;
  chunk.data = std::string("\0\x01\xff binary", 10);
  chunk.is_last_chunk = true;
  auto wire = serialize_transfer_message(TransferChunkMessage{chunk});
  WINGSYNC_CHECK(wire["type"] == "transfer-chunk");
  auto back = parse_transfer_message(wire, error);
  WINGSYNC_CHECK(back && std::holds_alternative<TransferChunkMessage>(*back));
  WINGSYNC_CHECK(std::get<TransferChunkMessage>(*back).chunk.data == chunk.data);
  return true;
}

bool test_send_and_receive(TestContext& ctx) {
  TempDir dir("transfer_send");
  const std::string payload = make_payload(1000);
  write_file(dir / "source.bin", payload);

  LinkedEngines link(ctx, small_chunks(), dir / "inbox");
  std::string error;
  auto id = link.a->send_file("peer-b", dir / "source.bin", "copy.bin", {{"tag", 42}}, error);
  WINGSYNC_CHECK(id.has_value());
  link.run();

  WINGSYNC_CHECK(link.a_finished.size() == 1);
  WINGSYNC_CHECK(link.a_finished[0].direction == TransferDirection::Send);
  WINGSYNC_CHECK(link.a_finished[0].progress.state == TransferState::Completed);
  WINGSYNC_CHECK(link.b_finished.size() == 1);
  const auto& received = link.b_finished[0];
  WINGSYNC_CHECK(received.progress.state == TransferState::Completed);
  WINGSYNC_CHECK(received.metadata.file_id == *id);
  WINGSYNC_CHECK(received.metadata.total_chunks == 143);
  WINGSYNC_CHECK(received.local_path == dir / "inbox" / "copy.bin");
  WINGSYNC_CHECK(read_file(received.local_path) == payload);
  WINGSYNC_CHECK(!fs::exists(dir / "inbox" / "copy.bin.wingsync-part"));
  WINGSYNC_CHECK(link.received_context.value("tag", 0) == 42);

  // Progress only moves forward and ends at 100%.
  for(std::size_t i = 1; i < link.b_progress.size(); ++i) {
    WINGSYNC_CHECK(link.b_progress[i].bytes_transferred >= link.b_progress[i - 1].bytes_transferred);
  }
  WINGSYNC_CHECK(link.b_progress.back().percentage == 100.0);

  auto sender_view = link.a->transfer(*id);
  WINGSYNC_CHECK(sender_view && sender_view->state == TransferState::Completed);
  WINGSYNC_CHECK(sender_view->bytes_transferred == payload.size());
  return true;
}

bool test_empty_file(TestContext& ctx) {
  TempDir dir("transfer_empty");
  write_file(dir / "empty.txt", "");
  LinkedEngines link(ctx, small_chunks(), dir / "inbox");
  std::string error;
  auto id = link.a->send_file("peer-b", dir / "empty.txt", "", nlohmann::json::object(), error);
  WINGSYNC_CHECK(id.has_value());
  link.run();
  WINGSYNC_CHECK(link.b_finished.size() == 1);
  WINGSYNC_CHECK(link.b_finished[0].progress.state == TransferState::Completed);
  WINGSYNC_CHECK(link.b_finished[0].metadata.total_chunks == 1);
  WINGSYNC_CHECK(read_file(dir / "inbox" / "empty.txt") == std::string());
  return true;
}

bool test_finished_transfers_are_bounded(TestContext& ctx) {
  TempDir dir("transfer_bounded");
  auto options = small_chunks();
  options.finished_kept = 2;
  LinkedEngines link(ctx, options, dir / "inbox");
  std::vector<std::string> ids;
  for(int i = 0; i < 4; ++i) {
    const std::string name = "file" + std::to_string(i) + ".txt";
    write_file(dir / name, "payload " + std::to_string(i));
    std::string error;
    auto id = link.a->send_file("peer-b", dir / name, "", nlohmann::json::object(), error);
    WINGSYNC_CHECK(id.has_value());
    ids.push_back(*id);
    link.run();
  }
  WINGSYNC_CHECK(link.a_finished.size() == 4);
  WINGSYNC_CHECK(link.b_finished.size() == 4);
  WINGSYNC_CHECK(link.a->transfers().size() == 2);
  WINGSYNC_CHECK(link.b->transfers().size() == 2);
  WINGSYNC_CHECK(!link.a->transfer(ids[0]));
  WINGSYNC_CHECK(!link.a->transfer(ids[1]));
  auto last = link.a->transfer(ids[3]);
  WINGSYNC_CHECK(last && last->state == TransferState::Completed);
  WINGSYNC_CHECK(read_file(dir / "inbox" / "file0.txt") == std::string("payload 0"));
  return true;
}

bool test_unique_destination(TestContext&) {
  TempDir dir("transfer_unique");
  WINGSYNC_CHECK(unique_destination(dir.path(), "report.pdf", "x") == dir / "report.pdf");
  write_file(dir / "report.pdf", "done");
  write_file(dir / "report (1).pdf.wingsync-part", "in flight");
  WINGSYNC_CHECK(unique_destination(dir.path(), "report.pdf", "x") == dir / "report (2).pdf");
  WINGSYNC_CHECK(unique_destination(dir.path(), "../sneaky/report.pdf", "x") == dir / "report (2).pdf");
  WINGSYNC_CHECK(unique_destination(dir.path(), "..", "file-7") == dir / "file-7");
  return true;
}

bool test_same_name_transfers_in_flight(TestContext& ctx) {
  TempDir dir("transfer_same_name");
  const std::string first = make_payload(120);
  const std::string second = "second " + make_payload(90);
  write_file(dir / "one" / "dup.txt", first);
  write_file(dir / "two" / "dup.txt", second);

  LinkedEngines link(ctx, small_chunks(), dir / "inbox");
  link.unique_names = true;
  std::string error;
  WINGSYNC_CHECK(link.a->send_file("peer-b", dir / "one" / "dup.txt", "", nlohmann::json::object(), error));
  WINGSYNC_CHECK(link.a->send_file("peer-b", dir / "two" / "dup.txt", "", nlohmann::json::object(), error));
  link.run();

  WINGSYNC_CHECK(link.b_finished.size() == 2);
  for(const auto& finished : link.b_finished) WINGSYNC_CHECK(finished.progress.state == TransferState::Completed);
  WINGSYNC_CHECK(link.b_finished[0].local_path != link.b_finished[1].local_path);
  WINGSYNC_CHECK(read_file(dir / "inbox" / "dup.txt") == first);
  WINGSYNC_CHECK(read_file(dir / "inbox" / "dup (1).txt") == second);
  return true;
}

bool test_receiver_refuses(TestContext& ctx) {
  TempDir dir("transfer_refuse");
  write_file(dir / "a.txt", "abc");
  LinkedEngines link(ctx, small_chunks(), dir / "inbox");
  link.refuse = true;
  std::string error;
  auto id = link.a->send_file("peer-b", dir / "a.txt", "", nlohmann::json::object(), error);
  WINGSYNC_CHECK(id.has_value());
  link.run();
  WINGSYNC_CHECK(link.a_finished.size() == 1);
  WINGSYNC_CHECK(link.a_finished[0].progress.state == TransferState::Error);
  WINGSYNC_CHECK(link.a_finished[0].progress.error == "No destination for incoming file");
  WINGSYNC_CHECK(link.b_finished.empty());
  return true;
}

bool test_integrity_failure(TestContext& ctx) {
  TempDir dir("transfer_integrity");
  write_file(dir / "a.bin", make_payload(50));
  LinkedEngines link(ctx, small_chunks(), dir / "inbox");
  link.tamper = [](nlohmann::json& j){
    if(j.value("type", std::string()) == "transfer-metadata") j["hash"] = sha256_hex("something else");
  };
  std::string error;
  WINGSYNC_CHECK(link.a->send_file("peer-b", dir / "a.bin", "", nlohmann::json::object(), error));
  link.run();
  WINGSYNC_CHECK(link.b_finished.size() == 1);
  WINGSYNC_CHECK(link.b_finished[0].progress.state == TransferState::Error);
  WINGSYNC_CHECK(link.b_finished[0].local_path.empty());
  WINGSYNC_CHECK(!fs::exists(dir / "inbox" / "a.bin"));
  WINGSYNC_CHECK(!fs::exists(dir / "inbox" / "a.bin.wingsync-part"));
  WINGSYNC_CHECK(link.a_finished.size() == 1);
  WINGSYNC_CHECK(link.a_finished[0].progress.error.find("Integrity check failed") != std::string::npos);
  return true;
}

bool test_cancel_mid_transfer(TestContext& ctx) {
  TempDir dir("transfer_cancel");
  write_file(dir / "big.bin", make_payload(1000));
  LinkedEngines link(ctx, small_chunks(), dir / "inbox");
  std::string error;
  auto id = link.a->send_file("peer-b", dir / "big.bin", "", nlohmann::json::object(), error);
  WINGSYNC_CHECK(id.has_value());
  WINGSYNC_CHECK(link.a->cancel(*id, "changed my mind"));
  link.run();
  WINGSYNC_CHECK(link.a_finished.size() == 1);
  WINGSYNC_CHECK(link.a_finished[0].progress.state == TransferState::Cancelled);
  WINGSYNC_CHECK(link.b_finished.size() == 1);
  WINGSYNC_CHECK(link.b_finished[0].progress.state == TransferState::Cancelled);
  WINGSYNC_CHECK(link.b_finished[0].progress.error == "changed my mind");
  WINGSYNC_CHECK(!fs::exists(dir / "inbox" / "big.bin"));
  WINGSYNC_CHECK(!fs::exists(dir / "inbox" / "big.bin.wingsync-part"));
  WINGSYNC_CHECK(!link.a->cancel(*id));
  return true;
}

bool test_link_down(TestContext& ctx) {
  TempDir dir("transfer_link_down");
  write_file(dir / "a.txt", "abc");
  LinkedEngines link(ctx, small_chunks(), dir / "inbox");
  link.link_up = false;
  std::string error;
  WINGSYNC_CHECK(link.a->send_file("peer-b", dir / "a.txt", "", nlohmann::json::object(), error));
  link.run();
  WINGSYNC_CHECK(link.a_finished.size() == 1);
  WINGSYNC_CHECK(link.a_finished[0].progress.state == TransferState::Error);
  WINGSYNC_CHECK(link.a_finished[0].progress.error == "Peer link unavailable");

  auto missing = link.a->send_file("peer-b", dir / "nope.txt", "", nlohmann::json::object(), error);
  WINGSYNC_CHECK(!missing);
  WINGSYNC_CHECK(error.find("Not a regular file") != std::string::npos);
  return true;
}

bool test_abort_peer(TestContext& ctx) {
  TempDir dir("transfer_abort");
  write_file(dir / "big.bin", make_payload(1000));
  LinkedEngines link(ctx, small_chunks(), dir / "inbox");
  std::string error;
  WINGSYNC_CHECK(link.a->send_file("peer-b", dir / "big.bin", "", nlohmann::json::object(), error));
  link.a->abort_peer("peer-b", "peer disconnected");
  link.run();
  WINGSYNC_CHECK(link.a_finished.size() == 1);
  WINGSYNC_CHECK(link.a_finished[0].progress.state == TransferState::Error);
  WINGSYNC_CHECK(link.a_finished[0].progress.error == "peer disconnected");
  WINGSYNC_CHECK(link.b_finished.empty());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"chunk_layout", test_chunk_layout},
    {"reassembly_out_of_order", test_reassembly_out_of_order},
    {"reassemble_checks", test_reassemble_checks},
    {"progress_meter", test_progress_meter},
    {"codec_errors", test_codec_errors},
    {"send_and_receive", test_send_and_receive},
    {"empty_file", test_empty_file},
    {"finished_transfers_are_bounded", test_finished_transfers_are_bounded},
    {"unique_destination", test_unique_destination},
    {"same_name_transfers_in_flight", test_same_name_transfers_in_flight},
    {"receiver_refuses", test_receiver_refuses},
    {"integrity_failure", test_integrity_failure},
    {"cancel_mid_transfer", test_cancel_mid_transfer},
    {"link_down", test_link_down},
    {"abort_peer", test_abort_peer},
  };
  return run_test_suite("transfer", tests, argc, argv);
}
