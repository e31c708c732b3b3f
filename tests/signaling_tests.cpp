#include "connection.hpp"
#include "protocol.hpp"
#include "relay_server.hpp"
#include "server_warmup.hpp"
#include "signaling_client.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace wingsync::test;
using namespace std::chrono_literals;

namespace {

const char* kSession = "loopback-session-01";

// Plain relay link that records every line it receives.
class RawLink {
public:
  bool open(asio::io_context& io, unsigned short port) {
    std::promise<std::shared_ptr<Connection>> connected;
    auto result = connected.get_future();
    Connection::connect(io, "127.0.0.1", port, false, nullptr,
      [&connected](const std::error_code& ec, std::shared_ptr<Connection> conn){
        connected.set_value(ec ? nullptr : conn);
      });
    conn_ = result.get();
    if(!conn_) return false;
    conn_->set_handlers(
      [this](const std::shared_ptr<Connection>&, std::string line){
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::move(line));
      },
      [](const std::shared_ptr<Connection>&, const std::error_code&){});
    conn_->start();
    return true;
  }

  void send(const json& j) { conn_->send_json(j); }
  void close() { if(conn_) conn_->close(); }

  bool wait_for_error(const std::string& text) {
    return wait_for_condition([&]{
      std::lock_guard<std::mutex> lock(mutex_);
      for(const auto& line : lines_) {
        json j = json::parse(line, nullptr, false);
        if(j.is_object() && j.value("type", "") == "error" && j.value("error", "") == text) return true;
      }
      return false;
    }, 3000ms);
  }

private:
  std::shared_ptr<Connection> conn_;
  std::mutex mutex_;
  std::vector<std::string> lines_;
};

struct Inbox {
  std::mutex mutex;
  std::vector<SignalingMessage> messages;

  void push(const SignalingMessage& msg) {
    std::lock_guard<std::mutex> lock(mutex);
    messages.push_back(msg);
  }

  template<typename T, typename Pred>
  bool has(Pred pred) {
    std::lock_guard<std::mutex> lock(mutex);
    for(const auto& msg : messages) {
      if(auto* m = std::get_if<T>(&msg)) {
        if(pred(*m)) return true;
      }
    }
    return false;
  }
};

std::shared_ptr<RelayServer> start_relay(IoThread& io, std::shared_ptr<Logger> logger) {
  RelayServer::Options options;
  options.listen_ip = "127.0.0.1";
  options.listen_port = 0;
  auto relay = std::make_shared<RelayServer>(io.io(), options, std::move(logger));
  std::string error;
  bool started = io.call([&]{ return relay->start(error); });
  return started ? relay : nullptr;
}

std::shared_ptr<SignalingClient> make_client(IoThread& io,
                                             unsigned short port,
                                             const std::string& peer_id,
                                             bool create,
                                             Inbox& inbox,
                                             std::shared_ptr<Logger> logger) {
  SignalingClient::Options options;
  options.signaling_url = "sig://127.0.0.1:" + std::to_string(port);
  options.session_id = kSession;
  options.create_session = create;
  options.peer_id = peer_id;
  options.peer_name = "device-" + peer_id;
  auto client = std::make_shared<SignalingClient>(io.io(), options, std::move(logger));
  client->set_message_callback([&inbox](const SignalingMessage& msg){ inbox.push(msg); });
  return client;
}

bool test_codec_rejects_bad_input(TestContext&) {
  std::string error;
  WINGSYNC_CHECK(!parse_signaling_line("not json", error));
  WINGSYNC_CHECK(error == "Invalid message format");
  WINGSYNC_CHECK(!parse_signaling_line("[1,2]", error));
  WINGSYNC_CHECK(error == "Invalid message format");
  WINGSYNC_CHECK(!parse_signaling_line(R"({"sessionId":"abc"})", error));
  WINGSYNC_CHECK(error == "Invalid message format");
  WINGSYNC_CHECK(!parse_signaling_line(R"({"type":"session-join"})", error));
  WINGSYNC_CHECK(error == "Session ID required");
  WINGSYNC_CHECK(!parse_signaling_line(R"({"type":"offer","sessionId":"s"})", error));
  WINGSYNC_CHECK(error == "Peer ID required for offer");
  WINGSYNC_CHECK(!parse_signaling_line(R"({"type":"answer","sessionId":"s","peerId":"p"})", error));
  WINGSYNC_CHECK(error == "Missing data for answer");
  WINGSYNC_CHECK(!parse_signaling_line(R"({"type":"teleport","sessionId":"s"})", error));
  WINGSYNC_CHECK(error == "Unknown message type: teleport");
  return true;
}

bool test_codec_fields(TestContext&) {
  std::string error;
  auto msg = parse_signaling_line(
    R"({"type":"ice-candidate","sessionId":"s1","peerId":"p2","data":{"candidate":"c"}})", error);
  WINGSYNC_CHECK(msg.has_value());
  auto* ice = std::get_if<IceCandidateMessage>(&*msg);
  WINGSYNC_CHECK(ice != nullptr);
  WINGSYNC_CHECK(ice->session_id == "s1");
  WINGSYNC_CHECK(ice->peer_id == "p2");
  WINGSYNC_CHECK(ice->data["candidate"] == "c");

  SessionRequest reply;
  reply.session_id = "s1";
  reply.peer_id = "p1";
  reply.success = true;
  reply.peers.push_back(PeerSummary{"p1", "laptop", "desktop", true});
  json j = serialize_signaling_message(SessionJoinMessage{reply});
  WINGSYNC_CHECK(j["type"] == "session-join");
  WINGSYNC_CHECK(j["success"] == true);
  WINGSYNC_CHECK(j["peers"].size() == 1);
  WINGSYNC_CHECK(j["peers"][0]["name"] == "laptop");
  WINGSYNC_CHECK(j["peers"][0]["deviceType"] == "desktop");

  auto list = parse_signaling_line(R"({"type":"peer-list","sessionId":"s1","peers":[{"id":"x"}]})", error);
  WINGSYNC_CHECK(list && std::get<PeerListMessage>(*list).peers.size() == 1);
  WINGSYNC_CHECK(std::get<PeerListMessage>(*list).peers[0].device_type == "desktop");
  WINGSYNC_CHECK(std::get<PeerListMessage>(*list).peers[0].is_online);
  WINGSYNC_CHECK(std::string(message_type(*list)) == "peer-list");
  return true;
}

bool test_relay_session_and_forwarding(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("relay");
  auto client_logger = std::make_shared<Logger>("signaling");
  ctx.logs.attach(logger);
  ctx.logs.attach(client_logger);
  auto relay = start_relay(io, logger);
  WINGSYNC_CHECK(relay != nullptr);
  WINGSYNC_CHECK(relay->port() != 0);

  Inbox inbox_a, inbox_b;
  auto a = make_client(io, relay->port(), "peer-a", true, inbox_a, client_logger);
  auto b = make_client(io, relay->port(), "peer-b", false, inbox_b, client_logger);
  a->start();
  WINGSYNC_CHECK(wait_for_condition([&]{ return a->state() == SignalingClient::State::Joined; }, 3000ms));
  b->start();
  WINGSYNC_CHECK(wait_for_condition([&]{ return b->state() == SignalingClient::State::Joined; }, 3000ms));

  WINGSYNC_CHECK(wait_for_condition([&]{
    return inbox_a.has<PeerListMessage>([](const PeerListMessage& m){ return m.peers.size() == 2; });
  }, 3000ms));
  WINGSYNC_CHECK(io.call([&]{ return relay->session_count(); }) == 1);
  auto peers = io.call([&]{ return relay->session_peers(kSession); });
  WINGSYNC_CHECK(peers.size() == 2);
  WINGSYNC_CHECK(peers[0].name == "device-peer-a");

  OfferMessage offer;
  offer.peer_id = "peer-b";
  offer.data = json{{"sdp", "offer-from-a"}};
  WINGSYNC_CHECK(a->send(offer));
  WINGSYNC_CHECK(wait_for_condition([&]{
    return inbox_b.has<OfferMessage>([](const OfferMessage& m){
      return m.peer_id == "peer-a" && m.session_id == kSession && m.data.value("sdp", "") == "offer-from-a";
    });
  }, 3000ms));

  AnswerMessage unknown;
  unknown.peer_id = "peer-z";
  unknown.data = json{{"sdp", "x"}};
  WINGSYNC_CHECK(b->send(unknown));
  WINGSYNC_CHECK(wait_for_condition([&]{
    return inbox_b.has<ErrorMessage>([](const ErrorMessage& m){ return m.error == "Peer not connected"; });
  }, 3000ms));

  b->stop();
  WINGSYNC_CHECK(wait_for_condition([&]{
    return inbox_a.has<PeerListMessage>([](const PeerListMessage& m){ return m.peers.size() == 1; });
  }, 3000ms));
  a->stop();
  WINGSYNC_CHECK(wait_for_condition([&]{ return io.call([&]{ return relay->session_count(); }) == 0; }, 3000ms));
  WINGSYNC_CHECK(a->state() == SignalingClient::State::Closed);
  WINGSYNC_CHECK(!a->send(OfferMessage{}));
  io.call([&]{ relay->stop(); return true; });
  return true;
}

bool test_relay_rejects_unjoined_links(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("relay");
  ctx.logs.attach(logger);
  auto relay = start_relay(io, logger);
  WINGSYNC_CHECK(relay != nullptr);

  Inbox inbox;
  auto member = make_client(io, relay->port(), "peer-a", true, inbox, logger);
  member->start();
  WINGSYNC_CHECK(wait_for_condition([&]{ return member->state() == SignalingClient::State::Joined; }, 3000ms));

  RawLink raw;
  WINGSYNC_CHECK(raw.open(io.io(), relay->port()));
  raw.send(json{{"type", "offer"}, {"sessionId", "no-such-session"}, {"peerId", "peer-a"}, {"data", {{"sdp", "x"}}}});
  WINGSYNC_CHECK(raw.wait_for_error("Session not found"));
  raw.send(json{{"type", "offer"}, {"sessionId", kSession}, {"peerId", "peer-a"}, {"data", {{"sdp", "x"}}}});
  WINGSYNC_CHECK(raw.wait_for_error("Join the session first"));
  raw.send(json{{"type", "peer-list"}, {"sessionId", kSession}, {"peers", json::array()}});
  WINGSYNC_CHECK(raw.wait_for_error("Unknown message type: peer-list"));
  raw.send(json{{"type", "session-join"}});
  WINGSYNC_CHECK(raw.wait_for_error("Session ID required"));
  raw.close();

  member->stop();
  io.call([&]{ relay->stop(); return true; });
  return true;
}

bool test_relay_health_and_sweep(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("relay");
  ctx.logs.attach(logger);
  auto relay = start_relay(io, logger);
  WINGSYNC_CHECK(relay != nullptr);

  const std::string http_url = "http://127.0.0.1:" + std::to_string(relay->port());
  WINGSYNC_CHECK(probe_health(http_url, 2000ms));
  auto health = io.call([&]{ return relay->health(); });
  WINGSYNC_CHECK(health["status"] == "healthy");
  WINGSYNC_CHECK(health["service"] == kRelayServiceName);
  WINGSYNC_CHECK(health["activeSessions"] == 0);

  Inbox inbox;
  auto client = make_client(io, relay->port(), "peer-a", true, inbox, logger);
  client->start();
  WINGSYNC_CHECK(wait_for_condition([&]{ return client->state() == SignalingClient::State::Joined; }, 3000ms));
  WINGSYNC_CHECK(io.call([&]{ return relay->health()["activeSessions"].get<std::size_t>(); }) == 1);

  WINGSYNC_CHECK(io.call([&]{ return relay->sweep_idle_sessions(RelayServer::Clock::now()); }) == 0);
  auto later = RelayServer::Clock::now() + std::chrono::hours(1);
  WINGSYNC_CHECK(io.call([&]{ return relay->sweep_idle_sessions(later); }) == 1);
  WINGSYNC_CHECK(io.call([&]{ return relay->session_count(); }) == 0);
  WINGSYNC_CHECK(ctx.logs.wait_for_substring("Cleaning up expired session", 1000ms));
  WINGSYNC_CHECK(wait_for_condition([&]{ return client->state() == SignalingClient::State::Failed; }, 3000ms));

  io.call([&]{ relay->stop(); return true; });
  return true;
}

bool test_client_fails_without_relay(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("signaling");
  ctx.logs.attach(logger);

  // Bind and release a port so nothing is listening on it.
  unsigned short port = 0;
  {
    asio::ip::tcp::acceptor probe(io.io(), asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = probe.local_endpoint().port();
  }
  Inbox inbox;
  auto client = make_client(io, port, "peer-a", true, inbox, logger);
  std::string reason;
  std::mutex mutex;
  client->set_state_callback([&](SignalingClient::State state, const std::string& why){
    if(state != SignalingClient::State::Failed) return;
    std::lock_guard<std::mutex> lock(mutex);
    reason = why;
  });
  client->start();
  WINGSYNC_CHECK(wait_for_condition([&]{ return client->state() == SignalingClient::State::Failed; }, 3000ms));
  std::lock_guard<std::mutex> lock(mutex);
  WINGSYNC_CHECK(reason.find("relay unreachable") == 0);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"codec_rejects_bad_input", test_codec_rejects_bad_input},
    {"codec_fields", test_codec_fields},
    {"relay_session_and_forwarding", test_relay_session_and_forwarding},
    {"relay_rejects_unjoined_links", test_relay_rejects_unjoined_links},
    {"relay_health_and_sweep", test_relay_health_and_sweep},
    {"client_fails_without_relay", test_client_fails_without_relay},
  };
  return run_test_suite("signaling", tests, argc, argv);
}
