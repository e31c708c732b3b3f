#include "peer_manager.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace wingsync::test;

namespace {

class FakeTransport : public PeerTransport {
public:
  explicit FakeTransport(std::string remote) : remote_(std::move(remote)) {}

  void set_callbacks(Callbacks callbacks) override { callbacks_ = std::move(callbacks); }

  nlohmann::json create_offer() override { return {{"type", "offer"}, {"sdp", "offer-for-" + remote_}}; }
  nlohmann::json create_answer() override { return {{"type", "answer"}, {"sdp", "answer-for-" + remote_}}; }

  bool set_remote_description(const nlohmann::json& description, std::string& error) override {
    if(!reject_reason.empty()) {
      error = reject_reason;
      return false;
    }
    descriptions.push_back(description);
    return true;
  }
  bool add_remote_candidate(const nlohmann::json& candidate, std::string&) override {
    candidates.push_back(candidate);
    return true;
  }

  bool send(const nlohmann::json& message) override {
    sent.push_back(message);
    return open_;
  }
  void close() override {
    closed = true;
    open_ = false;
  }
  bool is_open() const override { return open_; }

  void open() {
    open_ = true;
    if(callbacks_.on_open) callbacks_.on_open();
  }
  void fail(const std::string& reason) {
    if(callbacks_.on_failed) callbacks_.on_failed(reason);
  }

  std::string reject_reason;
  std::vector<nlohmann::json> descriptions;
  std::vector<nlohmann::json> candidates;
  std::vector<nlohmann::json> sent;
  bool closed = false;

private:
  std::string remote_;
  Callbacks callbacks_;
  bool open_ = false;
};

class FakeFactory : public PeerTransportFactory {
public:
  std::shared_ptr<PeerTransport> create(const std::string& remote_peer_id) override {
    auto transport = std::make_shared<FakeTransport>(remote_peer_id);
    created.push_back(transport);
    return transport;
  }

  std::vector<std::shared_ptr<FakeTransport>> created;
};

// Everything runs on the test thread; drain() stands in for the io thread.
struct Harness {
  explicit Harness(const std::string& local_id)
    : factory(std::make_shared<FakeFactory>()),
      manager(std::make_shared<PeerManager>(io, local_id, factory)) {
    manager->set_signal_sender([this](SignalingMessage msg){
      if(!relay_joined) return false;
      signals.push_back(std::move(msg));
      return true;
    });
    manager->set_error_callback([this](const ErrorMessage& e){ errors.push_back(e.error); });
  }

  void drain() {
    io.restart();
    io.run();
  }

  void roster(const std::vector<std::string>& ids) {
    PeerListMessage list;
    list.session_id = "s1";
    for(const auto& id : ids) {
      PeerSummary summary;
      summary.id = id;
      summary.name = id + "-laptop";
      list.peers.push_back(summary);
    }
    manager->handle_signal(list);
  }

  template<typename Message>
  std::vector<Message> sent_of() const {
    std::vector<Message> out;
    for(const auto& msg : signals) {
      if(auto* m = std::get_if<Message>(&msg)) out.push_back(*m);
    }
    return out;
  }

  asio::io_context io;
  std::shared_ptr<FakeFactory> factory;
  std::shared_ptr<PeerManager> manager;
  bool relay_joined = true;
  std::vector<SignalingMessage> signals;
  std::vector<std::string> errors;
};

nlohmann::json candidate(int n) {
  return {{"candidate", "cand-" + std::to_string(n)}, {"sdpMid", "0"}};
}

bool test_transition_table(TestContext&) {
  using S = ConnectionState;
  WINGSYNC_CHECK(is_valid_transition(S::Disconnected, S::Connecting));
  WINGSYNC_CHECK(!is_valid_transition(S::Disconnected, S::Connected));
  WINGSYNC_CHECK(!is_valid_transition(S::Disconnected, S::Disconnected));
  WINGSYNC_CHECK(is_valid_transition(S::Connecting, S::Connected));
  WINGSYNC_CHECK(is_valid_transition(S::Connecting, S::Failed));
  WINGSYNC_CHECK(!is_valid_transition(S::Connecting, S::Connecting));
  WINGSYNC_CHECK(!is_valid_transition(S::Connected, S::Connecting));
  WINGSYNC_CHECK(!is_valid_transition(S::Connected, S::Connected));
  WINGSYNC_CHECK(is_valid_transition(S::Connected, S::Disconnected));
  WINGSYNC_CHECK(is_valid_transition(S::Connected, S::Closed));
  WINGSYNC_CHECK(is_valid_transition(S::Failed, S::Connecting));
  WINGSYNC_CHECK(is_valid_transition(S::Closed, S::Connecting));
  WINGSYNC_CHECK(!is_valid_transition(S::Failed, S::Connected));
  WINGSYNC_CHECK(std::string(to_string(S::Failed)) == "failed");
  return true;
}

bool test_candidates_before_offer_are_flushed(TestContext&) {
  Harness h("alice");
  h.roster({"bob"});
  WINGSYNC_CHECK(h.manager->known_peer_count() == 1);

  h.manager->handle_signal(IceCandidateMessage{{std::string(), "bob", candidate(1)}});
  h.manager->handle_signal(IceCandidateMessage{{std::string(), "bob", candidate(2)}});
  WINGSYNC_CHECK(h.factory->created.empty());

  h.manager->handle_signal(OfferMessage{{std::string(), "bob", {{"type", "offer"}, {"sdp", "x"}}}});
  WINGSYNC_CHECK(h.factory->created.size() == 1);
  auto transport = h.factory->created[0];
  WINGSYNC_CHECK(transport->descriptions.size() == 1);
  WINGSYNC_CHECK(transport->candidates.size() == 2);
  WINGSYNC_CHECK(transport->candidates[0] == candidate(1));
  WINGSYNC_CHECK(transport->candidates[1] == candidate(2));

  auto answers = h.sent_of<AnswerMessage>();
  WINGSYNC_CHECK(answers.size() == 1);
  WINGSYNC_CHECK(answers[0].peer_id == "bob");
  WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Connecting);

  // Once the description is in place candidates apply immediately.
  h.manager->handle_signal(IceCandidateMessage{{std::string(), "bob", candidate(3)}});
  WINGSYNC_CHECK(transport->candidates.size() == 3);

  transport->open();
  WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Connected);
  WINGSYNC_CHECK(h.manager->connected_peer_count() == 1);
  WINGSYNC_CHECK(h.errors.empty());
  return true;
}

bool test_candidates_before_answer_are_flushed(TestContext&) {
  Harness h("alice");
  h.roster({"bob"});

  std::string error;
  WINGSYNC_CHECK(h.manager->connect("bob", error));
  h.drain();
  WINGSYNC_CHECK(h.factory->created.size() == 1);
  auto offers = h.sent_of<OfferMessage>();
  WINGSYNC_CHECK(offers.size() == 1 && offers[0].peer_id == "bob");
  WINGSYNC_CHECK(offers[0].data["sdp"] == "offer-for-bob");

  auto transport = h.factory->created[0];
  h.manager->handle_signal(IceCandidateMessage{{std::string(), "bob", candidate(7)}});
  WINGSYNC_CHECK(transport->candidates.empty());

  h.manager->handle_signal(AnswerMessage{{std::string(), "bob", {{"type", "answer"}, {"sdp", "y"}}}});
  WINGSYNC_CHECK(transport->descriptions.size() == 1);
  WINGSYNC_CHECK(transport->candidates.size() == 1 && transport->candidates[0] == candidate(7));

  transport->open();
  WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Connected);

  WINGSYNC_CHECK(!h.manager->connect("bob", error));
  WINGSYNC_CHECK(error == "peer bob is already connected");
  WINGSYNC_CHECK(!h.manager->connect("zed", error));
  WINGSYNC_CHECK(error == "unknown peer 'zed'");

  WINGSYNC_CHECK(h.manager->send_json_to_peer("bob", {{"type", "hello"}}));
  h.drain();
  WINGSYNC_CHECK(transport->sent.size() == 1);
  return true;
}

bool test_failed_negotiation_is_not_retried(TestContext&) {
  Harness h("alice");
  h.roster({"bob"});
  std::vector<std::pair<ConnectionState, std::string>> seen;
  h.manager->set_state_callback([&](const std::string&, ConnectionState state, const std::string& reason){
    seen.emplace_back(state, reason);
  });

  std::string error;
  WINGSYNC_CHECK(h.manager->connect("bob", error));
  h.drain();
  auto transport = h.factory->created[0];

  transport->fail("no route after 3 attempts");
  h.drain();
  auto info = h.manager->peer("bob");
  WINGSYNC_CHECK(info && info->state == ConnectionState::Failed);
  WINGSYNC_CHECK(info->last_error == "no route after 3 attempts");
  WINGSYNC_CHECK(transport->closed);
  WINGSYNC_CHECK(h.factory->created.size() == 1);
  WINGSYNC_CHECK(h.sent_of<OfferMessage>().size() == 1);
  WINGSYNC_CHECK(!seen.empty() && seen.back().first == ConnectionState::Failed);

  // Callbacks from the dead attempt are ignored.
  transport->open();
  WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Failed);

  // A fresh attempt is allowed from Failed, but fails when the relay is gone.
  h.relay_joined = false;
  WINGSYNC_CHECK(h.manager->connect("bob", error));
  h.drain();
  WINGSYNC_CHECK(h.factory->created.size() == 2);
  info = h.manager->peer("bob");
  WINGSYNC_CHECK(info && info->state == ConnectionState::Failed);
  WINGSYNC_CHECK(info->last_error == "relay session not joined");
  return true;
}

bool test_crossing_offers(TestContext&) {
  {
    // Lower id keeps its own offer.
    Harness h("alice");
    h.roster({"bob"});
    std::string error;
    WINGSYNC_CHECK(h.manager->connect("bob", error));
    h.drain();
    h.manager->handle_signal(OfferMessage{{std::string(), "bob", {{"type", "offer"}, {"sdp", "b"}}}});
    WINGSYNC_CHECK(h.factory->created.size() == 1);
    WINGSYNC_CHECK(!h.factory->created[0]->closed);
    WINGSYNC_CHECK(h.sent_of<AnswerMessage>().empty());
    WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Connecting);

    h.manager->handle_signal(AnswerMessage{{std::string(), "bob", {{"type", "answer"}, {"sdp", "b"}}}});
    WINGSYNC_CHECK(h.factory->created[0]->descriptions.size() == 1);
    WINGSYNC_CHECK(h.errors.empty());
  }
  {
    // Higher id yields and answers the remote offer.
    Harness h("carol");
    h.roster({"bob"});
    std::string error;
    WINGSYNC_CHECK(h.manager->connect("bob", error));
    h.drain();
    h.manager->handle_signal(IceCandidateMessage{{std::string(), "bob", candidate(1)}});
    h.manager->handle_signal(OfferMessage{{std::string(), "bob", {{"type", "offer"}, {"sdp", "b"}}}});
    WINGSYNC_CHECK(h.factory->created.size() == 2);
    WINGSYNC_CHECK(h.factory->created[0]->closed);
    auto answering = h.factory->created[1];
    WINGSYNC_CHECK(answering->descriptions.size() == 1);
    WINGSYNC_CHECK(answering->candidates.size() == 1);
    auto answers = h.sent_of<AnswerMessage>();
    WINGSYNC_CHECK(answers.size() == 1 && answers[0].data["sdp"] == "answer-for-bob");
    WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Connecting);

    // The abandoned offer's callbacks no longer reach the roster.
    h.factory->created[0]->fail("stale");
    WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Connecting);
    answering->open();
    WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Connected);
  }
  return true;
}

bool test_bad_answers_report_error(TestContext&) {
  Harness h("alice");
  h.roster({"bob", "dave"});

  h.manager->handle_signal(AnswerMessage{{std::string(), "bob", {{"type", "answer"}}}});
  WINGSYNC_CHECK(h.errors.size() == 1 && h.errors[0] == "Unexpected answer from bob");
  WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Disconnected);

  std::string error;
  WINGSYNC_CHECK(h.manager->connect("dave", error));
  h.drain();
  h.factory->created[0]->reject_reason = "malformed sdp";
  h.manager->handle_signal(AnswerMessage{{std::string(), "dave", {{"type", "answer"}}}});
  WINGSYNC_CHECK(h.errors.size() == 2 && h.errors[1] == "Rejected answer from dave: malformed sdp");
  auto dave = h.manager->peer("dave");
  WINGSYNC_CHECK(dave && dave->state == ConnectionState::Failed);
  WINGSYNC_CHECK(dave->last_error == "malformed sdp");

  // The link is gone, so a late duplicate is unexpected rather than applied.
  h.manager->handle_signal(AnswerMessage{{std::string(), "dave", {{"type", "answer"}}}});
  WINGSYNC_CHECK(h.errors.size() == 3 && h.errors[2] == "Unexpected answer from dave");

  // Relay errors are forwarded as-is.
  h.manager->handle_signal(ErrorMessage{"s1", "Session not found"});
  WINGSYNC_CHECK(h.errors.size() == 4 && h.errors[3] == "Session not found");

  WINGSYNC_CHECK(h.manager->known_peer_count() == 2);
  WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Disconnected);
  WINGSYNC_CHECK(h.manager->connect("bob", error));
  return true;
}

bool test_roster_changes_close_links(TestContext&) {
  Harness h("alice");
  h.roster({"bob", "alice"});
  WINGSYNC_CHECK(h.manager->known_peer_count() == 1);
  auto bob = h.manager->peer("bob");
  WINGSYNC_CHECK(bob && bob->display_name == "bob-laptop");

  std::string error;
  WINGSYNC_CHECK(h.manager->connect("bob", error));
  h.drain();
  h.factory->created[0]->open();
  WINGSYNC_CHECK(h.manager->state_of("bob") == ConnectionState::Connected);

  std::vector<std::string> closed;
  h.manager->set_state_callback([&](const std::string& id, ConnectionState state, const std::string&){
    if(state == ConnectionState::Closed) closed.push_back(id);
  });
  h.roster({});
  WINGSYNC_CHECK(h.manager->known_peer_count() == 0);
  WINGSYNC_CHECK(h.factory->created[0]->closed);
  WINGSYNC_CHECK(closed.size() == 1 && closed[0] == "bob");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"transition_table", test_transition_table},
    {"candidates_before_offer_are_flushed", test_candidates_before_offer_are_flushed},
    {"candidates_before_answer_are_flushed", test_candidates_before_answer_are_flushed},
    {"failed_negotiation_is_not_retried", test_failed_negotiation_is_not_retried},
    {"crossing_offers", test_crossing_offers},
    {"bad_answers_report_error", test_bad_answers_report_error},
    {"roster_changes_close_links", test_roster_changes_close_links},
  };
  return run_test_suite("peer manager", tests, argc, argv);
}
