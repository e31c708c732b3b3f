#pragma once
#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "peer_transport.hpp"
#include "protocol.hpp"

enum class ConnectionState { Disconnected, Connecting, Connected, Failed, Closed };

const char* to_string(ConnectionState state);

// Connected never returns to Connecting without passing Disconnected or
// Closed; Failed and Closed may start a fresh Connecting attempt.
bool is_valid_transition(ConnectionState from, ConnectionState to);

struct PeerInfo {
  std::string peer_id;
  std::string display_name;
  std::string device_type;
  ConnectionState state = ConnectionState::Disconnected;
  std::string last_error;
};

// Roster of the session plus one negotiated transport per peer. Signaling
// input arrives on the io thread; roster reads are safe from any thread.
class PeerManager : public std::enable_shared_from_this<PeerManager> {
public:
  using SignalSender = std::function<bool(SignalingMessage)>;
  using StateCallback = std::function<void(const std::string& peer_id, ConnectionState state, const std::string& reason)>;
  using MessageCallback = std::function<void(const std::string& peer_id, const nlohmann::json& message)>;
  using RosterCallback = std::function<void(const std::vector<PeerInfo>& roster)>;
  using ErrorCallback = std::function<void(const ErrorMessage& error)>;

  PeerManager(asio::io_context& io,
              std::string local_peer_id,
              std::shared_ptr<PeerTransportFactory> factory,
              std::shared_ptr<Logger> logger = nullptr);

  void set_signal_sender(SignalSender sender) { signal_sender_ = std::move(sender); }
  void set_state_callback(StateCallback cb) { state_callback_ = std::move(cb); }
  void set_message_callback(MessageCallback cb) { message_callback_ = std::move(cb); }
  void set_roster_callback(RosterCallback cb) { roster_callback_ = std::move(cb); }
  void set_error_callback(ErrorCallback cb) { error_callback_ = std::move(cb); }

  // Must run on the io thread.
  void handle_signal(const SignalingMessage& msg);

  bool connect(const std::string& peer_id, std::string& error);
  void disconnect(const std::string& peer_id);
  void close_all();

  bool send_json_to_peer(const std::string& peer_id, const nlohmann::json& j);

  std::vector<PeerInfo> peers() const;
  std::optional<PeerInfo> peer(const std::string& peer_id) const;
  std::optional<ConnectionState> state_of(const std::string& peer_id) const;
  std::size_t known_peer_count() const;
  std::size_t connected_peer_count() const;

  asio::io_context& io() { return io_; }
  const std::string& local_peer_id() const { return local_peer_id_; }

private:
  struct Link {
    std::shared_ptr<PeerTransport> transport;
    bool initiator = false;
    bool remote_description_set = false;
    std::vector<nlohmann::json> pending_candidates;
    uint64_t attempt = 0;
  };

  void apply_roster(const std::vector<PeerSummary>& peers);
  void handle_offer(const OfferMessage& msg);
  void handle_answer(const AnswerMessage& msg);
  void handle_candidate(const IceCandidateMessage& msg);
  void start_initiator(const std::string& peer_id);
  std::shared_ptr<PeerTransport> make_transport(const std::string& peer_id, uint64_t attempt);
  void flush_candidates(const std::string& peer_id, Link& link);
  void drop_link(const std::string& peer_id);
  bool transition(const std::string& peer_id, ConnectionState to, const std::string& reason);
  void fail_peer(const std::string& peer_id, const std::string& reason);
  void report(const std::string& error);
  bool current_attempt(const std::string& peer_id, uint64_t attempt) const;

  asio::io_context& io_;
  std::string local_peer_id_;
  std::shared_ptr<PeerTransportFactory> factory_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::unordered_map<std::string, PeerInfo> peers_;

  // io thread only
  std::unordered_map<std::string, Link> links_;
  uint64_t attempt_counter_ = 0;

  SignalSender signal_sender_;
  StateCallback state_callback_;
  MessageCallback message_callback_;
  RosterCallback roster_callback_;
  ErrorCallback error_callback_;
};
