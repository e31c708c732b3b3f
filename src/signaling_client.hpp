#pragma once

#include "protocol.hpp"

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

class Connection;
class Logger;

// Control channel to the relay. Joins one session, forwards every inbound
// SignalingMessage to the owner and watches the link with ping/pong.
class SignalingClient : public std::enable_shared_from_this<SignalingClient> {
public:
  enum class State { Disconnected, Connecting, Joined, Closed, Failed };

  struct Options {
    std::string signaling_url;
    std::string session_id;
    bool create_session = false;
    std::string peer_id;
    std::string peer_name;
    std::string device_type = "desktop";
    std::chrono::milliseconds heartbeat_interval{10000};
    // Outstanding pings tolerated before the relay link is declared dead.
    int max_missed_pongs = 3;
  };

  using MessageCallback = std::function<void(const SignalingMessage&)>;
  using StateCallback = std::function<void(State, const std::string& reason)>;

  SignalingClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  void set_message_callback(MessageCallback cb) { on_message_ = std::move(cb); }
  void set_state_callback(StateCallback cb) { on_state_ = std::move(cb); }

  void start();
  // Sends session-leave and closes the link.
  void stop();

  // Fills in the session id and queues the message. False when not joined.
  bool send(SignalingMessage msg);

  State state() const;
  const std::string& session_id() const { return options_.session_id; }
  const std::string& peer_id() const { return options_.peer_id; }

private:
  void on_connected(std::shared_ptr<Connection> conn);
  void handle_line(const std::string& line);
  void handle_message(const SignalingMessage& msg);
  void schedule_heartbeat();
  void on_heartbeat();
  void set_state(State state, const std::string& reason);
  void fail(const std::string& reason);

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Connection> conn_;
  asio::steady_timer heartbeat_timer_;
  int outstanding_pings_ = 0;
  mutable std::mutex state_mutex_;
  State state_ = State::Disconnected;
  MessageCallback on_message_;
  StateCallback on_state_;
};

const char* to_string(SignalingClient::State state);
