#pragma once

#include "protocol.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class Connection;
class Logger;

inline constexpr const char* kRelayServiceName = "wingsync-relay";
inline constexpr const char* kRelayVersion = "1.0.0";

// Session relay. Peers join a session over a newline-delimited JSON link and
// use it to exchange negotiation messages; file data never passes through.
// Plain HTTP requests on the same port are answered with /health.
class RelayServer : public std::enable_shared_from_this<RelayServer> {
public:
  using Clock = std::chrono::steady_clock;

  struct Options {
    std::string listen_ip = "0.0.0.0";
    unsigned short listen_port = 8080;
    std::chrono::seconds session_timeout{30 * 60};
    std::chrono::seconds sweep_interval{60};
  };

  RelayServer(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  bool start(std::string& error);
  void stop();

  unsigned short port() const { return port_; }

  // io thread.
  std::size_t session_count() const { return sessions_.size(); }
  std::vector<PeerSummary> session_peers(const std::string& session_id) const;
  nlohmann::json health() const;
  // Closes sessions idle since before now - session_timeout. Returns how many.
  std::size_t sweep_idle_sessions(Clock::time_point now);

private:
  struct Member {
    PeerSummary info;
    int64_t joined_at = 0;
    std::shared_ptr<Connection> conn;
  };

  struct Session {
    std::string id;
    int64_t created_at = 0;
    Clock::time_point last_activity;
    std::map<std::string, Member> members;
  };

  struct Binding {
    std::string session_id;
    std::string peer_id;
  };

  void do_accept();
  void schedule_sweep();
  void on_line(const std::shared_ptr<Connection>& conn, const std::string& line);
  void on_closed(const std::shared_ptr<Connection>& conn);
  void serve_http(const std::shared_ptr<Connection>& conn, const std::string& request_line);

  void join(const std::shared_ptr<Connection>& conn, const SessionRequest& request, const char* type);
  void leave(const std::shared_ptr<Connection>& conn, const SessionLeaveMessage& msg);
  template<typename T>
  void forward(const std::shared_ptr<Connection>& conn, T msg);
  void remove_member(const std::string& session_id, const std::string& peer_id, const char* why);
  void broadcast_peer_list(const Session& session);
  void send_error(const std::shared_ptr<Connection>& conn, const std::string& session_id, const std::string& error);

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::ip::tcp::acceptor acceptor_;
  asio::steady_timer sweep_timer_;
  unsigned short port_ = 0;
  bool running_ = false;
  Clock::time_point started_at_;

  std::map<std::string, Session> sessions_;
  std::unordered_map<Connection*, Binding> bindings_;
  std::unordered_set<std::shared_ptr<Connection>> links_;
  std::unordered_set<Connection*> http_links_;
};
