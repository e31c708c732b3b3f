#pragma once

#include "peer_transport.hpp"

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

class Connection;
class Logger;
class TcpPeerTransportFactory;

// PeerTransport over plain TCP. The offering side listens and publishes its
// endpoints as candidates; the answering side dials them and proves itself
// with the token from the offer.
class TcpPeerTransport : public PeerTransport,
                         public std::enable_shared_from_this<TcpPeerTransport> {
public:
  static constexpr int kMaxAttempts = 2;

  TcpPeerTransport(asio::io_context& io,
                   std::shared_ptr<TcpPeerTransportFactory> factory,
                   std::string local_peer_id,
                   std::string remote_peer_id,
                   std::shared_ptr<Logger> logger);
  ~TcpPeerTransport() override;

  void set_callbacks(Callbacks callbacks) override { callbacks_ = std::move(callbacks); }

  nlohmann::json create_offer() override;
  nlohmann::json create_answer() override;
  bool set_remote_description(const nlohmann::json& description, std::string& error) override;
  bool add_remote_candidate(const nlohmann::json& candidate, std::string& error) override;

  bool send(const nlohmann::json& message) override;
  void close() override;
  bool is_open() const override { return open_; }

  // Called by the factory when the remote side dialed in with our token.
  void attach(std::shared_ptr<Connection> conn);
  const std::string& remote_peer_id() const { return remote_peer_id_; }

private:
  enum class Role { Unset, Offerer, Answerer };

  struct Candidate {
    std::string host;
    unsigned short port = 0;
  };

  void announce_local_candidates();
  void start_open_timer(std::chrono::milliseconds timeout);
  void dial(std::size_t index);
  void attempt_exhausted();
  void fail(const std::string& reason);

  asio::io_context& io_;
  std::shared_ptr<TcpPeerTransportFactory> factory_;
  std::string local_peer_id_;
  std::string remote_peer_id_;
  std::shared_ptr<Logger> logger_;
  Callbacks callbacks_;
  Role role_ = Role::Unset;
  std::string token_;
  bool remote_description_set_ = false;
  std::vector<Candidate> remote_candidates_;
  bool dialing_ = false;
  bool retry_timer_pending_ = false;
  uint64_t dial_generation_ = 0;
  int attempt_ = 1;
  asio::steady_timer open_timer_;
  asio::steady_timer retry_timer_;
  std::shared_ptr<Connection> conn_;
  bool open_ = false;
  bool closed_ = false;
};

// Owns the listening socket shared by every TcpPeerTransport of a node and
// routes inbound links to the transport whose token they present.
class TcpPeerTransportFactory : public PeerTransportFactory,
                                public std::enable_shared_from_this<TcpPeerTransportFactory> {
public:
  TcpPeerTransportFactory(asio::io_context& io,
                          std::string local_peer_id,
                          std::string listen_ip,
                          std::shared_ptr<Logger> logger);

  bool listen(unsigned short port, std::string& error);
  void stop();
  unsigned short port() const { return port_; }

  std::shared_ptr<PeerTransport> create(const std::string& remote_peer_id) override;

  std::vector<nlohmann::json> local_candidates() const;

  void register_pending(const std::string& token, std::weak_ptr<TcpPeerTransport> transport);
  void unregister_pending(const std::string& token);

private:
  void do_accept();
  void handle_hello(const std::shared_ptr<Connection>& conn, const std::string& line);

  asio::io_context& io_;
  std::string local_peer_id_;
  std::string listen_ip_;
  std::shared_ptr<Logger> logger_;
  asio::ip::tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  std::map<std::string, std::weak_ptr<TcpPeerTransport>> pending_;
};
