#include "tcp_peer_transport.hpp"

#include "connection.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <set>

namespace {

constexpr std::chrono::milliseconds kDialTimeout{3000};
constexpr std::chrono::milliseconds kRetryDelay{1000};
constexpr std::chrono::milliseconds kOfferTimeout{20000};
constexpr std::chrono::milliseconds kHelloTimeout{10000};
constexpr std::string_view kTokenAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";

} // namespace

TcpPeerTransport::TcpPeerTransport(asio::io_context& io,
                                   std::shared_ptr<TcpPeerTransportFactory> factory,
                                   std::string local_peer_id,
                                   std::string remote_peer_id,
                                   std::shared_ptr<Logger> logger)
  : io_(io),
    factory_(std::move(factory)),
    local_peer_id_(std::move(local_peer_id)),
    remote_peer_id_(std::move(remote_peer_id)),
    logger_(std::move(logger)),
    open_timer_(io),
    retry_timer_(io) {}

TcpPeerTransport::~TcpPeerTransport(){
  if(role_ == Role::Offerer && factory_) factory_->unregister_pending(token_);
}

nlohmann::json TcpPeerTransport::create_offer(){
  role_ = Role::Offerer;
  token_ = random_token(24, kTokenAlphabet);
  factory_->register_pending(token_, weak_from_this());
  announce_local_candidates();
  start_open_timer(kOfferTimeout);
  return nlohmann::json{{"type", "offer"}, {"transport", "tcp"}, {"token", token_}};
}

nlohmann::json TcpPeerTransport::create_answer(){
  announce_local_candidates();
  return nlohmann::json{{"type", "answer"}, {"transport", "tcp"}, {"token", token_}};
}

bool TcpPeerTransport::set_remote_description(const nlohmann::json& description, std::string& error){
  if(!description.is_object() || description.value("transport", std::string()) != "tcp") {
    error = "unsupported transport in remote description";
    return false;
  }
  auto token = description.value("token", std::string());
  if(token.empty()) {
    error = "remote description has no token";
    return false;
  }
  if(role_ == Role::Offerer) {
    if(token != token_) {
      error = "answer token does not match offer";
      return false;
    }
  } else {
    role_ = Role::Answerer;
    token_ = token;
  }
  remote_description_set_ = true;
  if(role_ == Role::Answerer && !remote_candidates_.empty() && !dialing_) dial(0);
  return true;
}

bool TcpPeerTransport::add_remote_candidate(const nlohmann::json& candidate, std::string& error){
  if(!remote_description_set_) {
    error = "remote description not set";
    return false;
  }
  Candidate c;
  c.host = candidate.value("host", std::string());
  int port = candidate.value("port", 0);
  if(c.host.empty() || port <= 0 || port > 65535) {
    error = "malformed candidate";
    return false;
  }
  c.port = static_cast<unsigned short>(port);
  remote_candidates_.push_back(c);
  if(role_ == Role::Answerer && !dialing_ && !open_ && !closed_ && !retry_timer_pending_) {
    dial(remote_candidates_.size() - 1);
  }
  return true;
}

void TcpPeerTransport::announce_local_candidates(){
  auto candidates = factory_->local_candidates();
  auto self = shared_from_this();
  asio::post(io_, [self, candidates]{
    if(self->closed_) return;
    for(const auto& candidate : candidates) {
      if(self->callbacks_.on_local_candidate) self->callbacks_.on_local_candidate(candidate);
    }
  });
}

void TcpPeerTransport::start_open_timer(std::chrono::milliseconds timeout){
  open_timer_.expires_after(timeout);
  std::weak_ptr<TcpPeerTransport> weak = weak_from_this();
  open_timer_.async_wait([weak](const std::error_code& ec){
    if(ec) return;
    if(auto self = weak.lock()) {
      if(!self->open_ && !self->closed_) self->fail("remote peer never connected");
    }
  });
}

void TcpPeerTransport::dial(std::size_t index){
  if(open_ || closed_) return;
  if(index >= remote_candidates_.size()) {
    attempt_exhausted();
    return;
  }
  dialing_ = true;
  const auto candidate = remote_candidates_[index];
  const uint64_t generation = ++dial_generation_;
  auto self = shared_from_this();

  auto dial_timer = std::make_shared<asio::steady_timer>(io_, kDialTimeout);
  dial_timer->async_wait([self, generation, index](const std::error_code& ec){
    if(ec || generation != self->dial_generation_ || self->open_ || self->closed_) return;
    log_debug(self->logger_.get(), "TcpPeerTransport: dial timeout on candidate {}", index);
    self->dial(index + 1);
  });

  Connection::connect(io_, candidate.host, candidate.port, false, logger_,
    [self, generation, index, dial_timer](const std::error_code& ec, std::shared_ptr<Connection> conn){
      if(generation != self->dial_generation_ || self->open_ || self->closed_) {
        if(conn) conn->close();
        return;
      }
      dial_timer->cancel();
      if(ec || !conn) {
        self->dial(index + 1);
        return;
      }
      std::weak_ptr<TcpPeerTransport> weak = self;
      conn->set_handlers(
        [weak, generation](const std::shared_ptr<Connection>& c, std::string line){
          auto transport = weak.lock();
          if(!transport || transport->closed_ || generation != transport->dial_generation_) {
            c->close();
            return;
          }
          auto reply = nlohmann::json::parse(line, nullptr, false);
          if(reply.is_object() && reply.value("type", std::string()) == "link-hello-ack") {
            transport->attach(c);
          } else {
            c->close();
          }
        },
        [weak, generation, index](const std::shared_ptr<Connection>&, const std::error_code&){
          auto transport = weak.lock();
          if(!transport || transport->open_ || transport->closed_) return;
          if(generation != transport->dial_generation_) return;
          transport->dial(index + 1);
        });
      conn->start();
      conn->send_json(nlohmann::json{
        {"type", "link-hello"}, {"token", self->token_}, {"peerId", self->local_peer_id_}});
    });
}

void TcpPeerTransport::attempt_exhausted(){
  dialing_ = false;
  ++dial_generation_;
  if(attempt_ >= kMaxAttempts) {
    fail("no reachable candidate after " + std::to_string(attempt_) + " attempts");
    return;
  }
  ++attempt_;
  retry_timer_pending_ = true;
  retry_timer_.expires_after(kRetryDelay);
  auto self = shared_from_this();
  retry_timer_.async_wait([self](const std::error_code& ec){
    self->retry_timer_pending_ = false;
    if(ec || self->open_ || self->closed_) return;
    log_debug(self->logger_.get(), "TcpPeerTransport: retrying {} (attempt {})",
              self->remote_peer_id_, self->attempt_);
    self->dial(0);
  });
}

void TcpPeerTransport::attach(std::shared_ptr<Connection> conn){
  if(open_ || closed_) {
    conn->close();
    return;
  }
  open_ = true;
  dialing_ = false;
  open_timer_.cancel();
  retry_timer_.cancel();
  if(role_ == Role::Offerer) factory_->unregister_pending(token_);
  conn_ = std::move(conn);
  conn_->set_tag(remote_peer_id_);

  std::weak_ptr<TcpPeerTransport> weak = weak_from_this();
  conn_->set_handlers(
    [weak](const std::shared_ptr<Connection>&, std::string line){
      auto self = weak.lock();
      if(!self) return;
      auto message = nlohmann::json::parse(line, nullptr, false);
      if(message.is_discarded() || !message.is_object()) {
        log_warn(self->logger_.get(), "TcpPeerTransport: dropping malformed line from {}", self->remote_peer_id_);
        return;
      }
      if(self->callbacks_.on_message) self->callbacks_.on_message(message);
    },
    [weak](const std::shared_ptr<Connection>&, const std::error_code&){
      auto self = weak.lock();
      if(!self) return;
      bool was_open = self->open_;
      self->open_ = false;
      self->conn_.reset();
      if(was_open && !self->closed_ && self->callbacks_.on_closed) self->callbacks_.on_closed();
    });
  log_debug(logger_.get(), "TcpPeerTransport: link to {} open", remote_peer_id_);
  if(callbacks_.on_open) callbacks_.on_open();
}

bool TcpPeerTransport::send(const nlohmann::json& message){
  if(!open_ || !conn_) return false;
  conn_->send_json(message);
  return true;
}

void TcpPeerTransport::close(){
  if(closed_) return;
  closed_ = true;
  open_ = false;
  ++dial_generation_;
  open_timer_.cancel();
  retry_timer_.cancel();
  if(role_ == Role::Offerer) factory_->unregister_pending(token_);
  if(conn_) {
    conn_->close_after_flush();
    conn_.reset();
  }
}

void TcpPeerTransport::fail(const std::string& reason){
  if(closed_) return;
  close();
  log_debug(logger_.get(), "TcpPeerTransport: {} failed: {}", remote_peer_id_, reason);
  if(callbacks_.on_failed) callbacks_.on_failed(reason);
}

TcpPeerTransportFactory::TcpPeerTransportFactory(asio::io_context& io,
                                                 std::string local_peer_id,
                                                 std::string listen_ip,
                                                 std::shared_ptr<Logger> logger)
  : io_(io),
    local_peer_id_(std::move(local_peer_id)),
    listen_ip_(std::move(listen_ip)),
    logger_(std::move(logger)),
    acceptor_(io) {}

bool TcpPeerTransportFactory::listen(unsigned short port, std::string& error){
  std::error_code ec;
  auto address = asio::ip::make_address(listen_ip_.empty() ? "0.0.0.0" : listen_ip_, ec);
  if(ec) {
    error = "invalid listen_ip '" + listen_ip_ + "'";
    return false;
  }
  asio::ip::tcp::endpoint endpoint(address, port);
  acceptor_.open(endpoint.protocol(), ec);
  if(!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if(!ec) acceptor_.bind(endpoint, ec);
  if(!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    error = "unable to listen on " + endpoint.address().to_string() + ":" + std::to_string(port) + ": " + ec.message();
    return false;
  }
  port_ = acceptor_.local_endpoint().port();
  log_debug(logger_.get(), "Peer links listening on {}:{}", endpoint.address().to_string(), port_);
  do_accept();
  return true;
}

void TcpPeerTransportFactory::stop(){
  auto self = shared_from_this();
  asio::post(io_, [self]{
    std::error_code ec;
    self->acceptor_.close(ec);
    self->pending_.clear();
  });
}

std::shared_ptr<PeerTransport> TcpPeerTransportFactory::create(const std::string& remote_peer_id){
  return std::make_shared<TcpPeerTransport>(io_, shared_from_this(), local_peer_id_, remote_peer_id, logger_);
}

std::vector<nlohmann::json> TcpPeerTransportFactory::local_candidates() const {
  std::vector<nlohmann::json> out;
  std::set<std::string> hosts;
  if(!listen_ip_.empty() && listen_ip_ != "0.0.0.0") {
    hosts.insert(listen_ip_);
  } else {
    std::error_code ec;
    asio::ip::tcp::resolver resolver(io_);
    auto results = resolver.resolve(asio::ip::host_name(ec), "", ec);
    if(!ec) {
      for(const auto& entry : results) {
        auto address = entry.endpoint().address();
        if(address.is_v4() && !address.is_loopback()) hosts.insert(address.to_string());
      }
    }
    hosts.insert("127.0.0.1");
  }
  for(const auto& host : hosts) {
    out.push_back(nlohmann::json{{"host", host}, {"port", port_}, {"protocol", "tcp"}});
  }
  return out;
}

void TcpPeerTransportFactory::register_pending(const std::string& token, std::weak_ptr<TcpPeerTransport> transport){
  pending_[token] = std::move(transport);
}

void TcpPeerTransportFactory::unregister_pending(const std::string& token){
  pending_.erase(token);
}

void TcpPeerTransportFactory::do_accept(){
  auto self = shared_from_this();
  acceptor_.async_accept([self](const std::error_code& ec, asio::ip::tcp::socket sock){
    if(ec) {
      if(ec != asio::error::operation_aborted) {
        log_warn(self->logger_.get(), "Peer link accept failed: {}", ec.message());
      }
      if(!self->acceptor_.is_open()) return;
    } else {
      auto conn = Connection::create(self->io_, std::move(sock), self->logger_);
      auto hello_timer = std::make_shared<asio::steady_timer>(self->io_, kHelloTimeout);
      hello_timer->async_wait([conn](const std::error_code& ec){
        if(!ec && conn->tag().empty()) conn->close();
      });
      conn->set_handlers(
        [self, hello_timer](const std::shared_ptr<Connection>& c, std::string line){
          hello_timer->cancel();
          self->handle_hello(c, line);
        },
        [hello_timer](const std::shared_ptr<Connection>&, const std::error_code&){
          hello_timer->cancel();
        });
      conn->start();
    }
    self->do_accept();
  });
}

void TcpPeerTransportFactory::handle_hello(const std::shared_ptr<Connection>& conn, const std::string& line){
  auto hello = nlohmann::json::parse(line, nullptr, false);
  if(!hello.is_object() || hello.value("type", std::string()) != "link-hello") {
    conn->close();
    return;
  }
  auto token = hello.value("token", std::string());
  auto peer_id = hello.value("peerId", std::string());
  auto it = pending_.find(token);
  auto transport = it == pending_.end() ? nullptr : it->second.lock();
  if(!transport || transport->remote_peer_id() != peer_id) {
    log_warn(logger_.get(), "Rejected peer link from {} ({})", conn->remote_address(),
             peer_id.empty() ? "anonymous" : peer_id);
    conn->close();
    return;
  }
  conn->set_tag(peer_id);
  conn->send_json(nlohmann::json{{"type", "link-hello-ack"}, {"peerId", local_peer_id_}});
  transport->attach(conn);
}
