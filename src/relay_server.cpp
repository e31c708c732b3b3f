#include "relay_server.hpp"

#include "connection.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <ctime>
#include <type_traits>

namespace {

std::string iso_timestamp(int64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
  return fmt::format("{}.{:03}Z", buf, epoch_ms % 1000);
}

bool looks_like_http(const std::string& line) {
  return line.rfind("GET ", 0) == 0 || line.rfind("HEAD ", 0) == 0 ||
         line.rfind("POST ", 0) == 0 || line.rfind("OPTIONS ", 0) == 0;
}

std::string http_response(int status, const char* reason, const std::string& content_type, const std::string& body) {
  return fmt::format("HTTP/1.1 {} {}\r\n"
                     "Content-Type: {}\r\n"
                     "Content-Length: {}\r\n"
                     "Access-Control-Allow-Origin: *\r\n"
                     "Connection: close\r\n\r\n{}",
                     status, reason, content_type, body.size(), body);
}

} // namespace

RelayServer::RelayServer(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(std::move(logger)),
    acceptor_(io),
    sweep_timer_(io) {}

bool RelayServer::start(std::string& error){
  using tcp = asio::ip::tcp;
  std::error_code ec;
  auto address = asio::ip::make_address(options_.listen_ip, ec);
  if(ec) {
    error = "Invalid listen_ip '" + options_.listen_ip + "': " + ec.message();
    return false;
  }
  tcp::endpoint endpoint(address, options_.listen_port);
  acceptor_.open(endpoint.protocol(), ec);
  if(!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_.bind(endpoint, ec);
  if(!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    error = "Unable to listen on " + options_.listen_ip + ":" + std::to_string(options_.listen_port) + ": " + ec.message();
    acceptor_.close(ec);
    return false;
  }
  port_ = acceptor_.local_endpoint().port();
  running_ = true;
  started_at_ = Clock::now();
  log_info(logger_.get(), "Relay listening on {}:{}", options_.listen_ip, port_);
  log_info(logger_.get(), "Health check: http://{}:{}/health", options_.listen_ip, port_);
  do_accept();
  schedule_sweep();
  return true;
}

void RelayServer::stop(){
  if(!running_) return;
  running_ = false;
  std::error_code ec;
  acceptor_.close(ec);
  sweep_timer_.cancel();
  auto links = links_;
  for(const auto& conn : links) conn->close();
  log_info(logger_.get(), "Relay stopped; closed {} links", links.size());
}

void RelayServer::do_accept(){
  auto self = shared_from_this();
  acceptor_.async_accept([self](std::error_code ec, asio::ip::tcp::socket sock){
    if(!self->running_) return;
    if(ec) {
      log_error(self->logger_.get(), "accept failed: {}", ec.message());
    } else {
      auto conn = Connection::create(self->io_, std::move(sock), self->logger_);
      log_debug(self->logger_.get(), "New link from {}", conn->remote_address());
      self->links_.insert(conn);
      std::weak_ptr<RelayServer> weak = self;
      conn->set_handlers(
        [weak](const std::shared_ptr<Connection>& c, std::string line){
          if(auto relay = weak.lock()) relay->on_line(c, line);
        },
        [weak](const std::shared_ptr<Connection>& c, const std::error_code&){
          if(auto relay = weak.lock()) relay->on_closed(c);
        });
      conn->start();
    }
    self->do_accept();
  });
}

void RelayServer::schedule_sweep(){
  sweep_timer_.expires_after(options_.sweep_interval);
  std::weak_ptr<RelayServer> weak = shared_from_this();
  sweep_timer_.async_wait([weak](const std::error_code& ec){
    auto self = weak.lock();
    if(ec || !self || !self->running_) return;
    self->sweep_idle_sessions(Clock::now());
    self->schedule_sweep();
  });
}

std::size_t RelayServer::sweep_idle_sessions(Clock::time_point now){
  std::vector<std::string> expired;
  for(const auto& [id, session] : sessions_) {
    if(now - session.last_activity > options_.session_timeout) expired.push_back(id);
  }
  for(const auto& id : expired) {
    auto it = sessions_.find(id);
    log_info(logger_.get(), "Cleaning up expired session: {}", id);
    for(auto& [peer_id, member] : it->second.members) {
      bindings_.erase(member.conn.get());
      member.conn->close();
    }
    sessions_.erase(it);
  }
  return expired.size();
}

void RelayServer::on_line(const std::shared_ptr<Connection>& conn, const std::string& line){
  if(http_links_.count(conn.get())) return;
  if(!bindings_.count(conn.get()) && looks_like_http(line)) {
    serve_http(conn, line);
    return;
  }

  std::string error;
  auto msg = parse_signaling_line(line, error);
  if(!msg) {
    std::string session_id;
    json raw = json::parse(line, nullptr, false);
    if(raw.is_object() && raw.contains("sessionId") && raw["sessionId"].is_string()) {
      session_id = raw["sessionId"].get<std::string>();
    }
    log_debug(logger_.get(), "Rejected message from {}: {}", conn->remote_address(), error);
    send_error(conn, session_id, error);
    return;
  }

  std::visit(overloaded{
    [&](const SessionCreateMessage& m) { join(conn, m, "session-create"); },
    [&](const SessionJoinMessage& m) { join(conn, m, "session-join"); },
    [&](const SessionLeaveMessage& m) { leave(conn, m); },
    [&](const PingMessage&) { conn->send_json(serialize_signaling_message(PongMessage{})); },
    [&](const PongMessage&) {},
    [&](const auto& m) {
      using T = std::decay_t<decltype(m)>;
      if constexpr(std::is_base_of_v<NegotiationMessage, T>) {
        forward(conn, m);
      } else {
        std::string session_id;
        if constexpr(std::is_same_v<T, PeerListMessage> || std::is_same_v<T, PeerAnnounceMessage> ||
                     std::is_same_v<T, ErrorMessage>) {
          session_id = m.session_id;
        }
        send_error(conn, session_id, std::string("Unknown message type: ") + message_type(*msg));
      }
    },
  }, *msg);
}

void RelayServer::serve_http(const std::shared_ptr<Connection>& conn, const std::string& request_line){
  http_links_.insert(conn.get());
  auto first_space = request_line.find(' ');
  auto second_space = request_line.find(' ', first_space + 1);
  std::string target = request_line.substr(first_space + 1, second_space == std::string::npos
    ? std::string::npos
    : second_space - first_space - 1);
  auto query = target.find('?');
  if(query != std::string::npos) target.erase(query);

  if(target == "/" || target == "/health") {
    conn->send_raw(http_response(200, "OK", "application/json", health().dump()));
  } else {
    conn->send_raw(http_response(404, "Not Found", "text/plain", "Not Found"));
  }
  conn->close_after_flush();
}

nlohmann::json RelayServer::health() const {
  const double uptime = std::chrono::duration<double>(Clock::now() - started_at_).count();
  return nlohmann::json{{"status", "healthy"},
                        {"service", kRelayServiceName},
                        {"version", kRelayVersion},
                        {"uptime", uptime},
                        {"activeSessions", sessions_.size()},
                        {"timestamp", iso_timestamp(now_ms())}};
}

void RelayServer::join(const std::shared_ptr<Connection>& conn, const SessionRequest& request, const char* type){
  std::string peer_id = request.peer_id.empty() ? generate_peer_id() : request.peer_id;

  // One membership per link; joining elsewhere leaves the previous session.
  auto bound = bindings_.find(conn.get());
  if(bound != bindings_.end() &&
     (bound->second.session_id != request.session_id || bound->second.peer_id != peer_id)) {
    Binding previous = bound->second;
    bindings_.erase(bound);
    remove_member(previous.session_id, previous.peer_id, "moved to another session");
  }

  auto it = sessions_.find(request.session_id);
  if(it == sessions_.end()) {
    log_info(logger_.get(), "Creating new session: {}", request.session_id);
    Session session;
    session.id = request.session_id;
    session.created_at = now_ms();
    session.last_activity = Clock::now();
    it = sessions_.emplace(request.session_id, std::move(session)).first;
  }
  Session& session = it->second;
  session.last_activity = Clock::now();

  auto existing = session.members.find(peer_id);
  if(existing != session.members.end()) {
    if(existing->second.conn != conn) {
      log_info(logger_.get(), "Peer {} rejoined session {}, replacing its old link", peer_id, session.id);
      bindings_.erase(existing->second.conn.get());
      existing->second.conn->close();
      existing->second.conn = conn;
    }
    existing->second.joined_at = now_ms();
  } else {
    Member member;
    member.info.id = peer_id;
    member.info.name = request.peer_name.empty() ? "Unknown Device" : request.peer_name;
    member.info.device_type = request.device_type.empty() ? "desktop" : request.device_type;
    member.joined_at = now_ms();
    member.conn = conn;
    session.members.emplace(peer_id, std::move(member));
    log_info(logger_.get(), "Peer {} ({}) joined session {}", request.peer_name, peer_id, session.id);
  }
  bindings_[conn.get()] = Binding{session.id, peer_id};
  conn->set_tag(peer_id);

  broadcast_peer_list(session);

  SessionRequest reply;
  reply.session_id = session.id;
  reply.peer_id = peer_id;
  reply.peers = session_peers(session.id);
  reply.success = true;
  json j = std::string(type) == "session-create"
    ? serialize_signaling_message(SessionCreateMessage{reply})
    : serialize_signaling_message(SessionJoinMessage{reply});
  conn->send_json(j);
}

void RelayServer::leave(const std::shared_ptr<Connection>& conn, const SessionLeaveMessage& msg){
  auto bound = bindings_.find(conn.get());
  if(bound == bindings_.end() || bound->second.session_id != msg.session_id || bound->second.peer_id != msg.peer_id) {
    log_debug(logger_.get(), "Ignoring session-leave for {} in {}", msg.peer_id, msg.session_id);
    return;
  }
  bindings_.erase(bound);
  remove_member(msg.session_id, msg.peer_id, "left");
}

template<typename T>
void RelayServer::forward(const std::shared_ptr<Connection>& conn, T msg){
  auto it = sessions_.find(msg.session_id);
  if(it == sessions_.end()) {
    send_error(conn, msg.session_id, "Session not found");
    return;
  }
  Session& session = it->second;
  session.last_activity = Clock::now();
  auto bound = bindings_.find(conn.get());
  if(bound == bindings_.end() || bound->second.session_id != session.id) {
    send_error(conn, session.id, "Join the session first");
    return;
  }
  auto target = session.members.find(msg.peer_id);
  if(target == session.members.end() || !target->second.conn->is_open()) {
    send_error(conn, session.id, "Peer not connected");
    return;
  }
  const std::string target_id = msg.peer_id;
  msg.peer_id = bound->second.peer_id;
  SignalingMessage out{std::move(msg)};
  log_debug(logger_.get(), "Forwarding {} from {} to {} in {}", message_type(out), bound->second.peer_id,
            target_id, session.id);
  target->second.conn->send_json(serialize_signaling_message(out));
}

void RelayServer::on_closed(const std::shared_ptr<Connection>& conn){
  links_.erase(conn);
  http_links_.erase(conn.get());
  auto bound = bindings_.find(conn.get());
  if(bound == bindings_.end()) return;
  Binding binding = bound->second;
  bindings_.erase(bound);
  remove_member(binding.session_id, binding.peer_id, "disconnected");
}

void RelayServer::remove_member(const std::string& session_id, const std::string& peer_id, const char* why){
  auto it = sessions_.find(session_id);
  if(it == sessions_.end()) return;
  Session& session = it->second;
  if(session.members.erase(peer_id) == 0) return;
  log_info(logger_.get(), "Peer {} {} session {}; {} remaining", peer_id, why, session_id, session.members.size());
  if(session.members.empty()) {
    sessions_.erase(it);
    log_info(logger_.get(), "Session {} deleted (no peers remaining)", session_id);
    return;
  }
  broadcast_peer_list(session);
}

void RelayServer::broadcast_peer_list(const Session& session){
  PeerListMessage list{session.id, session_peers(session.id)};
  const json payload = serialize_signaling_message(list);
  for(const auto& [peer_id, member] : session.members) {
    if(member.conn->is_open()) member.conn->send_json(payload);
  }
}

std::vector<PeerSummary> RelayServer::session_peers(const std::string& session_id) const {
  std::vector<PeerSummary> peers;
  auto it = sessions_.find(session_id);
  if(it == sessions_.end()) return peers;
  for(const auto& [peer_id, member] : it->second.members) peers.push_back(member.info);
  return peers;
}

void RelayServer::send_error(const std::shared_ptr<Connection>& conn, const std::string& session_id, const std::string& error){
  conn->send_json(serialize_signaling_message(ErrorMessage{session_id, error}));
}
