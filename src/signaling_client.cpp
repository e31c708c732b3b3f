#include "signaling_client.hpp"

#include "connection.hpp"
#include "endpoint.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <type_traits>

const char* to_string(SignalingClient::State state){
  switch(state) {
    case SignalingClient::State::Disconnected: return "disconnected";
    case SignalingClient::State::Connecting: return "connecting";
    case SignalingClient::State::Joined: return "joined";
    case SignalingClient::State::Closed: return "closed";
    case SignalingClient::State::Failed: return "failed";
  }
  return "unknown";
}

SignalingClient::SignalingClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(std::move(logger)),
    heartbeat_timer_(io) {}

SignalingClient::State SignalingClient::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

void SignalingClient::set_state(State state, const std::string& reason){
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(state_ == state) return;
    state_ = state;
  }
  log_debug(logger_.get(), "Signaling: {}{}{}", to_string(state), reason.empty() ? "" : " - ", reason);
  if(on_state_) on_state_(state, reason);
}

void SignalingClient::start(){
  auto self = shared_from_this();
  asio::post(io_, [self]{
    auto url = parse_endpoint_url(self->options_.signaling_url);
    if(!url) {
      self->fail("invalid signaling url " + self->options_.signaling_url);
      return;
    }
    if(!is_valid_session_id(self->options_.session_id)) {
      self->fail("invalid session id '" + self->options_.session_id + "'");
      return;
    }
    self->set_state(State::Connecting, url->to_string());
    Connection::connect(self->io_, url->host, url->port, url->secure, self->logger_,
      [self](const std::error_code& ec, std::shared_ptr<Connection> conn){
        if(ec || !conn) {
          self->fail("relay unreachable: " + (ec ? ec.message() : std::string("no link")));
          return;
        }
        self->on_connected(std::move(conn));
      });
  });
}

void SignalingClient::on_connected(std::shared_ptr<Connection> conn){
  if(state() != State::Connecting) {
    conn->close();
    return;
  }
  conn_ = std::move(conn);
  auto self = shared_from_this();
  conn_->set_handlers(
    [self](const std::shared_ptr<Connection>&, std::string line){
      self->handle_line(line);
    },
    [self](const std::shared_ptr<Connection>&, const std::error_code& ec){
      auto current = self->state();
      if(current == State::Closed || current == State::Failed) return;
      self->fail("relay link closed" + (ec ? ": " + ec.message() : std::string()));
    });
  conn_->start();

  SessionRequest request;
  request.session_id = options_.session_id;
  request.peer_id = options_.peer_id;
  request.peer_name = options_.peer_name;
  request.device_type = options_.device_type;
  if(options_.create_session) {
    conn_->send_json(serialize_signaling_message(SessionCreateMessage{request}));
  } else {
    conn_->send_json(serialize_signaling_message(SessionJoinMessage{request}));
  }
  outstanding_pings_ = 0;
  schedule_heartbeat();
}

void SignalingClient::handle_line(const std::string& line){
  std::string error;
  auto msg = parse_signaling_line(line, error);
  if(!msg) {
    log_warn(logger_.get(), "Signaling: rejected message ({})", error);
    if(on_message_) on_message_(ErrorMessage{options_.session_id, "Rejected message: " + error});
    return;
  }
  handle_message(*msg);
}

void SignalingClient::handle_message(const SignalingMessage& msg){
  outstanding_pings_ = 0;
  std::visit(overloaded{
    [&](const SessionCreateMessage& m) {
      if(m.success) set_state(State::Joined, "session " + m.session_id);
    },
    [&](const SessionJoinMessage& m) {
      if(m.success) set_state(State::Joined, "session " + m.session_id);
    },
    [&](const ErrorMessage& m) {
      log_warn(logger_.get(), "Signaling: relay error: {}", m.error);
    },
    [&](const PingMessage&) {
      if(conn_) conn_->send_json(serialize_signaling_message(PongMessage{}));
    },
    [&](const auto&) {},
  }, msg);

  if(std::holds_alternative<ErrorMessage>(msg) && state() == State::Connecting) {
    if(on_message_) on_message_(msg);
    fail(std::get<ErrorMessage>(msg).error);
    return;
  }
  if(!std::holds_alternative<PongMessage>(msg) && !std::holds_alternative<PingMessage>(msg)) {
    if(on_message_) on_message_(msg);
  }
}

bool SignalingClient::send(SignalingMessage msg){
  if(state() != State::Joined) return false;
  std::visit([&](auto& m){
    using T = std::decay_t<decltype(m)>;
    if constexpr(std::is_base_of_v<NegotiationMessage, T> ||
                 std::is_base_of_v<SessionRequest, T> ||
                 std::is_same_v<T, SessionLeaveMessage>) {
      m.session_id = options_.session_id;
    }
  }, msg);
  auto self = shared_from_this();
  auto payload = serialize_signaling_message(msg);
  asio::post(io_, [self, payload]{
    if(self->conn_ && self->conn_->is_open()) self->conn_->send_json(payload);
  });
  return true;
}

void SignalingClient::schedule_heartbeat(){
  heartbeat_timer_.expires_after(options_.heartbeat_interval);
  auto self = shared_from_this();
  heartbeat_timer_.async_wait([self](const std::error_code& ec){
    if(ec) return;
    self->on_heartbeat();
  });
}

void SignalingClient::on_heartbeat(){
  auto current = state();
  if(current != State::Joined && current != State::Connecting) return;
  if(outstanding_pings_ >= options_.max_missed_pongs) {
    fail("relay heartbeat lost after " + std::to_string(outstanding_pings_) + " missed pongs");
    return;
  }
  if(conn_) conn_->send_json(serialize_signaling_message(PingMessage{}));
  ++outstanding_pings_;
  schedule_heartbeat();
}

void SignalingClient::fail(const std::string& reason){
  heartbeat_timer_.cancel();
  if(conn_) {
    conn_->close();
    conn_.reset();
  }
  log_error(logger_.get(), "Signaling failed: {}", reason);
  set_state(State::Failed, reason);
}

void SignalingClient::stop(){
  auto self = shared_from_this();
  asio::post(io_, [self]{
    self->heartbeat_timer_.cancel();
    auto current = self->state();
    if(current == State::Closed) return;
    if(self->conn_) {
      if(current == State::Joined) {
        SessionLeaveMessage leave{self->options_.session_id, self->options_.peer_id};
        self->conn_->send_json(serialize_signaling_message(leave));
      }
      self->conn_->close_after_flush();
      self->conn_.reset();
    }
    self->set_state(State::Closed, "stopped");
  });
}
