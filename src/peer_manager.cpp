#include "peer_manager.hpp"

#include "utils.hpp"

namespace {

constexpr std::size_t kMaxBufferedCandidates = 64;

} // namespace

const char* to_string(ConnectionState state){
  switch(state) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Connected: return "connected";
    case ConnectionState::Failed: return "failed";
    case ConnectionState::Closed: return "closed";
  }
  return "unknown";
}

bool is_valid_transition(ConnectionState from, ConnectionState to){
  if(from == to) return false;
  switch(from) {
    case ConnectionState::Disconnected:
      return to == ConnectionState::Connecting || to == ConnectionState::Failed || to == ConnectionState::Closed;
    case ConnectionState::Connecting:
      return to != ConnectionState::Connecting;
    case ConnectionState::Connected:
      return to == ConnectionState::Disconnected || to == ConnectionState::Failed || to == ConnectionState::Closed;
    case ConnectionState::Failed:
    case ConnectionState::Closed:
      return to == ConnectionState::Connecting || to == ConnectionState::Disconnected ||
             to == ConnectionState::Closed;
  }
  return false;
}

PeerManager::PeerManager(asio::io_context& io,
                         std::string local_peer_id,
                         std::shared_ptr<PeerTransportFactory> factory,
                         std::shared_ptr<Logger> logger)
  : io_(io),
    local_peer_id_(std::move(local_peer_id)),
    factory_(std::move(factory)),
    logger_(std::move(logger)) {}

void PeerManager::handle_signal(const SignalingMessage& msg){
  std::visit(overloaded{
    [&](const SessionCreateMessage& m) { if(m.success) apply_roster(m.peers); },
    [&](const SessionJoinMessage& m) { if(m.success) apply_roster(m.peers); },
    [&](const PeerListMessage& m) { apply_roster(m.peers); },
    [&](const PeerAnnounceMessage& m) {
      if(m.peer_id == local_peer_id_) return;
      {
        std::lock_guard lg(m_);
        auto& info = peers_[m.peer_id];
        info.peer_id = m.peer_id;
        if(!m.peer_name.empty()) info.display_name = m.peer_name;
        if(!m.device_type.empty()) info.device_type = m.device_type;
      }
      log_info(logger_.get(), "Discovered peer {} ({})", m.peer_id, m.peer_name);
      if(roster_callback_) roster_callback_(peers());
    },
    [&](const OfferMessage& m) { handle_offer(m); },
    [&](const AnswerMessage& m) { handle_answer(m); },
    [&](const IceCandidateMessage& m) { handle_candidate(m); },
    [&](const SessionLeaveMessage& m) {
      if(m.peer_id == local_peer_id_) return;
      drop_link(m.peer_id);
      transition(m.peer_id, ConnectionState::Closed, "left the session");
    },
    [&](const ErrorMessage& m) {
      log_warn(logger_.get(), "PeerManager: relay reported: {}", m.error);
      if(error_callback_) error_callback_(m);
    },
    [&](const PingMessage&) {},
    [&](const PongMessage&) {},
  }, msg);
}

void PeerManager::apply_roster(const std::vector<PeerSummary>& roster){
  std::vector<std::string> removed;
  {
    std::lock_guard lg(m_);
    std::unordered_map<std::string, PeerInfo> next;
    for(const auto& summary : roster) {
      if(summary.id.empty() || summary.id == local_peer_id_) continue;
      PeerInfo info;
      auto it = peers_.find(summary.id);
      if(it != peers_.end()) info = it->second;
      info.peer_id = summary.id;
      info.display_name = summary.name;
      info.device_type = summary.device_type;
      next[summary.id] = std::move(info);
    }
    for(const auto& kv : peers_) {
      if(!next.count(kv.first)) removed.push_back(kv.first);
    }
    peers_.swap(next);
  }
  for(const auto& peer_id : removed) {
    drop_link(peer_id);
    log_info(logger_.get(), "Peer {} left the session", peer_id);
    if(state_callback_) state_callback_(peer_id, ConnectionState::Closed, "left the session");
  }
  log_debug(logger_.get(), "PeerManager: roster now has {} peers", known_peer_count());
  if(roster_callback_) roster_callback_(peers());
}

bool PeerManager::connect(const std::string& peer_id, std::string& error){
  {
    std::lock_guard lg(m_);
    auto it = peers_.find(peer_id);
    if(it == peers_.end()) {
      error = "unknown peer '" + peer_id + "'";
      return false;
    }
    if(it->second.state == ConnectionState::Connecting || it->second.state == ConnectionState::Connected) {
      error = "peer " + peer_id + " is already " + to_string(it->second.state);
      return false;
    }
  }
  auto self = shared_from_this();
  asio::post(io_, [self, peer_id]{ self->start_initiator(peer_id); });
  return true;
}

void PeerManager::start_initiator(const std::string& peer_id){
  drop_link(peer_id);
  if(!transition(peer_id, ConnectionState::Connecting, "sending offer")) return;
  const uint64_t attempt = ++attempt_counter_;
  auto& link = links_[peer_id];
  link.initiator = true;
  link.attempt = attempt;
  link.transport = make_transport(peer_id, attempt);
  auto offer = link.transport->create_offer();
  if(!signal_sender_ || !signal_sender_(OfferMessage{{std::string(), peer_id, offer}})) {
    fail_peer(peer_id, "relay session not joined");
  }
}

void PeerManager::handle_offer(const OfferMessage& msg){
  const std::string& from = msg.peer_id;
  if(from == local_peer_id_) return;
  {
    std::lock_guard lg(m_);
    auto& info = peers_[from];
    info.peer_id = from;
  }

  auto existing = links_.find(from);
  if(existing != links_.end() && existing->second.transport) {
    auto current = state_of(from);
    if(existing->second.initiator && current == ConnectionState::Connecting && local_peer_id_ < from) {
      log_debug(logger_.get(), "PeerManager: ignoring crossing offer from {}", from);
      return;
    }
    std::vector<nlohmann::json> kept;
    if(existing->second.initiator) kept = std::move(existing->second.pending_candidates);
    existing->second.transport->close();
    links_.erase(existing);
    if(current == ConnectionState::Connected) {
      transition(from, ConnectionState::Disconnected, "remote restarted negotiation");
    }
    links_[from].pending_candidates = std::move(kept);
  }

  if(!transition(from, ConnectionState::Connecting, "offer received")) {
    auto current = state_of(from);
    if(current != ConnectionState::Connecting) return;
  }
  const uint64_t attempt = ++attempt_counter_;
  auto& link = links_[from];
  link.initiator = false;
  link.attempt = attempt;
  link.transport = make_transport(from, attempt);

  std::string error;
  if(!link.transport->set_remote_description(msg.data, error)) {
    report("Rejected offer from " + from + ": " + error);
    fail_peer(from, error);
    return;
  }
  link.remote_description_set = true;
  auto answer = link.transport->create_answer();
  if(!signal_sender_ || !signal_sender_(AnswerMessage{{std::string(), from, answer}})) {
    fail_peer(from, "relay session not joined");
    return;
  }
  flush_candidates(from, link);
}

void PeerManager::handle_answer(const AnswerMessage& msg){
  const std::string& from = msg.peer_id;
  auto it = links_.find(from);
  if(it == links_.end() || !it->second.transport || !it->second.initiator || it->second.remote_description_set) {
    report("Unexpected answer from " + from);
    return;
  }
  std::string error;
  if(!it->second.transport->set_remote_description(msg.data, error)) {
    report("Rejected answer from " + from + ": " + error);
    fail_peer(from, error);
    return;
  }
  it->second.remote_description_set = true;
  flush_candidates(from, it->second);
}

void PeerManager::handle_candidate(const IceCandidateMessage& msg){
  const std::string& from = msg.peer_id;
  if(from == local_peer_id_) return;
  auto& link = links_[from];
  if(link.transport && link.remote_description_set) {
    std::string error;
    if(!link.transport->add_remote_candidate(msg.data, error)) {
      log_debug(logger_.get(), "PeerManager: candidate from {} ignored: {}", from, error);
    }
    return;
  }
  if(link.pending_candidates.size() >= kMaxBufferedCandidates) {
    log_warn(logger_.get(), "PeerManager: candidate buffer for {} is full", from);
    return;
  }
  link.pending_candidates.push_back(msg.data);
}

void PeerManager::flush_candidates(const std::string& peer_id, Link& link){
  auto pending = std::move(link.pending_candidates);
  link.pending_candidates.clear();
  for(const auto& candidate : pending) {
    std::string error;
    if(!link.transport->add_remote_candidate(candidate, error)) {
      log_debug(logger_.get(), "PeerManager: buffered candidate from {} ignored: {}", peer_id, error);
    }
  }
}

std::shared_ptr<PeerTransport> PeerManager::make_transport(const std::string& peer_id, uint64_t attempt){
  auto transport = factory_->create(peer_id);
  std::weak_ptr<PeerManager> weak = weak_from_this();
  PeerTransport::Callbacks callbacks;
  callbacks.on_local_candidate = [weak, peer_id, attempt](const nlohmann::json& candidate){
    auto self = weak.lock();
    if(!self || !self->current_attempt(peer_id, attempt) || !self->signal_sender_) return;
    self->signal_sender_(IceCandidateMessage{{std::string(), peer_id, candidate}});
  };
  callbacks.on_open = [weak, peer_id, attempt]{
    auto self = weak.lock();
    if(!self || !self->current_attempt(peer_id, attempt)) return;
    if(self->transition(peer_id, ConnectionState::Connected, "link open")) {
      log_info(self->logger_.get(), "PeerManager: connected {}", peer_id);
    }
  };
  callbacks.on_message = [weak, peer_id, attempt](const nlohmann::json& message){
    auto self = weak.lock();
    if(!self || !self->current_attempt(peer_id, attempt)) return;
    if(self->message_callback_) self->message_callback_(peer_id, message);
  };
  callbacks.on_failed = [weak, peer_id, attempt](const std::string& reason){
    auto self = weak.lock();
    if(!self || !self->current_attempt(peer_id, attempt)) return;
    self->fail_peer(peer_id, reason);
  };
  callbacks.on_closed = [weak, peer_id, attempt]{
    auto self = weak.lock();
    if(!self || !self->current_attempt(peer_id, attempt)) return;
    self->links_.erase(peer_id);
    self->transition(peer_id, ConnectionState::Disconnected, "link closed");
    log_info(self->logger_.get(), "PeerManager: disconnected {}", peer_id);
  };
  transport->set_callbacks(std::move(callbacks));
  return transport;
}

bool PeerManager::current_attempt(const std::string& peer_id, uint64_t attempt) const {
  auto it = links_.find(peer_id);
  return it != links_.end() && it->second.attempt == attempt;
}

void PeerManager::drop_link(const std::string& peer_id){
  auto it = links_.find(peer_id);
  if(it == links_.end()) return;
  auto transport = std::move(it->second.transport);
  links_.erase(it);
  if(transport) transport->close();
}

bool PeerManager::transition(const std::string& peer_id, ConnectionState to, const std::string& reason){
  ConnectionState from;
  {
    std::lock_guard lg(m_);
    auto it = peers_.find(peer_id);
    if(it == peers_.end()) return false;
    from = it->second.state;
    if(!is_valid_transition(from, to)) return false;
    it->second.state = to;
    if(to == ConnectionState::Failed) {
      it->second.last_error = reason;
    } else if(to == ConnectionState::Connected) {
      it->second.last_error.clear();
    }
  }
  log_debug(logger_.get(), "PeerManager: {} {} -> {} ({})", peer_id, to_string(from), to_string(to), reason);
  if(state_callback_) state_callback_(peer_id, to, reason);
  return true;
}

void PeerManager::fail_peer(const std::string& peer_id, const std::string& reason){
  drop_link(peer_id);
  if(transition(peer_id, ConnectionState::Failed, reason)) {
    log_warn(logger_.get(), "PeerManager: connection to {} failed: {}", peer_id, reason);
  }
}

void PeerManager::report(const std::string& error){
  log_warn(logger_.get(), "PeerManager: {}", error);
  if(error_callback_) error_callback_(ErrorMessage{std::string(), error});
}

void PeerManager::disconnect(const std::string& peer_id){
  auto self = shared_from_this();
  asio::post(io_, [self, peer_id]{
    self->drop_link(peer_id);
    self->transition(peer_id, ConnectionState::Closed, "closed locally");
  });
}

void PeerManager::close_all(){
  auto self = shared_from_this();
  asio::post(io_, [self]{
    std::vector<std::string> ids;
    for(const auto& kv : self->links_) ids.push_back(kv.first);
    for(const auto& id : ids) self->drop_link(id);
    for(const auto& info : self->peers()) {
      self->transition(info.peer_id, ConnectionState::Closed, "shutting down");
    }
  });
}

bool PeerManager::send_json_to_peer(const std::string& peer_id, const nlohmann::json& j){
  if(state_of(peer_id) != ConnectionState::Connected) return false;
  auto self = shared_from_this();
  asio::post(io_, [self, peer_id, payload = j]{
    auto it = self->links_.find(peer_id);
    if(it == self->links_.end() || !it->second.transport || !it->second.transport->send(payload)) {
      log_debug(self->logger_.get(), "PeerManager: dropped message to {} (no open link)", peer_id);
    }
  });
  return true;
}

std::vector<PeerInfo> PeerManager::peers() const {
  std::lock_guard lg(m_);
  std::vector<PeerInfo> out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

std::optional<PeerInfo> PeerManager::peer(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_id);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

std::optional<ConnectionState> PeerManager::state_of(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_id);
  if(it == peers_.end()) return std::nullopt;
  return it->second.state;
}

std::size_t PeerManager::known_peer_count() const {
  std::lock_guard lg(m_);
  return peers_.size();
}

std::size_t PeerManager::connected_peer_count() const {
  std::lock_guard lg(m_);
  std::size_t count = 0;
  for(const auto& kv : peers_) {
    if(kv.second.state == ConnectionState::Connected) ++count;
  }
  return count;
}
