#include "protocol.hpp"

#include "utils.hpp"

namespace {

std::string string_field(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return std::string();
  return it->get<std::string>();
}

std::vector<PeerSummary> peers_field(const json& j) {
  std::vector<PeerSummary> peers;
  auto it = j.find("peers");
  if(it == j.end() || !it->is_array()) return peers;
  for(const auto& entry : *it) {
    if(entry.is_object()) peers.push_back(peer_summary_from_json(entry));
  }
  return peers;
}

template<typename T>
std::optional<SignalingMessage> parse_session_request(const json& j, std::string& error) {
  T msg;
  msg.session_id = string_field(j, "sessionId");
  if(msg.session_id.empty()) {
    error = "Session ID required";
    return std::nullopt;
  }
  msg.peer_id = string_field(j, "peerId");
  msg.peer_name = string_field(j, "peerName");
  msg.device_type = string_field(j, "deviceType");
  msg.peers = peers_field(j);
  msg.success = j.value("success", false);
  return SignalingMessage{std::move(msg)};
}

template<typename T>
std::optional<SignalingMessage> parse_negotiation(const json& j, const std::string& type, std::string& error) {
  T msg;
  msg.session_id = string_field(j, "sessionId");
  if(msg.session_id.empty()) {
    error = "Session ID required";
    return std::nullopt;
  }
  msg.peer_id = string_field(j, "peerId");
  if(msg.peer_id.empty()) {
    error = "Peer ID required for " + type;
    return std::nullopt;
  }
  auto it = j.find("data");
  if(it == j.end() || it->is_null()) {
    error = "Missing data for " + type;
    return std::nullopt;
  }
  msg.data = *it;
  return SignalingMessage{std::move(msg)};
}

void put_if(json& j, const char* key, const std::string& value) {
  if(!value.empty()) j[key] = value;
}

json session_request_json(const char* type, const SessionRequest& msg) {
  json j{{"type", type}, {"sessionId", msg.session_id}};
  put_if(j, "peerId", msg.peer_id);
  put_if(j, "peerName", msg.peer_name);
  put_if(j, "deviceType", msg.device_type);
  if(msg.success) {
    j["success"] = true;
    j["peers"] = json::array();
    for(const auto& peer : msg.peers) j["peers"].push_back(peer_summary_to_json(peer));
  }
  return j;
}

json negotiation_json(const char* type, const NegotiationMessage& msg) {
  return json{{"type", type}, {"sessionId", msg.session_id}, {"peerId", msg.peer_id}, {"data", msg.data}};
}

} // namespace

json peer_summary_to_json(const PeerSummary& peer){
  return json{{"id", peer.id}, {"name", peer.name}, {"deviceType", peer.device_type}, {"isOnline", peer.is_online}};
}

PeerSummary peer_summary_from_json(const json& j){
  PeerSummary peer;
  peer.id = string_field(j, "id");
  peer.name = string_field(j, "name");
  peer.device_type = j.value("deviceType", std::string("desktop"));
  peer.is_online = j.value("isOnline", true);
  return peer;
}

const char* message_type(const SignalingMessage& msg){
  return std::visit(overloaded{
    [](const OfferMessage&) { return "offer"; },
    [](const AnswerMessage&) { return "answer"; },
    [](const IceCandidateMessage&) { return "ice-candidate"; },
    [](const SessionCreateMessage&) { return "session-create"; },
    [](const SessionJoinMessage&) { return "session-join"; },
    [](const SessionLeaveMessage&) { return "session-leave"; },
    [](const PeerListMessage&) { return "peer-list"; },
    [](const PeerAnnounceMessage&) { return "peer-announce"; },
    [](const ErrorMessage&) { return "error"; },
    [](const PingMessage&) { return "ping"; },
    [](const PongMessage&) { return "pong"; },
  }, msg);
}

std::optional<SignalingMessage> parse_signaling_message(const json& j, std::string& error){
  if(!j.is_object()) {
    error = "Invalid message format";
    return std::nullopt;
  }
  const std::string type = string_field(j, "type");
  if(type.empty()) {
    error = "Invalid message format";
    return std::nullopt;
  }

  if(type == "session-create") return parse_session_request<SessionCreateMessage>(j, error);
  if(type == "session-join") return parse_session_request<SessionJoinMessage>(j, error);
  if(type == "offer") return parse_negotiation<OfferMessage>(j, type, error);
  if(type == "answer") return parse_negotiation<AnswerMessage>(j, type, error);
  if(type == "ice-candidate") return parse_negotiation<IceCandidateMessage>(j, type, error);

  if(type == "session-leave") {
    SessionLeaveMessage msg;
    msg.session_id = string_field(j, "sessionId");
    msg.peer_id = string_field(j, "peerId");
    if(msg.session_id.empty()) {
      error = "Session ID required";
      return std::nullopt;
    }
    if(msg.peer_id.empty()) {
      error = "Peer ID required for session-leave";
      return std::nullopt;
    }
    return SignalingMessage{std::move(msg)};
  }
  if(type == "peer-list") {
    auto it = j.find("peers");
    if(it == j.end() || !it->is_array()) {
      error = "Missing peers for peer-list";
      return std::nullopt;
    }
    return SignalingMessage{PeerListMessage{string_field(j, "sessionId"), peers_field(j)}};
  }
  if(type == "peer-announce") {
    PeerAnnounceMessage msg;
    msg.session_id = string_field(j, "sessionId");
    msg.network_id = string_field(j, "networkId");
    msg.peer_id = string_field(j, "peerId");
    msg.peer_name = string_field(j, "peerName");
    msg.device_type = string_field(j, "deviceType");
    if(msg.peer_id.empty()) {
      error = "Peer ID required for peer-announce";
      return std::nullopt;
    }
    return SignalingMessage{std::move(msg)};
  }
  if(type == "error") {
    ErrorMessage msg{string_field(j, "sessionId"), string_field(j, "error")};
    if(msg.error.empty()) {
      error = "Missing error text";
      return std::nullopt;
    }
    return SignalingMessage{std::move(msg)};
  }
  if(type == "ping") return SignalingMessage{PingMessage{}};
  if(type == "pong") return SignalingMessage{PongMessage{}};

  error = "Unknown message type: " + type;
  return std::nullopt;
}

std::optional<SignalingMessage> parse_signaling_line(const std::string& line, std::string& error){
  json j = json::parse(line, nullptr, false);
  if(j.is_discarded()) {
    error = "Invalid message format";
    return std::nullopt;
  }
  return parse_signaling_message(j, error);
}

json serialize_signaling_message(const SignalingMessage& msg){
  return std::visit(overloaded{
    [](const OfferMessage& m) { return negotiation_json("offer", m); },
    [](const AnswerMessage& m) { return negotiation_json("answer", m); },
    [](const IceCandidateMessage& m) { return negotiation_json("ice-candidate", m); },
    [](const SessionCreateMessage& m) { return session_request_json("session-create", m); },
    [](const SessionJoinMessage& m) { return session_request_json("session-join", m); },
    [](const SessionLeaveMessage& m) {
      return json{{"type", "session-leave"}, {"sessionId", m.session_id}, {"peerId", m.peer_id}};
    },
    [](const PeerListMessage& m) {
      json peers = json::array();
      for(const auto& peer : m.peers) peers.push_back(peer_summary_to_json(peer));
      return json{{"type", "peer-list"}, {"sessionId", m.session_id}, {"peers", peers}};
    },
    [](const PeerAnnounceMessage& m) {
      json j{{"type", "peer-announce"}, {"peerId", m.peer_id}};
      put_if(j, "sessionId", m.session_id);
      put_if(j, "networkId", m.network_id);
      put_if(j, "peerName", m.peer_name);
      put_if(j, "deviceType", m.device_type);
      return j;
    },
    [](const ErrorMessage& m) {
      return json{{"type", "error"}, {"sessionId", m.session_id}, {"error", m.error}};
    },
    [](const PingMessage&) { return json{{"type", "ping"}}; },
    [](const PongMessage&) { return json{{"type", "pong"}}; },
  }, msg);
}
