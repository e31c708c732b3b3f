#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

using json = nlohmann::json;

// Relay control channel. One JSON object per line; "type" selects the
// alternative of SignalingMessage.

struct PeerSummary {
  std::string id;
  std::string name;
  std::string device_type = "desktop";
  bool is_online = true;
};

// session-create / session-join. The relay echoes the request type back to
// the joiner with peers and success filled in.
struct SessionRequest {
  std::string session_id;
  std::string peer_id;
  std::string peer_name;
  std::string device_type;
  std::vector<PeerSummary> peers;
  bool success = false;
};
struct SessionCreateMessage : SessionRequest {};
struct SessionJoinMessage : SessionRequest {};

struct SessionLeaveMessage {
  std::string session_id;
  std::string peer_id;
};

// offer / answer / ice-candidate. peer_id names the target when sent to the
// relay and the sender once forwarded.
struct NegotiationMessage {
  std::string session_id;
  std::string peer_id;
  json data;
};
struct OfferMessage : NegotiationMessage {};
struct AnswerMessage : NegotiationMessage {};
struct IceCandidateMessage : NegotiationMessage {};

struct PeerListMessage {
  std::string session_id;
  std::vector<PeerSummary> peers;
};

struct PeerAnnounceMessage {
  std::string session_id;
  std::string network_id;
  std::string peer_id;
  std::string peer_name;
  std::string device_type;
};

struct ErrorMessage {
  std::string session_id;
  std::string error;
};

struct PingMessage {};
struct PongMessage {};

using SignalingMessage = std::variant<OfferMessage,
                                      AnswerMessage,
                                      IceCandidateMessage,
                                      SessionCreateMessage,
                                      SessionJoinMessage,
                                      SessionLeaveMessage,
                                      PeerListMessage,
                                      PeerAnnounceMessage,
                                      ErrorMessage,
                                      PingMessage,
                                      PongMessage>;

const char* message_type(const SignalingMessage& msg);

// Rejects input whose type is unknown or that lacks a field its type
// requires. error receives the reason in the form the relay reports it.
std::optional<SignalingMessage> parse_signaling_message(const json& j, std::string& error);
std::optional<SignalingMessage> parse_signaling_line(const std::string& line, std::string& error);

json serialize_signaling_message(const SignalingMessage& msg);

json peer_summary_to_json(const PeerSummary& peer);
PeerSummary peer_summary_from_json(const json& j);
