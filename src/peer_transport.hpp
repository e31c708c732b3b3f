#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>

// Direct link to one remote peer, negotiated through the relay. The local
// side produces a description (offer or answer) and trickles candidates;
// the remote description and candidates are applied as they arrive.
class PeerTransport {
public:
  struct Callbacks {
    std::function<void(const nlohmann::json& candidate)> on_local_candidate;
    std::function<void()> on_open;
    std::function<void(const nlohmann::json& message)> on_message;
    // Negotiation gave up after the transport's retry budget.
    std::function<void(const std::string& reason)> on_failed;
    std::function<void()> on_closed;
  };

  virtual ~PeerTransport() = default;

  virtual void set_callbacks(Callbacks callbacks) = 0;

  virtual nlohmann::json create_offer() = 0;
  virtual nlohmann::json create_answer() = 0;
  virtual bool set_remote_description(const nlohmann::json& description, std::string& error) = 0;
  virtual bool add_remote_candidate(const nlohmann::json& candidate, std::string& error) = 0;

  virtual bool send(const nlohmann::json& message) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

class PeerTransportFactory {
public:
  virtual ~PeerTransportFactory() = default;
  virtual std::shared_ptr<PeerTransport> create(const std::string& remote_peer_id) = 0;
};
