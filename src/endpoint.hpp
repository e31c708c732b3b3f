#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

class Logger;

inline constexpr unsigned short kLocalSignalingPort = 8080;
inline constexpr const char* kSignalingUrlEnv = "WINGSYNC_SIGNALING_URL";

// sig://host:port (plain TCP) or sigs://host (TLS). http/https are accepted
// as well so the health URL parses with the same code.
struct EndpointUrl {
  bool secure = false;
  bool http = false;
  std::string host;
  unsigned short port = 0;

  std::string to_string() const;
};

std::optional<EndpointUrl> parse_endpoint_url(const std::string& url);

// localhost, 127.0.0.1, 10.*, 192.168.*, 172.16-31.*
bool is_local_host(const std::string& host);
bool is_local_endpoint(const std::string& url);

// Environment override first; a full URL is taken as is; a bare host becomes
// sig://host:8080 when local and sigs://host otherwise.
std::string derive_signaling_url(const std::string& host_or_url);

// sig:// -> http://, sigs:// -> https://
std::string to_http_url(const std::string& signaling_url);

struct PeerIdentity {
  std::string peer_id;
  std::string display_name;
  std::string device_type = "desktop";
  int64_t created_at = 0;
};

struct Endpoints {
  std::string signaling_url;
  std::string http_url;
};

// Process-wide caches for values that must not change once a node is up:
// the durable peer identity of a workspace and the derived relay endpoints.
// Entries are created on first use and are read-only afterwards.
class RuntimeContext {
public:
  static RuntimeContext& instance();

  // Reads <workspace>/.config/identity.json or creates it. A non-empty
  // preferred_peer_id replaces the stored id.
  PeerIdentity identity(const std::filesystem::path& workspace,
                        const std::string& preferred_peer_id,
                        const std::string& display_name,
                        Logger* logger = nullptr);

  Endpoints endpoints(const std::string& host_or_url);

  void reset_for_tests();

private:
  RuntimeContext() = default;

  std::mutex mutex_;
  std::map<std::string, PeerIdentity> identities_;
  std::map<std::string, Endpoints> endpoints_;
};
