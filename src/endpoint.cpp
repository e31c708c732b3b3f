#include "endpoint.hpp"

#include "log.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
  return text.rfind(prefix, 0) == 0;
}

std::optional<int> leading_octet(const std::string& host, std::size_t skip) {
  if(host.size() <= skip) return std::nullopt;
  std::size_t end = host.find('.', skip);
  if(end == std::string::npos) return std::nullopt;
  try {
    return std::stoi(host.substr(skip, end - skip));
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

} // namespace

std::string EndpointUrl::to_string() const {
  std::string scheme = http ? (secure ? "https" : "http") : (secure ? "sigs" : "sig");
  std::string out = scheme + "://" + host;
  unsigned short default_port = secure ? 443 : 80;
  if(port != default_port) out += ":" + std::to_string(port);
  return out;
}

std::optional<EndpointUrl> parse_endpoint_url(const std::string& url){
  EndpointUrl out;
  std::string rest;
  if(starts_with(url, "sigs://")) {
    out.secure = true;
    rest = url.substr(7);
  } else if(starts_with(url, "sig://")) {
    rest = url.substr(6);
  } else if(starts_with(url, "https://")) {
    out.secure = true;
    out.http = true;
    rest = url.substr(8);
  } else if(starts_with(url, "http://")) {
    out.http = true;
    rest = url.substr(7);
  } else {
    return std::nullopt;
  }
  auto slash = rest.find('/');
  if(slash != std::string::npos) rest = rest.substr(0, slash);
  if(rest.empty()) return std::nullopt;

  out.port = out.secure ? 443 : 80;
  auto colon = rest.rfind(':');
  if(colon != std::string::npos) {
    int port = 0;
    try {
      port = std::stoi(rest.substr(colon + 1));
    } catch(const std::exception&) {
      return std::nullopt;
    }
    if(port <= 0 || port > 65535) return std::nullopt;
    out.port = static_cast<unsigned short>(port);
    rest = rest.substr(0, colon);
  }
  if(rest.empty()) return std::nullopt;
  out.host = rest;
  return out;
}

bool is_local_host(const std::string& host){
  if(host == "localhost" || host == "127.0.0.1") return true;
  if(starts_with(host, "192.168.") || starts_with(host, "10.")) return true;
  if(starts_with(host, "172.")) {
    auto second = leading_octet(host, 4);
    return second && *second >= 16 && *second <= 31;
  }
  return false;
}

bool is_local_endpoint(const std::string& url){
  auto parsed = parse_endpoint_url(url);
  return parsed && is_local_host(parsed->host);
}

std::string derive_signaling_url(const std::string& host_or_url){
  if(const char* env = std::getenv(kSignalingUrlEnv); env && *env) {
    return env;
  }
  if(host_or_url.find("://") != std::string::npos) return host_or_url;
  std::string host = host_or_url.empty() ? "localhost" : host_or_url;
  if(is_local_host(host)) {
    return "sig://" + host + ":" + std::to_string(kLocalSignalingPort);
  }
  return "sigs://" + host;
}

std::string to_http_url(const std::string& signaling_url){
  if(starts_with(signaling_url, "sigs://")) return "https://" + signaling_url.substr(7);
  if(starts_with(signaling_url, "sig://")) return "http://" + signaling_url.substr(6);
  return signaling_url;
}

RuntimeContext& RuntimeContext::instance(){
  static RuntimeContext context;
  return context;
}

PeerIdentity RuntimeContext::identity(const std::filesystem::path& workspace,
                                      const std::string& preferred_peer_id,
                                      const std::string& display_name,
                                      Logger* logger){
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string key = workspace.lexically_normal().string();
  auto it = identities_.find(key);
  if(it != identities_.end()) return it->second;

  auto path = workspace / ".config" / "identity.json";
  PeerIdentity identity;
  bool dirty = false;
  std::ifstream in(path);
  if(in) {
    try {
      auto j = nlohmann::json::parse(in);
      identity.peer_id = j.value("peerId", std::string());
      identity.display_name = j.value("displayName", std::string());
      identity.device_type = j.value("deviceType", std::string("desktop"));
      identity.created_at = j.value("createdAt", int64_t{0});
    } catch(const std::exception& e) {
      log_warn(logger, "Ignoring unreadable identity file {}: {}", path.string(), e.what());
    }
  }
  if(!preferred_peer_id.empty() && preferred_peer_id != identity.peer_id) {
    identity.peer_id = preferred_peer_id;
    dirty = true;
  }
  if(identity.peer_id.empty()) {
    identity.peer_id = generate_peer_id();
    identity.created_at = now_ms();
    dirty = true;
  }
  if(!display_name.empty() && display_name != identity.display_name) {
    identity.display_name = display_name;
    dirty = true;
  }

  if(dirty) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::trunc);
    if(out) {
      nlohmann::json j{
        {"peerId", identity.peer_id},
        {"displayName", identity.display_name},
        {"deviceType", identity.device_type},
        {"createdAt", identity.created_at}
      };
      out << j.dump(2);
    } else {
      log_warn(logger, "Unable to persist identity to {}", path.string());
    }
  }
  identities_.emplace(key, identity);
  return identity;
}

Endpoints RuntimeContext::endpoints(const std::string& host_or_url){
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = endpoints_.find(host_or_url);
  if(it != endpoints_.end()) return it->second;
  Endpoints endpoints;
  endpoints.signaling_url = derive_signaling_url(host_or_url);
  endpoints.http_url = to_http_url(endpoints.signaling_url);
  endpoints_.emplace(host_or_url, endpoints);
  return endpoints;
}

void RuntimeContext::reset_for_tests(){
  std::lock_guard<std::mutex> lock(mutex_);
  identities_.clear();
  endpoints_.clear();
}
