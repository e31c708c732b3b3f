#include "node.hpp"

#include <stdexcept>
#include <system_error>

#include "endpoint.hpp"
#include "node_cli.hpp"
#include "settings_manager.hpp"
#include "sync_coordinator.hpp"
#include "sync_protocol.hpp"
#include "sync_storage.hpp"
#include "tcp_peer_transport.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

Node::Node(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("node")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = fs::current_path();
  }
}

Node::~Node() {
  stop();
}

void Node::ensure_workspace() const {
  std::error_code ec;
  fs::create_directories(options_.workspace_root / ".config", ec);
  if(ec) throw std::runtime_error("Unable to create workspace " + options_.workspace_root.string() + ": " + ec.message());
  fs::create_directories(received_dir(), ec);
}

void Node::start() {
  if(started_) return;

  ensure_workspace();
  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }
  init_logging(settings_->get<bool>("verbose"));

  auto& runtime = RuntimeContext::instance();
  PeerIdentity identity = runtime.identity(options_.workspace_root,
                                           settings_->get<std::string>("peer_id"),
                                           settings_->get<std::string>("display_name"),
                                           logger_.get());
  peer_id_ = identity.peer_id;
  display_name_ = identity.display_name.empty() ? peer_id_ : identity.display_name;
  logger_->set_name(display_name_);

  Endpoints endpoints = runtime.endpoints(settings_->get<std::string>("signaling_url"));
  signaling_url_ = endpoints.signaling_url;
  if(!parse_endpoint_url(signaling_url_)) {
    throw std::runtime_error("Invalid signaling_url '" + signaling_url_ + "'");
  }

  session_id_ = settings_->get<std::string>("session_id");
  const bool create_session = session_id_.empty() || settings_->get<bool>("create_session");
  if(session_id_.empty()) session_id_ = generate_session_id();
  if(!is_valid_session_id(session_id_)) {
    throw std::runtime_error("Invalid session_id '" + session_id_ + "' (8-16 of A-Z a-z 0-9 _ -)");
  }

  int chunk_size = settings_->get<int>("chunk_size");
  if(chunk_size <= 0) {
    logger_->error("Invalid chunk_size '{}'", chunk_size);
    throw std::runtime_error("Invalid chunk_size");
  }
  int heartbeat_ms = settings_->get<int>("heartbeat_interval_ms");
  if(heartbeat_ms <= 0) {
    logger_->error("Invalid heartbeat_interval_ms '{}'", heartbeat_ms);
    throw std::runtime_error("Invalid heartbeat_interval_ms");
  }
  sync_interval_ = std::chrono::seconds(std::max(0, settings_->get<int>("sync_interval_s")));

  transport_factory_ = std::make_shared<TcpPeerTransportFactory>(io_, peer_id_,
                                                                 settings_->get<std::string>("listen_ip"),
                                                                 logger_);
  std::string error;
  if(!transport_factory_->listen(0, error)) {
    logger_->error("{}", error);
    throw std::runtime_error("Unable to open the peer listener: " + error);
  }

  peer_manager_ = std::make_shared<PeerManager>(io_, peer_id_, transport_factory_, logger_);

  TransferEngine::Options transfer_options;
  transfer_options.chunk_size = static_cast<std::size_t>(chunk_size);
  transfer_options.debug = settings_->get<bool>("transfer_debug");
  transfers_ = std::make_shared<TransferEngine>(io_,
    [this](const std::string& peer, const nlohmann::json& j){ return peer_manager_->send_json_to_peer(peer, j); },
    transfer_options, logger_);

  storage_ = std::make_shared<SyncStorage>(options_.workspace_root, logger_);
  if(!storage_->load(error)) {
    logger_->warn("Sync storage unreadable, starting empty: {}", error);
  }

  SyncCoordinator::Options sync_options;
  sync_options.response_timeout = options_.sync_response_timeout;
  coordinator_ = std::make_shared<SyncCoordinator>(io_, storage_, transfers_,
    [this](const std::string& peer, const nlohmann::json& j){ return peer_manager_->send_json_to_peer(peer, j); },
    [this](const std::string& peer){ return peer_manager_->state_of(peer) == ConnectionState::Connected; },
    sync_options, logger_);

  SignalingClient::Options signaling_options;
  signaling_options.signaling_url = signaling_url_;
  signaling_options.session_id = session_id_;
  signaling_options.create_session = create_session;
  signaling_options.peer_id = peer_id_;
  signaling_options.peer_name = display_name_;
  signaling_options.device_type = settings_->get<std::string>("device_type");
  signaling_options.heartbeat_interval = std::chrono::milliseconds(heartbeat_ms);
  signaling_ = std::make_shared<SignalingClient>(io_, signaling_options, logger_);

  warmup_ = std::make_shared<ServerWarmup>(io_, endpoints.http_url, logger_, options_.warmup);

  wire_callbacks();
  started_ = true;

  logger_->info("Peer {} ({}) session {} via {}", peer_id_, display_name_, session_id_, signaling_url_);
  warmup_status_ = WarmupStatus::Checking;
  warmup_->start([this](WarmupStatus status){
    warmup_status_ = status;
    if(status == WarmupStatus::Ready) {
      signaling_->start();
    } else if(status == WarmupStatus::Timeout) {
      logger_->error("Relay at {} did not become ready; not joining session {}", signaling_url_, session_id_);
    }
  });

  if(sync_interval_.count() > 0) {
    sync_timer_ = std::make_unique<asio::steady_timer>(io_);
    schedule_sync_tick();
  }

  cli_ = std::make_unique<NodeCli>(*this, settings_);
  if(options_.start_cli_thread) {
    start_cli();
  }
}

void Node::wire_callbacks() {
  signaling_->set_message_callback([this](const SignalingMessage& msg){
    peer_manager_->handle_signal(msg);
  });
  signaling_->set_state_callback([this](SignalingClient::State state, const std::string& reason){
    if(state == SignalingClient::State::Failed) {
      logger_->error("Relay link failed: {}", reason);
    } else {
      logger_->info("Relay link {}: {}", to_string(state), reason);
    }
  });
  peer_manager_->set_signal_sender([this](SignalingMessage msg){
    return signaling_->send(std::move(msg));
  });
  peer_manager_->set_message_callback([this](const std::string& peer, const nlohmann::json& j){
    route_peer_message(peer, j);
  });
  peer_manager_->set_state_callback([this](const std::string& peer, ConnectionState state, const std::string& reason){
    on_peer_state(peer, state, reason);
  });
  peer_manager_->set_error_callback([this](const ErrorMessage& error){
    logger_->warn("Relay reported: {}", error.error);
  });

  transfers_->set_destination_resolver([this](const std::string& peer, const TransferMetadata& metadata){
    return destination_for(peer, metadata);
  });
  transfers_->set_progress_callback([this](const std::string& peer, TransferDirection direction, const TransferProgress& progress){
    coordinator_->on_transfer_progress(peer, direction, progress);
  });
  transfers_->set_completion_callback([this](const std::string& peer,
                                             TransferDirection direction,
                                             const TransferMetadata& metadata,
                                             const TransferProgress& progress,
                                             const fs::path& local_path){
    if(SyncCoordinator::is_sync_transfer(metadata)) {
      coordinator_->on_transfer_finished(peer, direction, metadata, progress, local_path);
      return;
    }
    if(progress.state == TransferState::Completed) {
      if(direction == TransferDirection::Receive) {
        logger_->info("Received {} from {} -> {}", metadata.file_name, peer, local_path.string());
      } else {
        logger_->info("Sent {} to {}", metadata.file_name, peer);
      }
    } else {
      logger_->warn("Transfer of {} {}: {}", metadata.file_name, to_string(progress.state), progress.error);
    }
  });
}

void Node::route_peer_message(const std::string& peer, const nlohmann::json& message) {
  const std::string type = message.is_object() ? message.value("type", std::string()) : std::string();
  std::string error;
  if(is_transfer_message_type(type)) {
    if(auto msg = parse_transfer_message(message, error)) {
      transfers_->handle_message(peer, *msg);
    } else {
      logger_->warn("Malformed {} from {}: {}", type, peer, error);
    }
    return;
  }
  if(is_sync_message_type(type)) {
    if(auto msg = parse_sync_message(message, error)) {
      coordinator_->handle_message(peer, *msg);
    } else {
      coordinator_->report_malformed(peer, message, error);
    }
    return;
  }
  logger_->debug("Ignoring peer message of type '{}' from {}", type, peer);
}

void Node::on_peer_state(const std::string& peer, ConnectionState state, const std::string& reason) {
  switch(state) {
    case ConnectionState::Connected:
      logger_->info("Connected to {}", peer);
      break;
    case ConnectionState::Connecting:
      logger_->debug("Connecting to {}: {}", peer, reason);
      break;
    case ConnectionState::Failed:
    case ConnectionState::Closed:
    case ConnectionState::Disconnected:
      logger_->info("Peer {} {}: {}", peer, to_string(state), reason);
      transfers_->abort_peer(peer, reason.empty() ? std::string("peer disconnected") : reason);
      coordinator_->on_peer_disconnected(peer);
      break;
  }
}

std::optional<fs::path> Node::destination_for(const std::string& peer, const TransferMetadata& metadata) {
  if(SyncCoordinator::is_sync_transfer(metadata)) {
    return coordinator_->destination_for(peer, metadata);
  }
  std::error_code ec;
  fs::create_directories(received_dir(), ec);
  if(ec) {
    logger_->error("Unable to create {}: {}", received_dir().string(), ec.message());
    return std::nullopt;
  }
  return unique_destination(received_dir(), metadata.file_name, "file-" + metadata.file_id);
}

void Node::schedule_sync_tick() {
  if(!sync_timer_) return;
  sync_timer_->expires_after(sync_interval_);
  sync_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    run_scheduled_syncs();
    schedule_sync_tick();
  });
}

void Node::run_scheduled_syncs() {
  for(const auto& config : storage_->configs()) {
    if(!config.is_active || coordinator_->is_syncing(config.id)) continue;
    if(peer_manager_->state_of(config.peer_id) != ConnectionState::Connected) continue;
    std::string error;
    if(!coordinator_->start_sync(config.id, error)) {
      logger_->debug("Scheduled sync of {} skipped: {}", config.id, error);
    }
  }
}

void Node::run() {
  if(!started_) start();
  auto guard = asio::make_work_guard(io_);
  io_.run();
}

void Node::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    auto guard = asio::make_work_guard(io_);
    io_.run();
  });
}

void Node::request_shutdown() {
  io_.stop();
}

void Node::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
    cli_thread_running_ = false;
  }
  if(sync_timer_) sync_timer_->cancel();
  warmup_->cancel();
  signaling_->stop();
  peer_manager_->close_all();
  transport_factory_->stop();

  // Give the queued leave/close handlers a moment to run before stopping.
  if(io_thread_.joinable()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  } else {
    io_.restart();
    io_.run_for(std::chrono::milliseconds(100));
  }
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  coordinator_->shutdown();
  io_.restart();
}

void Node::start_cli() {
  if(!cli_ || cli_thread_running_) return;
  cli_->start();
  cli_thread_running_ = true;
}

void Node::execute_command(const std::string& line) {
  if(cli_) cli_->execute_command(line);
}

LogListenerHandle Node::add_log_listener(Logger::Listener listener) {
  return logger_->add_listener(std::move(listener));
}

void Node::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) logger_->remove_listener(handle);
}

Node::Stats Node::stats() const {
  Stats s;
  if(peer_manager_) {
    s.known_peers = peer_manager_->known_peer_count();
    s.connected_peers = peer_manager_->connected_peer_count();
  }
  if(transfers_) {
    for(const auto& t : transfers_->transfers()) {
      if(t.state == TransferState::Active) ++s.active_transfers;
    }
  }
  if(storage_) {
    for(const auto& config : storage_->configs()) {
      ++s.sync_configs;
      if(coordinator_ && coordinator_->is_syncing(config.id)) ++s.syncing;
    }
  }
  return s;
}

WarmupStatus Node::warmup_status() const {
  return warmup_status_;
}

SignalingClient::State Node::signaling_state() const {
  return signaling_ ? signaling_->state() : SignalingClient::State::Disconnected;
}

std::vector<PeerInfo> Node::peers() const {
  return peer_manager_ ? peer_manager_->peers() : std::vector<PeerInfo>{};
}

bool Node::connect_peer(const std::string& peer, std::string& error) {
  return peer_manager_->connect(peer, error);
}

void Node::disconnect_peer(const std::string& peer) {
  peer_manager_->disconnect(peer);
}

std::optional<std::string> Node::send_file(const std::string& peer, const fs::path& path, std::string& error) {
  if(peer_manager_->state_of(peer) != ConnectionState::Connected) {
    error = "Peer " + peer + " is not connected";
    return std::nullopt;
  }
  return transfers_->send_file(peer, path, path.filename().string(), nlohmann::json::object(), error);
}

std::vector<TransferProgress> Node::transfers() const {
  return transfers_->transfers();
}

bool Node::cancel_transfer(const std::string& file_id) {
  return transfers_->cancel(file_id, "cancelled by user");
}

std::optional<SyncConfig> Node::add_sync(const std::string& folder,
                                         const std::string& peer,
                                         SyncDirection direction,
                                         ConflictResolution policy,
                                         std::string& error) {
  std::string peer_name;
  if(auto info = peer_manager_->peer(peer)) {
    peer_name = info->display_name;
  }
  return storage_->create_config(folder, peer, peer_name, session_id_, direction, policy, error);
}

std::vector<SyncConfig> Node::sync_configs() const {
  return storage_->configs();
}

bool Node::run_sync(const std::string& config_id, std::string& error) {
  return coordinator_->start_sync(config_id, error);
}

bool Node::remove_sync(const std::string& config_id, std::string& error) {
  coordinator_->cancel_sync(config_id);
  return storage_->remove_config(config_id, error);
}

bool Node::set_sync_active(const std::string& config_id, bool active, std::string& error) {
  auto config = storage_->config(config_id);
  if(!config) {
    error = "Unknown sync config: " + config_id;
    return false;
  }
  config->is_active = active;
  if(!active) coordinator_->cancel_sync(config_id);
  return storage_->update_config(*config, error);
}

std::optional<SyncState> Node::sync_state(const std::string& config_id) const {
  return coordinator_->state(config_id);
}

std::vector<SyncHistoryEntry> Node::sync_history(const std::string& config_id) const {
  return storage_->history(config_id);
}

bool Node::resolve_conflicts(const std::string& config_id,
                             const std::vector<ResolutionChoice>& resolutions,
                             std::string& error) {
  return coordinator_->resolve_conflicts(config_id, resolutions, error);
}
