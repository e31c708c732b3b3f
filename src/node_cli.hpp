#pragma once
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <readline/readline.h>
#include <readline/history.h>

#include "node.hpp"
#include "settings_manager.hpp"
#include "sync_types.hpp"
#include "utils.hpp"

// Interactive console for a Node. Commands run on the console thread and
// call into the node's thread-safe surface.
class NodeCli {
public:
  NodeCli(Node& node, std::shared_ptr<SettingsManager> settings)
    : node_(node), settings_(std::move(settings)), running_(true) {}

  ~NodeCli() {
    stop();
  }

  void start() {
    loop_finished_ = false;
    cli_thread_ = std::thread([this](){
      run_loop();
      loop_finished_ = true;
    });
  }

  // readline cannot be interrupted; a thread still blocked in it is left to
  // die with the process.
  void stop() {
    running_ = false;
    if(!cli_thread_.joinable()) return;
    if(loop_finished_ && std::this_thread::get_id() != cli_thread_.get_id()) {
      cli_thread_.join();
    } else {
      cli_thread_.detach();
    }
  }

  // Returns false once the command asked the node to quit.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return true;

    std::string args;
    std::getline(iss, args);
    trim(args);

    if(cmd == "peers" || cmd == "p") {
      list_peers();
    } else if(cmd == "connect") {
      connect_command(args);
    } else if(cmd == "disconnect") {
      if(args.empty()) {
        std::cout << "Usage: disconnect <peer>\n";
      } else {
        node_.disconnect_peer(args);
        std::cout << "Disconnecting " << args << "\n";
      }
    } else if(cmd == "send") {
      send_command(args);
    } else if(cmd == "transfers" || cmd == "t") {
      list_transfers();
    } else if(cmd == "cancel") {
      if(args.empty()) {
        std::cout << "Usage: cancel <transfer-id>\n";
      } else if(node_.cancel_transfer(args)) {
        std::cout << "Cancelled " << args << "\n";
      } else {
        std::cout << "No active transfer " << args << "\n";
      }
    } else if(cmd == "sync") {
      handle_sync_command(args);
    } else if(cmd == "conflicts") {
      list_conflicts(args);
    } else if(cmd == "resolve") {
      resolve_command(args);
    } else if(cmd == "status") {
      print_status();
    } else if(cmd == "settings" || cmd == "s") {
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "get") {
      handle_settings_command(args.empty() ? "get" : "get " + args);
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      std::cout << "Quitting...\n";
      running_ = false;
      node_.request_shutdown();
      return false;
    } else {
      print_help();
      std::cout << "Unknown command: " << cmd << "\n";
    }
    return true;
  }

private:
  void run_loop() {
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) {
        node_.request_shutdown();
        break;
      }
      if(input->empty()) continue;
      if(!execute_command(*input)) break;
    }
  }

  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
  }

  void list_peers() {
    auto peers = node_.peers();
    if(peers.empty()) {
      std::cout << "No peers in session " << node_.session_id() << "\n";
      return;
    }
    std::sort(peers.begin(), peers.end(), [](const PeerInfo& a, const PeerInfo& b){
      return a.peer_id < b.peer_id;
    });
    for(const auto& peer : peers) {
      std::cout << "  " << std::left << std::setw(20) << peer.peer_id
                << std::setw(12) << to_string(peer.state)
                << peer.display_name;
      if(!peer.device_type.empty()) std::cout << " (" << peer.device_type << ")";
      std::cout << "\n";
    }
  }

  void connect_command(const std::string& peer) {
    if(peer.empty()) {
      std::cout << "Usage: connect <peer>\n";
      return;
    }
    std::string error;
    if(node_.connect_peer(peer, error)) {
      std::cout << "Connecting to " << peer << "\n";
    } else {
      std::cout << "Connect failed: " << error << "\n";
    }
  }

  void send_command(const std::string& args) {
    std::istringstream iss(args);
    std::string peer;
    iss >> peer;
    std::string path;
    std::getline(iss, path);
    trim(path);
    if(peer.empty() || path.empty()) {
      std::cout << "Usage: send <peer> <path>\n";
      return;
    }
    std::string error;
    auto id = node_.send_file(peer, path, error);
    if(id) {
      std::cout << "Sending " << path << " to " << peer << " as " << *id << "\n";
    } else {
      std::cout << "Send failed: " << error << "\n";
    }
  }

  void list_transfers() {
    auto transfers = node_.transfers();
    if(transfers.empty()) {
      std::cout << "No transfers\n";
      return;
    }
    for(const auto& t : transfers) {
      std::cout << "  " << t.file_id << "  " << t.file_name << "  "
                << format_size(t.bytes_transferred) << "/" << format_size(t.total_bytes)
                << "  " << std::fixed << std::setprecision(1) << t.percentage << "%  "
                << to_string(t.state);
      if(t.state == TransferState::Active && t.speed > 0.0) {
        std::cout << "  " << format_size(static_cast<uint64_t>(t.speed)) << "/s";
      }
      if(!t.error.empty()) std::cout << "  " << t.error;
      std::cout << "\n";
    }
  }

  void handle_sync_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;
    if(action.empty() || action == "list") {
      list_syncs();
      return;
    }

    if(action == "add") {
      std::string peer;
      std::string folder;
      iss >> peer >> folder;
      if(peer.empty() || folder.empty()) {
        std::cout << "Usage: sync add <peer> <folder> [direction] [policy]\n";
        return;
      }
      std::string direction_text = "bidirectional";
      std::string policy_text = "last-write-wins";
      iss >> direction_text >> policy_text;
      auto direction = parse_sync_direction(direction_text);
      if(!direction) {
        std::cout << "Unknown direction '" << direction_text << "' (bidirectional, upload-only, download-only)\n";
        return;
      }
      auto policy = parse_conflict_resolution(policy_text);
      if(!policy) {
        std::cout << "Unknown policy '" << policy_text << "' (last-write-wins, manual, local-wins, remote-wins)\n";
        return;
      }
      std::string error;
      auto config = node_.add_sync(folder, peer, *direction, *policy, error);
      if(config) {
        std::cout << "Added sync " << config->id << " for " << config->local_folder << "\n";
      } else {
        std::cout << "Add failed: " << error << "\n";
      }
      return;
    }

    std::string id;
    iss >> id;
    if(action == "history") {
      print_history(id);
      return;
    }
    if(id.empty()) {
      std::cout << "Usage: sync " << action << " <id>\n";
      return;
    }

    std::string error;
    if(action == "run") {
      if(node_.run_sync(id, error)) {
        std::cout << "Sync " << id << " started\n";
      } else {
        std::cout << "Sync failed: " << error << "\n";
      }
    } else if(action == "remove" || action == "rm") {
      if(node_.remove_sync(id, error)) {
        std::cout << "Removed sync " << id << "\n";
      } else {
        std::cout << "Remove failed: " << error << "\n";
      }
    } else if(action == "pause" || action == "resume") {
      if(node_.set_sync_active(id, action == "resume", error)) {
        std::cout << "Sync " << id << (action == "resume" ? " resumed" : " paused") << "\n";
      } else {
        std::cout << "Update failed: " << error << "\n";
      }
    } else {
      std::cout << "Unknown sync command.\n";
    }
  }

  void list_syncs() {
    auto configs = node_.sync_configs();
    if(configs.empty()) {
      std::cout << "No sync configs\n";
      return;
    }
    for(const auto& config : configs) {
      auto state = node_.sync_state(config.id);
      std::cout << "  " << config.id << "  " << config.local_folder
                << "  <-> " << (config.peer_name.empty() ? config.peer_id : config.peer_name)
                << "  " << to_string(config.direction)
                << "  " << to_string(config.conflict_resolution)
                << "  " << (state ? to_string(state->status) : "out-of-sync");
      if(!config.is_active) std::cout << "  (paused)";
      if(state && state->error) std::cout << "  " << *state->error;
      std::cout << "\n";
    }
  }

  void print_history(const std::string& config_id) {
    auto entries = node_.sync_history(config_id);
    if(entries.empty()) {
      std::cout << "No sync history\n";
      return;
    }
    for(const auto& entry : entries) {
      std::cout << "  " << entry.config_id << "  " << to_string(entry.status)
                << "  +" << entry.files_added << " ~" << entry.files_modified
                << " -" << entry.files_deleted << "  " << format_size(entry.bytes_transferred)
                << "  " << entry.duration << "ms";
      if(entry.error) std::cout << "  " << *entry.error;
      std::cout << "\n";
    }
  }

  void list_conflicts(const std::string& config_id) {
    if(config_id.empty()) {
      std::cout << "Usage: conflicts <id>\n";
      return;
    }
    auto state = node_.sync_state(config_id);
    if(!state || state->pending_changes.conflicts.empty()) {
      std::cout << "No pending conflicts for " << config_id << "\n";
      return;
    }
    for(const auto& conflict : state->pending_changes.conflicts) {
      std::cout << "  " << conflict.path
                << "  local " << format_size(conflict.local.size) << " @" << conflict.local.last_modified
                << "  remote " << format_size(conflict.remote.size) << " @" << conflict.remote.last_modified
                << "\n";
    }
  }

  void resolve_command(const std::string& args) {
    std::istringstream iss(args);
    std::string id;
    std::string path;
    std::string action_text;
    iss >> id >> path >> action_text;
    if(id.empty() || path.empty() || action_text.empty()) {
      std::cout << "Usage: resolve <id> <path|all> <local|remote|both>\n";
      return;
    }
    auto action = parse_resolution_action(action_text);
    if(!action || *action == ResolutionAction::Manual) {
      std::cout << "Unknown action '" << action_text << "' (local, remote, both)\n";
      return;
    }
    std::vector<ResolutionChoice> choices;
    if(path == "all") {
      auto state = node_.sync_state(id);
      if(state) {
        for(const auto& conflict : state->pending_changes.conflicts) {
          choices.push_back(ResolutionChoice{conflict.path, *action});
        }
      }
    } else {
      choices.push_back(ResolutionChoice{path, *action});
    }
    std::string error;
    if(node_.resolve_conflicts(id, choices, error)) {
      std::cout << "Resolving " << choices.size() << " conflict(s) for " << id << "\n";
    } else {
      std::cout << "Resolve failed: " << error << "\n";
    }
  }

  void print_status() {
    auto stats = node_.stats();
    std::cout << "peer       " << node_.peer_id() << " (" << node_.display_name() << ")\n";
    std::cout << "session    " << node_.session_id() << "\n";
    std::cout << "relay      " << node_.signaling_url() << "  "
              << to_string(node_.warmup_status()) << ", " << to_string(node_.signaling_state()) << "\n";
    std::cout << "peers      " << stats.connected_peers << " connected, " << stats.known_peers << " known\n";
    std::cout << "transfers  " << stats.active_transfers << " active\n";
    std::cout << "sync       " << stats.sync_configs << " configs, " << stats.syncing << " running\n";
    std::cout << "workspace  " << node_.workspace_root().string() << "\n";
  }

  void handle_settings_command(const std::string& args) {
    if(!settings_) {
      std::cout << "Settings manager unavailable.\n";
      return;
    }

    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action.empty() || action == "list") {
      list_settings();
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      if(key.empty()) {
        std::cout << "Usage: settings get <key>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      trim(value);
      if(key.empty() || value.empty()) {
        std::cout << "Usage: settings set <key> <value>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::string error;
      if(settings_->set_from_string(*resolved, value, error)) {
        std::cout << *resolved << " = " << settings_->value_as_string(*resolved)
                  << " (takes effect on restart)\n";
      } else {
        std::cout << "Failed to set " << *resolved << ": " << error << "\n";
      }
      return;
    }

    if(action == "save") {
      if(settings_->save()) {
        std::cout << "Saved settings to " << settings_->settings_path() << "\n";
      } else {
        std::cout << "Failed to save settings.\n";
      }
      return;
    }

    if(action == "load") {
      if(settings_->load()) {
        std::cout << "Loaded settings from " << settings_->settings_path() << "\n";
      } else {
        std::cout << "Settings file not found; defaults restored.\n";
      }
      return;
    }

    std::cout << "Unknown settings command.\n";
  }

  void list_settings() {
    auto keys = settings_->keys();
    std::sort(keys.begin(), keys.end());
    for(const auto& key : keys) {
      std::cout << key << " = " << settings_->value_as_string(key) << "\n";
    }
  }

  void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "  help|h|?                          Show this help message\n";
    std::cout << "  quit                              Leave the session and exit\n";
    std::cout << "  status                            Show relay, peer and sync status\n";
    std::cout << "  peers|p                           List peers in the session\n";
    std::cout << "  connect <peer>                    Open a direct link to a peer\n";
    std::cout << "  disconnect <peer>                 Close the link to a peer\n";
    std::cout << "  send <peer> <path>                Send a file to a connected peer\n";
    std::cout << "  transfers|t                       List file transfers\n";
    std::cout << "  cancel <transfer-id>              Cancel a transfer\n";
    std::cout << "  sync [list]                       List sync configs\n";
    std::cout << "  sync add <peer> <folder> [dir] [policy]  Pair a folder with a peer\n";
    std::cout << "  sync run|pause|resume|remove <id> Control a sync config\n";
    std::cout << "  sync history [id]                 Show past sync cycles\n";
    std::cout << "  conflicts <id>                    List unresolved conflicts\n";
    std::cout << "  resolve <id> <path|all> <action>  Resolve with local, remote or both\n";
    std::cout << "  settings [list|get|set|save|load] Manage runtime settings\n";
    std::cout << "  set [key value]                   Shortcut for settings set (lists when empty)\n";
    std::cout << "  get <key>                         Shortcut for settings get\n";
  }

  static std::string format_size(uint64_t bytes) {
    const char* units[] = {"b", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
      value /= 1024.0;
      ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) {
      oss << bytes << units[0];
    } else {
      oss << std::fixed << std::setprecision(1) << value << units[unit];
    }
    return oss.str();
  }

  static void trim(std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if(begin == std::string::npos) {
      s.clear();
      return;
    }
    auto end = s.find_last_not_of(" \t\r\n");
    s = s.substr(begin, end - begin + 1);
  }

  Node& node_;
  std::shared_ptr<SettingsManager> settings_;
  std::atomic<bool> running_;
  std::atomic<bool> loop_finished_{true};
  std::thread cli_thread_;
};
