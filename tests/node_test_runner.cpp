#include "command_line_parser.hpp"
#include "endpoint.hpp"
#include "log.hpp"
#include "node.hpp"
#include "relay_server.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wingsync::test;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

const char* kRunnerSession = "runner-sess-01";

void configure(const std::shared_ptr<SettingsManager>& settings,
               const std::string& key,
               const nlohmann::json& value) {
  std::string error;
  if(!settings->set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

// A relay on loopback plus two nodes that join the same session through it.
struct NodePair {
  NodePair(TestContext& ctx, const std::string& name)
    : root_a("runner_" + name + "_alpha"),
      root_b("runner_" + name + "_beta") {
    ::unsetenv(kSignalingUrlEnv);
    RuntimeContext::instance().reset_for_tests();

    auto relay_logger = std::make_shared<Logger>("relay");
    ctx.logs.attach(relay_logger);
    RelayServer::Options options;
    options.listen_ip = "127.0.0.1";
    options.listen_port = 0;
    relay = std::make_shared<RelayServer>(relay_io.io(), options, relay_logger);
    std::string error;
    if(!relay_io.call([&]{ return relay->start(error); })) {
      throw std::runtime_error("relay did not start: " + error);
    }

    a = make_node(ctx, root_a.path(), "runner-alpha", true);
    b = make_node(ctx, root_b.path(), "runner-beta", false);
  }

  ~NodePair() {
    if(a) a->stop();
    if(b) b->stop();
    relay_io.call([&]{ relay->stop(); return true; });
  }

  std::unique_ptr<Node> make_node(TestContext& ctx, const fs::path& root, const std::string& peer_id, bool create) {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(root / ".config" / "settings.json");
    configure(settings, "signaling_url", "sig://127.0.0.1:" + std::to_string(relay->port()));
    configure(settings, "session_id", kRunnerSession);
    configure(settings, "create_session", create);
    configure(settings, "peer_id", peer_id);
    configure(settings, "display_name", peer_id);
    configure(settings, "listen_ip", "127.0.0.1");
    configure(settings, "chunk_size", 4096);

    Node::Options options;
    options.workspace_root = root;
    options.start_cli_thread = false;
    options.sync_response_timeout = 5000ms;
    auto node = std::make_unique<Node>(settings, options);
    ctx.logs.attach(*node, peer_id);
    return node;
  }

  bool start() {
    a->start();
    a->start_background();
    if(!wait_for_condition([&]{ return a->signaling_state() == SignalingClient::State::Joined; }, 5s)) return false;
    b->start();
    b->start_background();
    if(!wait_for_condition([&]{ return b->signaling_state() == SignalingClient::State::Joined; }, 5s)) return false;
    return wait_for_condition([&]{ return knows(*a, "runner-beta") && knows(*b, "runner-alpha"); }, 5s);
  }

  bool connect() {
    std::string error;
    if(!a->connect_peer("runner-beta", error)) {
      std::cerr << "    connect failed: " << error << "\n";
      return false;
    }
    return wait_for_condition([&]{
      return a->stats().connected_peers >= 1 && b->stats().connected_peers >= 1;
    }, 5s);
  }

  static bool knows(const Node& node, const std::string& peer_id) {
    auto peers = node.peers();
    return std::any_of(peers.begin(), peers.end(), [&](const PeerInfo& p){ return p.peer_id == peer_id; });
  }

  TempDir root_a;
  TempDir root_b;
  IoThread relay_io;
  std::shared_ptr<RelayServer> relay;
  std::unique_ptr<Node> a;
  std::unique_ptr<Node> b;
};

bool test_session_and_direct_transfer(TestContext& ctx) {
  NodePair pair(ctx, "transfer");
  WINGSYNC_CHECK(pair.start());
  WINGSYNC_CHECK(pair.a->warmup_status() == WarmupStatus::Ready);
  WINGSYNC_CHECK(pair.a->session_id() == kRunnerSession);
  WINGSYNC_CHECK(pair.relay_io.call([&]{ return pair.relay->session_peers(kRunnerSession).size(); }) == 2);

  std::string error;
  WINGSYNC_CHECK(!pair.a->send_file("runner-beta", pair.root_a / "nothing.txt", error));
  WINGSYNC_CHECK(error == "Peer runner-beta is not connected");

  WINGSYNC_CHECK(pair.connect());

  std::string payload;
  for(int i = 0; i < 20000; ++i) payload += static_cast<char>('A' + i % 23);
  write_file(pair.root_a / "outbox" / "hello.txt", payload);
  auto file_id = pair.a->send_file("runner-beta", pair.root_a / "outbox" / "hello.txt", error);
  WINGSYNC_CHECK(file_id.has_value());
  WINGSYNC_CHECK(ctx.logs.wait_for_substring("Received hello.txt from runner-alpha", 5s));
  WINGSYNC_CHECK(read_file(pair.b->received_dir() / "hello.txt") == std::optional<std::string>(payload));
  WINGSYNC_CHECK(ctx.logs.wait_for_substring("Sent hello.txt to runner-beta", 5s));

  auto transfers = pair.a->transfers();
  WINGSYNC_CHECK(std::any_of(transfers.begin(), transfers.end(), [&](const TransferProgress& t){
    return t.file_id == *file_id && t.state == TransferState::Completed && t.bytes_transferred == payload.size();
  }));

  // A second copy under the same name lands beside the first.
  WINGSYNC_CHECK(pair.a->send_file("runner-beta", pair.root_a / "outbox" / "hello.txt", error));
  WINGSYNC_CHECK(wait_for_condition([&]{ return fs::exists(pair.b->received_dir() / "hello (1).txt"); }, 5s));

  pair.a->disconnect_peer("runner-beta");
  WINGSYNC_CHECK(wait_for_condition([&]{ return pair.a->stats().connected_peers == 0; }, 5s));
  return true;
}

bool test_folder_sync_between_nodes(TestContext& ctx) {
  NodePair pair(ctx, "sync");
  WINGSYNC_CHECK(pair.start());
  WINGSYNC_CHECK(pair.connect());

  const fs::path folder_a = pair.root_a / "Projects";
  const fs::path folder_b = pair.root_b / "Projects";
  write_file(folder_a / "plan.md", "# plan\n");
  write_file(folder_a / "src" / "main.c", "int main(void) { return 0; }\n");
  write_file(folder_b / "notes.txt", "from beta\n");

  pair.a->execute_command("sync add runner-beta " + folder_a.string());
  auto configs_a = pair.a->sync_configs();
  WINGSYNC_CHECK(configs_a.size() == 1);
  WINGSYNC_CHECK(configs_a[0].peer_name == "runner-beta");
  WINGSYNC_CHECK(configs_a[0].session_id == kRunnerSession);

  std::string error;
  auto config_b = pair.b->add_sync(folder_b.string(), "runner-alpha", SyncDirection::Bidirectional,
                                   ConflictResolution::LastWriteWins, error);
  WINGSYNC_CHECK(config_b.has_value());

  const std::string id = configs_a[0].id;
  WINGSYNC_CHECK(pair.a->run_sync(id, error));
  WINGSYNC_CHECK(wait_for_condition([&]{ return pair.a->sync_history(id).size() == 1; }, 10s));
  WINGSYNC_CHECK(wait_for_condition([&]{ return pair.b->sync_history(config_b->id).size() == 1; }, 10s));

  auto entry = pair.a->sync_history(id).back();
  WINGSYNC_CHECK(entry.status == SyncOutcome::Success);
  WINGSYNC_CHECK(entry.files_added == 3);
  WINGSYNC_CHECK(read_file(folder_b / "src" / "main.c") == std::optional<std::string>("int main(void) { return 0; }\n"));
  WINGSYNC_CHECK(read_file(folder_a / "notes.txt") == std::optional<std::string>("from beta\n"));
  WINGSYNC_CHECK(pair.a->sync_state(id)->status == SyncStatus::Synced);
  WINGSYNC_CHECK(!fs::exists(pair.b->received_dir() / "plan.md"));

  pair.a->execute_command("sync pause " + id);
  WINGSYNC_CHECK(!pair.a->sync_configs()[0].is_active);
  WINGSYNC_CHECK(!pair.a->run_sync(id, error));
  WINGSYNC_CHECK(error.find("is paused") != std::string::npos);
  pair.a->execute_command("sync resume " + id);
  WINGSYNC_CHECK(pair.a->sync_configs()[0].is_active);

  pair.a->disconnect_peer("runner-beta");
  WINGSYNC_CHECK(wait_for_condition([&]{ return pair.a->stats().connected_peers == 0; }, 5s));
  WINGSYNC_CHECK(!pair.a->run_sync(id, error));
  WINGSYNC_CHECK(error == "Peer runner-beta is offline");
  WINGSYNC_CHECK(pair.a->sync_state(id)->status == SyncStatus::Offline);

  pair.a->execute_command("sync rm " + id);
  WINGSYNC_CHECK(pair.a->sync_configs().empty());
  return true;
}

bool test_invalid_settings_rejected(TestContext& ctx) {
  TempDir root("runner_invalid");
  RuntimeContext::instance().reset_for_tests();
  auto settings = std::make_shared<SettingsManager>();
  configure(settings, "signaling_url", "sig://127.0.0.1:1");
  configure(settings, "session_id", "no spaces allowed");
  configure(settings, "listen_ip", "127.0.0.1");
  Node::Options options;
  options.workspace_root = root.path();
  Node node(settings, options);
  ctx.logs.attach(node, "invalid");
  try {
    node.start();
  } catch(const std::runtime_error& e) {
    WINGSYNC_CHECK(std::string(e.what()).find("Invalid session_id") == 0);
    WINGSYNC_CHECK(fs::exists(root.path() / ".config" / "identity.json"));
    return true;
  }
  return false;
}

bool test_settings_and_command_line(TestContext&) {
  TempDir root("runner_settings");
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(root / "settings.json");
  CommandLineParser parser("wingsync", "peer-to-peer folder sync", NODE_SETTINGS_SPECIFICATION, NODE_ARGV_SPECIFICATION);

  std::vector<std::string> args = {"wingsync", "team-sync-01", "--relay", "sig://relay.lan:9000",
                                   "-name", "laptop", "-v", "--chunk_size", "65536", "--create"};
  std::vector<char*> argv;
  for(auto& arg : args) argv.push_back(arg.data());
  std::string error;
  WINGSYNC_CHECK(parser.parse(static_cast<int>(argv.size()), argv.data(), *settings, error));
  WINGSYNC_CHECK(settings->get<std::string>("session_id") == "team-sync-01");
  WINGSYNC_CHECK(settings->get<std::string>("signaling_url") == "sig://relay.lan:9000");
  WINGSYNC_CHECK(settings->get<std::string>("display_name") == "laptop");
  WINGSYNC_CHECK(settings->get<bool>("verbose"));
  WINGSYNC_CHECK(settings->get<bool>("create_session"));
  WINGSYNC_CHECK(settings->get<int>("chunk_size") == 65536);

  std::vector<std::string> bad = {"wingsync", "--chunk_size", "lots"};
  std::vector<char*> bad_argv;
  for(auto& arg : bad) bad_argv.push_back(arg.data());
  WINGSYNC_CHECK(!parser.parse(static_cast<int>(bad_argv.size()), bad_argv.data(), *settings, error));
  WINGSYNC_CHECK(error.find("Invalid value for option 'chunk_size'") == 0);
  std::vector<std::string> unknown = {"wingsync", "--colour", "blue"};
  std::vector<char*> unknown_argv;
  for(auto& arg : unknown) unknown_argv.push_back(arg.data());
  WINGSYNC_CHECK(!parser.parse(static_cast<int>(unknown_argv.size()), unknown_argv.data(), *settings, error));
  WINGSYNC_CHECK(error == "Unknown option --colour");

  // Only persistent settings reach the file.
  WINGSYNC_CHECK(settings->save());
  auto reloaded = std::make_shared<SettingsManager>();
  reloaded->set_settings_path(root / "settings.json");
  WINGSYNC_CHECK(reloaded->load());
  WINGSYNC_CHECK(reloaded->get<std::string>("session_id") == "team-sync-01");
  WINGSYNC_CHECK(reloaded->get<int>("chunk_size") == 65536);
  WINGSYNC_CHECK(!reloaded->get<bool>("create_session"));
  WINGSYNC_CHECK(!reloaded->set_from_string("heartbeat", "soon", error));
  WINGSYNC_CHECK(reloaded->set_from_string("hb", "2500", error));
  WINGSYNC_CHECK(reloaded->get<int>("heartbeat_interval_ms") == 2500);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"session_and_direct_transfer", test_session_and_direct_transfer},
    {"folder_sync_between_nodes", test_folder_sync_between_nodes},
    {"settings_and_command_line", test_settings_and_command_line},
    {"invalid_settings_rejected", test_invalid_settings_rejected},
  };
  return run_test_suite("node", tests, argc, argv);
}
