#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "relay_server.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto workspace = std::filesystem::current_path();
    SettingsManager settings(RELAY_SETTINGS_SPECIFICATION);
    settings.set_settings_path(workspace / ".config" / "relay.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "wingsync-relay",
                             "session relay for wingsync peers",
                             RELAY_SETTINGS_SPECIFICATION,
                             RELAY_ARGV_SPECIFICATION);
    std::string error;
    if(!parser.parse(argc, argv, settings, error)) {
      print_err(nullptr, "{}", error);
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init_logging(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("relay");

    if(settings.save_requested() && !settings.save()) {
      logger->error("Unable to persist settings to {}", settings.settings_path().string());
    }

    int port_value = settings.get<int>("listen_port");
    if(port_value < 0 || port_value > 65535) {
      logger->error("Invalid listen_port '{}'", port_value);
      return 1;
    }
    int timeout_value = settings.get<int>("session_timeout_s");
    if(timeout_value <= 0) {
      logger->error("Invalid session_timeout_s '{}'", timeout_value);
      return 1;
    }

    RelayServer::Options options;
    options.listen_ip = settings.get<std::string>("listen_ip");
    options.listen_port = static_cast<unsigned short>(port_value);
    options.session_timeout = std::chrono::seconds(timeout_value);

    asio::io_context io;
    auto relay = std::make_shared<RelayServer>(io, options, logger);
    if(!relay->start(error)) {
      logger->error("{}", error);
      return 1;
    }

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int){
      if(ec) return;
      logger->info("Shutting down relay...");
      relay->stop();
      io.stop();
    });

    io.run();
    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("relay-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
