#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <memory>
#include <unistd.h>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "node.hpp"
#include "settings_manager.hpp"

std::string get_default_display_name() {
  char hostname[256];
  if(gethostname(hostname, sizeof(hostname)) != 0) {
    std::strcpy(hostname, "UnknownHost");
  }
  hostname[sizeof(hostname) - 1] = '\0';
  return hostname;
}

int main(int argc, char** argv){
  try {
    Node::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = true;

    auto settings = std::make_shared<SettingsManager>(NODE_SETTINGS_SPECIFICATION);
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "wingsync",
                             "peer-to-peer folder sync",
                             NODE_SETTINGS_SPECIFICATION,
                             NODE_ARGV_SPECIFICATION);
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      print_err(nullptr, "{}", error);
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    if(settings->get<std::string>("display_name").empty()) {
      std::string name_error;
      if(!settings->set_from_string("display_name", get_default_display_name(), name_error)) {
        print_err(nullptr, "Unable to default display_name: {}", name_error);
      }
    }

    Node node(settings, options);
    auto logger = node.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    node.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    asio::signal_set signals(node.io_context(), SIGINT, SIGTERM);
    signals.async_wait([&node, logger](const std::error_code& ec, int){
      if(ec) return;
      logger->info("Shutting down...");
      node.request_shutdown();
    });

    node.run();
    node.stop();

    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("wingsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
