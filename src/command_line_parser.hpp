#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto a SettingsManager: --key value, -alias value, bare boolean
// flags and positional arguments bound to keys by index.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name,
                    std::string summary,
                    nlohmann::json settings_spec,
                    nlohmann::json argv_spec);

  // False with error set on an unknown option, a missing value or a value of
  // the wrong type. Settings parsed before the failure keep their new value.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::string summary_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};

// Positional arguments of the node: wingsync [session_id] [signaling_url]
inline const nlohmann::json NODE_ARGV_SPECIFICATION = nlohmann::json::array({
  {{"index",0},{"key","session_id"}},
  {{"index",1},{"key","signaling_url"}}
});

// Positional arguments of the relay: wingsync-relay [listen_port]
inline const nlohmann::json RELAY_ARGV_SPECIFICATION = nlohmann::json::array({
  {{"index",0},{"key","listen_port"}}
});
