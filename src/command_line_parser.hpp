#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys: `--key value`, `-alias value`, or
// positional arguments in the order given by the argv specification.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "qrdrop",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","listen_port"}},
                      {{"index",1},{"key","listen_ip"}},
                      {{"index",2},{"key","storage_dir"}}
                    }));

  // Returns false and fills `error` on the first bad token.
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
