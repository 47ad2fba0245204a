#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings: `--key value`, `--key=value`, `-alias value`,
// bare boolean flags, and positional values in `argv_spec` order.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "parcel",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","command"}}
                    }));

  // Throws std::invalid_argument naming the offending token.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
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
