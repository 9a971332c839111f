#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys. Options are --key [value] or -alias
// [value]; bool options take an optional literal. Bare tokens fill the
// positional slots in argv_spec order.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "bulkfetch",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","manifest"}},
                      {{"index",1},{"key","out_dir"}}
                    }));

  // Throws ConfigError on unknown options, missing or invalid values.
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

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
