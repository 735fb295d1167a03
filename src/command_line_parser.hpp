#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "settings_manager.hpp"

// Maps `--key value`, `-alias value` and positional arguments onto a
// SettingsManager built from the same specification table. Bool options
// take an optional true/false literal.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name,
                    std::string summary,
                    nlohmann::json settings_spec,
                    nlohmann::json argv_spec);

  // Throws std::invalid_argument on unknown options or rejected values.
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
  std::string summary_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
