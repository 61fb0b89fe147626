#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Thrown for unknown options, missing values and unparsable values.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "laport",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
};
