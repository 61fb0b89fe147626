#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0 && candidate.size() > 2) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?')) {
    return true;
  }
  return false;
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    std::string key_token;
    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      key_token = token.substr(2);
    } else if(is_option_token(token)) {
      key_token = token.substr(1);
    } else {
      throw UsageError("Unexpected argument '" + token + "'");
    }

    // --key=value
    std::string inline_value;
    bool has_inline_value = false;
    auto eq = key_token.find('=');
    if(eq != std::string::npos) {
      inline_value = key_token.substr(eq + 1);
      key_token = key_token.substr(0, eq);
      has_inline_value = true;
    }

    auto resolved = settings.resolve_key(key_token);
    if(!resolved) {
      throw UsageError("Unknown option '" + token + "'");
    }

    std::string value;
    if(has_inline_value) {
      value = inline_value;
    } else if(settings.is_bool_setting(*resolved)) {
      if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else {
      if(i + 1 >= args.size()) {
        throw UsageError("Missing value for option '" + token + "'");
      }
      value = args[++i];
    }

    std::string error;
    if(!settings.set_from_string(*resolved, value, error)) {
      throw UsageError("Invalid value for option '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage() const {
  print_err(nullptr, "{} - exchange a file, a directory or text over the LAN", process_name_);
  print_err(nullptr, "Usage:");
  print_err(nullptr, "  {} (-f FILE | -d DIR | -t TEXT|- | -p) [options]", process_name_);
  print_err(nullptr, "");
  print_err(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    std::string flag = key;
    std::replace(flag.begin(), flag.end(), '_', '-');
    print_err(nullptr, "  --{:<18} {:<9} {}{} (default: {})",
              flag,
              argument_hint,
              description,
              aliases.str(),
              default_str.empty() ? "none" : default_str);
  }
  print_err(nullptr, "");
  print_err(nullptr, "URLs are served under / unless --path or --random-path is given.");
}
