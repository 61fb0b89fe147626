#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","send_file"},        {"aliases", {"f"}},             {"type","string"}, {"default",""},        {"description","Send (share) a file"}},
  {{"key","recv_file"},        {"aliases", {"d"}},             {"type","string"}, {"default",""},        {"description","Receive uploaded files into the directory"}},
  {{"key","send_text"},        {"aliases", {"t"}},             {"type","string"}, {"default",""},        {"description","Send text from the command line or stdin (-)"}},
  {{"key","recv_text"},        {"aliases", {"p"}},             {"type","bool"},   {"default",false},     {"description","Receive one text and write it to stdout"}},
  {{"key","addr"},             {"aliases", {"listen_ip"}},     {"type","string"}, {"default","0.0.0.0"}, {"description","Address to bind"}},
  {{"key","port"},             {"aliases", {"listen_port"}},   {"type","int"},    {"default",0},         {"description","TCP port to listen on (0 = pick a free port)"}},
  {{"key","path"},                                             {"type","string"}, {"default","/"},       {"description","Service path every URL is served under; see --random-path"}},
  {{"key","random_path"},      {"aliases", {"rp"}},            {"type","bool"},   {"default",false},     {"description","Serve under a random 4-character path instead of --path"}},
  {{"key","once"},                                             {"type","bool"},   {"default",false},     {"description","Stop after the first completed transfer"}},
  {{"key","workers"},          {"aliases", {"w"}},             {"type","int"},    {"default",4},         {"description","Number of I/O threads"}},
  {{"key","max_upload_bytes"}, {"aliases", {"mub"}},           {"type","size"},   {"default",0},         {"description","Largest accepted upload body (0 = unlimited)"}},
  {{"key","max_text_bytes"},   {"aliases", {"mtb"}},           {"type","size"},   {"default",1048576},   {"description","Largest accepted text submission"}},
  {{"key","config"},           {"aliases", {"c"}},             {"type","string"}, {"default",""},        {"description","JSON settings file applied before the command line"}},
  {{"key","verbose"},          {"aliases", {"v"}},             {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}},
  {{"key","help"},             {"aliases", {"h","?"}},         {"type","bool"},   {"default",false},     {"description","Show command help and exit"}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool load_from_file(const std::filesystem::path& path);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  // True once a value was given on the command line or in a settings file,
  // even when it equals the default ("-t ''").
  bool is_set(const std::string& key) const { return explicitly_set_.count(key) != 0; }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  // "send-file" and "send_file" name the same setting.
  static std::string normalize_token(const std::string& token);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  bool store_value(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::set<std::string> explicitly_set_;
};

// ---- implementation -------------------------------------------------------

inline std::string SettingsManager::normalize_token(const std::string& token) {
  std::string out = to_lower(token);
  std::replace(out.begin(), out.end(), '-', '_');
  return out;
}

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = normalize_token(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = normalize_token(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string normalized = normalize_token(token);
  for(const auto& spec : setting_specs_) {
    if(normalized == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), normalized) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) {
    print_err(nullptr, "Unable to read settings file {}", path.string());
    return false;
  }
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      print_err(nullptr, "Ignoring unknown setting '{}'", item.key());
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(!store_value(spec, value, error)) return false;
  explicitly_set_.insert(spec.key);
  return true;
}

inline bool SettingsManager::store_value(const SettingSpec& spec,
                                         const nlohmann::json& value,
                                         std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "size") {
    if(value.is_number_unsigned()) {
      settings_[spec.key] = value.get<std::uint64_t>();
      return true;
    }
    if(value.is_number_integer() && value.get<std::int64_t>() >= 0) {
      settings_[spec.key] = static_cast<std::uint64_t>(value.get<std::int64_t>());
      return true;
    }
    error = "expected a non-negative byte count";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  if(spec.type == "string") {
    // text payloads keep their whitespace
    return value;
  }
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "trailing characters";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "size") {
    if(clean.empty() || clean.front() == '-') {
      error = "expected a non-negative byte count";
      return {};
    }
    try {
      std::size_t consumed = 0;
      std::uint64_t parsed = std::stoull(clean, &consumed);
      if(consumed != clean.size()) {
        error = "trailing characters";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
