#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// Every option the tool understands. "names" are matched case-insensitively
// on the command line and in settings.json, the key itself always matches.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},             {"names", nlohmann::json::array()}, {"type","string"}, {"default",""},    {"description","Subcommand: track, read, write or locations"}, {"persistent", false}},
  {{"key","operands"},            {"names", nlohmann::json::array()}, {"type","list"},   {"default",nlohmann::json::array()}, {"description","Arguments of the subcommand"}, {"persistent", false}},
  {{"key","configs_location"},    {"names", {"configs","configs-location"}}, {"type","string"}, {"default",""}, {"description","Extension mapping file (.json)"}, {"persistent", true}},
  {{"key","log_location"},        {"names", {"log-location"}},   {"type","string"}, {"default",""},        {"description","Log file (.log)"}, {"persistent", true}},
  {{"key","undefined_extensions"},{"names", {"u","undefined-extensions"}}, {"type","string"}, {"default",""}, {"description","Directory for files whose extension has no mapping"}, {"persistent", true}},
  {{"key","recursive"},           {"names", {"r"}},              {"type","bool"},   {"default",false},     {"description","Also sort files in sub-directories of tracked paths"}, {"persistent", true}},
  {{"key","dated_subfolders"},    {"names", {"dated"}},          {"type","bool"},   {"default",false},     {"description","Move into <destination>/<year>/<month>"}, {"persistent", true}},
  {{"key","sweep_on_start"},      {"names", {"sweep"}},          {"type","bool"},   {"default",false},     {"description","Sort files already present when tracking starts"}, {"persistent", true}},
  {{"key","watch_backend"},       {"names", {"backend"}},        {"type","string"}, {"default","inotify"}, {"description","Change notification backend: inotify or poll"}, {"persistent", true}},
  {{"key","settle_ms"},           {"names", {"settle"}},         {"type","int"},    {"default",250},       {"description","Quiet time before a changed file is moved"}, {"persistent", true}},
  {{"key","shutdown_timeout_ms"}, {"names", {"shutdown_timeout"}}, {"type","int"},  {"default",5000},      {"description","Maximum wait for watchers to stop"}, {"persistent", true}},
  {{"key","autostart"},           {"names", nlohmann::json::array()}, {"type","bool"}, {"default",false},  {"description","Run the current track command at login"}, {"persistent", false}},
  {{"key","verbose"},             {"names", {"v"}},              {"type","bool"},   {"default",false},     {"description","Debug output on the console"}, {"persistent", true}},
  {{"key","debug"},               {"names", {"d"}},              {"type","bool"},   {"default",false},     {"description","Debug output in the log file"}, {"persistent", true}},
  {{"key","help"},                {"names", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","version"},             {"names", {"ver"}},            {"type","bool"},   {"default",false},     {"description","Show the version and exit"}, {"persistent", false}},
  {{"key","save"},                {"names", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

// true|false, on|off, yes|no, 1|0
inline std::optional<bool> parse_bool_literal(const std::string& text) {
  const auto lowered = to_lower(trim_copy(text));
  if(lowered == "true" || lowered == "on" || lowered == "yes" || lowered == "1") return true;
  if(lowered == "false" || lowered == "off" || lowered == "no" || lowered == "0") return false;
  return std::nullopt;
}

class SettingsManager {
public:
  SettingsManager();

  template<typename T>
  T get(const std::string& key) const;
  bool has(const std::string& key) const { return values_.contains(key); }

  // `name` is a key or one of its names. False with `error` set when the
  // name is unknown or the value does not fit the setting's type.
  bool set_from_string(const std::string& name, const std::string& text, std::string& error);
  bool set_from_json(const std::string& name, const nlohmann::json& value, std::string& error);

  std::optional<std::string> resolve_key(const std::string& name) const;
  bool is_bool_setting(const std::string& name) const;

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(std::filesystem::path path) { path_ = std::move(path); }

  bool help_requested() const { return flag("help"); }
  bool version_requested() const { return flag("version"); }
  bool save_requested() const { return flag("save"); }

private:
  enum class Type { Bool, Int, String, List };

  struct Setting {
    std::string key;
    std::vector<std::string> names;
    Type type = Type::String;
    nlohmann::json fallback;
    bool persistent = true;
  };

  static std::vector<Setting> read_specification(const nlohmann::json& table);
  const Setting* lookup(const std::string& name) const;
  bool store(const Setting& setting, const nlohmann::json& value, std::string& error);
  static std::optional<nlohmann::json> parse_text(const Setting& setting, const std::string& text,
                                                  std::string& error);
  bool flag(const std::string& key) const { return has(key) && values_.at(key).get<bool>(); }

  std::vector<Setting> settings_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_;
};

inline std::vector<SettingsManager::Setting> SettingsManager::read_specification(const nlohmann::json& table) {
  std::vector<Setting> settings;
  for(const auto& row : table) {
    Setting setting;
    setting.key = row.at("key").get<std::string>();
    setting.names.push_back(to_lower(setting.key));
    for(const auto& name : row.value("names", nlohmann::json::array())) {
      setting.names.push_back(to_lower(name.get<std::string>()));
    }
    const auto type = row.at("type").get<std::string>();
    if(type == "bool") setting.type = Type::Bool;
    else if(type == "int") setting.type = Type::Int;
    else if(type == "list") setting.type = Type::List;
    else if(type == "string") setting.type = Type::String;
    else throw std::invalid_argument("setting '" + setting.key + "' has unknown type '" + type + "'");
    setting.fallback = row.at("default");
    setting.persistent = row.value("persistent", true);
    settings.push_back(std::move(setting));
  }
  return settings;
}

inline SettingsManager::SettingsManager()
  : settings_(read_specification(SETTINGS_SPECIFICATION)) {
  for(const auto& setting : settings_) {
    values_[setting.key] = setting.fallback;
  }
}

inline const SettingsManager::Setting* SettingsManager::lookup(const std::string& name) const {
  const auto lowered = to_lower(trim_copy(name));
  for(const auto& setting : settings_) {
    if(std::find(setting.names.begin(), setting.names.end(), lowered) != setting.names.end()) {
      return &setting;
    }
  }
  return nullptr;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& name) const {
  const auto* setting = lookup(name);
  if(!setting) return std::nullopt;
  return setting->key;
}

inline bool SettingsManager::is_bool_setting(const std::string& name) const {
  const auto* setting = lookup(name);
  return setting && setting->type == Type::Bool;
}

inline bool SettingsManager::store(const Setting& setting, const nlohmann::json& value, std::string& error) {
  auto& slot = values_[setting.key];
  switch(setting.type) {
    case Type::Bool:
      if(value.is_boolean()) { slot = value; return true; }
      if(value.is_number_integer()) { slot = value.get<long long>() != 0; return true; }
      error = "expected boolean";
      return false;
    case Type::Int:
      if(value.is_number_integer()) { slot = value.get<int>(); return true; }
      error = "expected integer";
      return false;
    case Type::String:
      if(value.is_string()) { slot = value; return true; }
      error = "expected string";
      return false;
    case Type::List:
      // One string appends, so repeated positionals accumulate.
      if(value.is_string()) {
        if(!slot.is_array()) slot = nlohmann::json::array();
        slot.push_back(value);
        return true;
      }
      if(value.is_array() && std::all_of(value.begin(), value.end(),
                                         [](const nlohmann::json& item){ return item.is_string(); })) {
        slot = value;
        return true;
      }
      error = "expected string or list of strings";
      return false;
  }
  error = "unsupported setting type";
  return false;
}

inline std::optional<nlohmann::json> SettingsManager::parse_text(const Setting& setting,
                                                                 const std::string& text,
                                                                 std::string& error) {
  const auto clean = trim_copy(text);
  switch(setting.type) {
    case Type::Bool:
      if(auto value = parse_bool_literal(clean)) return nlohmann::json(*value);
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    case Type::Int:
      try {
        std::size_t used = 0;
        int value = std::stoi(clean, &used);
        if(used == clean.size()) return nlohmann::json(value);
      } catch(const std::exception&) {
      }
      error = "expected integer, got '" + clean + "'";
      return std::nullopt;
    case Type::String:
    case Type::List:
      return nlohmann::json(clean);
  }
  error = "unsupported setting type";
  return std::nullopt;
}

inline bool SettingsManager::set_from_string(const std::string& name, const std::string& text, std::string& error) {
  error.clear();
  const auto* setting = lookup(name);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  auto value = parse_text(*setting, text, error);
  return value && store(*setting, *value, error);
}

inline bool SettingsManager::set_from_json(const std::string& name, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* setting = lookup(name);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  return store(*setting, value, error);
}

inline std::filesystem::path SettingsManager::settings_path() const {
  return path_.empty() ? default_settings_location() : path_;
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* setting = lookup(item.key());
    // Unknown keys are left over from older versions.
    if(!setting || !setting->persistent) continue;
    std::string error;
    if(!store(*setting, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& setting : settings_) {
    if(setting.persistent) doc[setting.key] = values_.at(setting.key);
  }
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  out << doc.dump(4) << '\n';
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  return true;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::out_of_range("unknown setting '" + key + "'");
  }
  return values_.at(key).get<T>();
}
