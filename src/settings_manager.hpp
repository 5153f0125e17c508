#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_ip"},               {"aliases", {"li","ip"}},            {"type","string"}, {"default","0.0.0.0"},  {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"},             {"aliases", {"lp","port"}},          {"type","int"},    {"default",6969},       {"min",0}, {"description","TCP port to listen on"}, {"persistent", true}},
  {{"key","size_limit_mb"},           {"aliases", {"limit","slm"}},        {"type","int"},    {"default",1024},       {"min",1}, {"description","Largest accepted upload in MiB"}, {"persistent", true}},
  {{"key","storage_dir"},             {"aliases", {"sd","out"}},           {"type","string"}, {"default","."},        {"description","Directory that receives direct-to-storage uploads"}, {"persistent", true}},
  {{"key","registry_shards"},         {"aliases", {"shards"}},             {"type","int"},    {"default",16},         {"min",1}, {"description","Lock stripes in the transfer registry"}, {"persistent", true}},
  {{"key","io_threads"},              {"aliases", {"iot"}},                {"type","int"},    {"default",1},          {"min",1}, {"description","Threads running the connection scheduler"}, {"persistent", true}},
  {{"key","worker_threads"},          {"aliases", {"wt"}},                 {"type","int"},    {"default",2},          {"min",0}, {"description","Packaging/disk worker threads (0 = hardware concurrency)"}, {"persistent", true}},
  {{"key","pump_active_interval_ms"}, {"aliases", {"paim"}},               {"type","int"},    {"default",100},        {"min",1}, {"description","Broadcast poll interval after a dirty tick"}, {"persistent", true}},
  {{"key","pump_idle_interval_ms"},   {"aliases", {"piim"}},               {"type","int"},    {"default",150},        {"min",1}, {"description","Broadcast poll interval while nothing changed"}, {"persistent", true}},
  {{"key","signal_capacity"},         {"aliases", {"sc"}},                 {"type","int"},    {"default",8},          {"min",1}, {"description","Pending wake-ups kept per broadcast class"}, {"persistent", true}},
  {{"key","missing_transfer_policy"}, {"aliases", {"mtp"}},                {"type","string"}, {"default","lenient"},  {"choices", {"lenient","strict"}}, {"description","Upload behaviour when nobody registered the transfer"}, {"persistent", true}},
  {{"key","transfer_retention_ms"},   {"aliases", {"retention","trm"}},    {"type","int"},    {"default",-1},         {"min",-1}, {"description","Evict finished transfers after N ms (-1 = never)"}, {"persistent", true}},
  {{"key","staging_eviction"},        {"aliases", {"se"}},                 {"type","string"}, {"default","keep"},     {"choices", {"keep","after_download"}}, {"description","Drop staged files once they were downloaded"}, {"persistent", true}},
  {{"key","compression_level"},       {"aliases", {"cl","level"}},         {"type","int"},    {"default",8},          {"min",0}, {"description","Deflate level used for downloads (0-9)"}, {"persistent", true}},
  {{"key","verbose"},                 {"aliases", {"v"}},                  {"type","bool"},   {"default",false},      {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                    {"aliases", {"h","?"}},              {"type","bool"},   {"default",false},      {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                    {"aliases", {"persist"}},            {"type","bool"},   {"default",false},      {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed view over SETTINGS_SPECIFICATION. Values are validated against the
// declared type, `min` and `choices` on every write, whether they come from
// the command line, the settings file or code.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Persistent keys only. A missing file is not an error for load(): it
  // returns false and leaves the current values alone.
  bool save() const;
  bool load();

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  // Canonical key for a key or alias, case-insensitive.
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  enum class Type { Bool, Int, String };

  struct Setting {
    std::string key;
    Type type = Type::String;
    nlohmann::json default_value;
    std::vector<std::string> choices;
    std::optional<long long> minimum;
    bool persistent = true;
  };

  const Setting* find(const std::string& token) const;
  bool store(const Setting& setting, nlohmann::json value, std::string& error);
  static std::optional<nlohmann::json> normalize(const Setting& setting, const nlohmann::json& value, std::string& error);
  static std::optional<nlohmann::json> parse_text(const Setting& setting, const std::string& text, std::string& error);

  std::vector<Setting> settings_;
  // lower-cased key or alias -> index into settings_
  std::unordered_map<std::string, std::size_t> tokens_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  settings_.reserve(specification.size());
  for(const auto& entry : specification) {
    Setting setting;
    setting.key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    if(type == "bool") setting.type = Type::Bool;
    else if(type == "int") setting.type = Type::Int;
    else if(type == "string") setting.type = Type::String;
    else throw std::invalid_argument("setting " + setting.key + " has unknown type " + type);
    setting.default_value = entry.at("default");
    setting.choices = entry.value("choices", std::vector<std::string>{});
    if(entry.contains("min")) setting.minimum = entry.at("min").get<long long>();
    setting.persistent = entry.value("persistent", true);

    const std::size_t index = settings_.size();
    tokens_[to_lower(setting.key)] = index;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      tokens_.emplace(to_lower(alias), index);
    }
    values_[setting.key] = setting.default_value;
    settings_.push_back(std::move(setting));
  }
}

inline const SettingsManager::Setting* SettingsManager::find(const std::string& token) const {
  auto it = tokens_.find(to_lower(token));
  return it == tokens_.end() ? nullptr : &settings_[it->second];
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  const auto* setting = find(token);
  return setting ? std::optional<std::string>(setting->key) : std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* setting = find(key);
  return setting && setting->type == Type::Bool;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  const auto path = settings_path();
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return false;

  std::ifstream in(path);
  if(!in) {
    print_err(nullptr, "Unable to read {}", path.string());
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "{} does not hold a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* setting = find(item.key());
    if(!setting) continue;
    std::string error;
    if(!store(*setting, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& setting : settings_) {
    if(setting.persistent) doc[setting.key] = values_.at(setting.key);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

inline std::optional<nlohmann::json> SettingsManager::normalize(const Setting& setting,
                                                                const nlohmann::json& value,
                                                                std::string& error) {
  switch(setting.type) {
    case Type::Bool:
      if(value.is_boolean()) return value;
      if(value.is_number_integer()) return nlohmann::json(value.get<long long>() != 0);
      error = "expected boolean";
      return std::nullopt;
    case Type::Int:
      if(!value.is_number_integer()) {
        error = "expected integer";
        return std::nullopt;
      }
      if(setting.minimum && value.get<long long>() < *setting.minimum) {
        error = "must be >= " + std::to_string(*setting.minimum);
        return std::nullopt;
      }
      return nlohmann::json(value.get<int>());
    case Type::String:
      if(!value.is_string()) {
        error = "expected string";
        return std::nullopt;
      }
      if(!setting.choices.empty() &&
         std::find(setting.choices.begin(), setting.choices.end(), value.get<std::string>()) == setting.choices.end()) {
        error = "expected one of";
        for(std::size_t i = 0; i < setting.choices.size(); ++i) {
          error += (i == 0 ? " " : "|") + setting.choices[i];
        }
        return std::nullopt;
      }
      return value;
  }
  error = "unsupported type";
  return std::nullopt;
}

inline std::optional<nlohmann::json> SettingsManager::parse_text(const Setting& setting,
                                                                 const std::string& text,
                                                                 std::string& error) {
  const std::string clean = trim_copy(text);
  switch(setting.type) {
    case Type::Bool: {
      const std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return nlohmann::json(true);
      if(v == "false" || v == "0" || v == "off" || v == "no") return nlohmann::json(false);
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    }
    case Type::Int:
      try {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(clean, &consumed);
        if(consumed != clean.size()) {
          error = "trailing characters";
          return std::nullopt;
        }
        return nlohmann::json(parsed);
      } catch(const std::exception& e) {
        error = std::string("not a number: ") + e.what();
        return std::nullopt;
      }
    case Type::String:
      return nlohmann::json(clean);
  }
  error = "unsupported type";
  return std::nullopt;
}

inline bool SettingsManager::store(const Setting& setting, nlohmann::json value, std::string& error) {
  auto normalized = normalize(setting, value, error);
  if(!normalized) return false;
  values_[setting.key] = std::move(*normalized);
  return true;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(*setting, value, error);
  return parsed && store(*setting, std::move(*parsed), error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  return store(*setting, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
