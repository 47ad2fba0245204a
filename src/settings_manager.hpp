#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every setting the node understands. "min"/"max" bound int settings and
// "choices" restricts string settings; "persistent": false keeps a value
// out of settings.json.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},          {"aliases", {"cmd"}},              {"type","string"}, {"default","repl"},          {"choices", {"repl","serve"}}, {"description","repl: interactive shell, serve: headless node"}, {"persistent", false}},
  {{"key","transfer_port"},    {"aliases", {"port","tp"}},        {"type","int"},    {"default",7682},            {"min",0}, {"max",65535}, {"description","TCP port of the transfer HTTP server (0 = ephemeral)"}, {"persistent", true}},
  {{"key","listen_ip"},        {"aliases", {"li"}},               {"type","string"}, {"default","0.0.0.0"},       {"description","Interface/IP the transfer server binds"}, {"persistent", true}},
  {{"key","discovery_port"},   {"aliases", {"dp"}},               {"type","int"},    {"default",7683},            {"min",1}, {"max",65535}, {"description","UDP port for multicast discovery"}, {"persistent", true}},
  {{"key","multicast_group"},  {"aliases", {"group","mg"}},       {"type","string"}, {"default","239.255.42.99"}, {"description","Multicast group for announcements"}, {"persistent", true}},
  {{"key","discovery"},        {"aliases", {"multicast"}},        {"type","bool"},   {"default",true},            {"description","Announce and listen on the multicast group"}, {"persistent", true}},
  {{"key","chunk_size"},       {"aliases", {"cs"}},               {"type","int"},    {"default",4194304},         {"min",1024}, {"max",67108864}, {"description","Bundle chunk size in bytes"}, {"persistent", true}},
  {{"key","transfer_timeout"}, {"aliases", {"timeout","tt"}},     {"type","int"},    {"default",300},             {"min",1}, {"max",86400}, {"description","Token lifetime and finished-transfer grace period (seconds)"}, {"persistent", true}},
  {{"key","pull_mode"},        {"aliases", {"pm"}},               {"type","string"}, {"default","full"},          {"choices", {"full","chunked"}}, {"description","Download whole stream or chunk by chunk"}, {"persistent", true}},
  {{"key","worker_threads"},   {"aliases", {"workers","wt"}},     {"type","int"},    {"default",2},               {"min",1}, {"max",64}, {"description","Threads running background pulls"}, {"persistent", true}},
  {{"key","display_name"},     {"aliases", {"name","dn"}},        {"type","string"}, {"default",""},              {"description","Name announced to peers (default: hostname-pid)"}, {"persistent", true}},
  {{"key","data_dir"},         {"aliases", {"dir","dd"}},         {"type","string"}, {"default",".parcel"},       {"description","Identity, settings and bundle storage"}, {"persistent", false}},
  {{"key","manual_peer"},      {"aliases", {"peer","mp"}},        {"type","string"}, {"default",""},              {"description","Comma separated host:port peers to add at startup"}, {"persistent", true}},
  {{"key","verbose"},          {"aliases", {"v"}},                {"type","bool"},   {"default",false},           {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},         {"aliases", {"log","lf"}},         {"type","string"}, {"default",""},              {"description","Also write logs to this file"}, {"persistent", true}},
  {{"key","crypto_backend"},   {"aliases", {"backend","cb"}},     {"type","string"}, {"default","auto"},          {"choices", {"auto","ed25519","hmac-sha256"}}, {"description","Signature backend"}, {"persistent", true}},
  {{"key","help"},             {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},           {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},             {"aliases", {"persist"}},          {"type","bool"},   {"default",false},           {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
    std::optional<long long> min;
    std::optional<long long> max;
    std::vector<std::string> choices;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);
  // Throws std::invalid_argument instead of reporting through `error`.
  void set(const std::string& key, const nlohmann::json& value);
  void reset(const std::string& key);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  const SettingSpec* spec(const std::string& key) const { return find_spec(key); }
  const std::vector<SettingSpec>& specs() const { return specs_; }

  std::filesystem::path settings_path() const { return settings_path_; }
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static std::string default_to_string(const SettingSpec& spec);

private:
  static std::vector<SettingSpec> build_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> specs_;
  std::filesystem::path settings_path_;
};

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
