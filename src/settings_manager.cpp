#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include "log.hpp"

std::vector<SettingsManager::SettingSpec> SettingsManager::build_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) spec.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    if(entry.contains("max")) spec.max = entry.at("max").get<long long>();
    if(entry.contains("choices")) spec.choices = entry.at("choices").get<std::vector<std::string>>();
    result.push_back(std::move(spec));
  }
  return result;
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(build_specs(specification)) {
  apply_defaults();
}

void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : specs_) settings_[spec.key] = spec.default_value;
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(lowered == to_lower(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) return &spec;
  }
  return nullptr;
}

bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

bool SettingsManager::load() {
  return load_from_file(settings_path_);
}

bool SettingsManager::save() const {
  return save_to_file(settings_path_);
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded()) {
    print_err(nullptr, "Failed to parse {}: not valid JSON", path.string());
    return false;
  }
  merge_from_json(doc);
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      print_err(nullptr, "Ignoring unknown setting '{}'", item.key());
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                        const nlohmann::json& value,
                                        std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<long long>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    auto v = value.get<long long>();
    if((spec.min && v < *spec.min) || (spec.max && v > *spec.max)) {
      error = "must be between " + (spec.min ? std::to_string(*spec.min) : std::string("-inf")) +
              " and " + (spec.max ? std::to_string(*spec.max) : std::string("inf"));
      return false;
    }
    settings_[spec.key] = v;
    return true;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto v = value.get<std::string>();
    if(!spec.choices.empty() &&
       std::find(spec.choices.begin(), spec.choices.end(), v) == spec.choices.end()) {
      error = "expected one of";
      for(const auto& choice : spec.choices) error += " " + choice;
      return false;
    }
    settings_[spec.key] = v;
    return true;
  }
  error = "unknown type '" + spec.type + "'";
  return false;
}

nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                   const std::string& value,
                                                   std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    std::size_t used = 0;
    try {
      auto v = std::stoll(clean, &used);
      if(used != clean.size()) {
        error = "trailing characters in '" + clean + "'";
        return {};
      }
      return v;
    } catch(const std::exception&) {
      error = "expected integer, got '" + clean + "'";
      return {};
    }
  }
  return clean;
}

bool SettingsManager::set_from_string(const std::string& key,
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

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

void SettingsManager::set(const std::string& key, const nlohmann::json& value) {
  std::string error;
  if(!set_from_json(key, value, error)) {
    throw std::invalid_argument("setting " + key + ": " + error);
  }
}

void SettingsManager::reset(const std::string& key) {
  if(const auto* spec = find_spec(key)) settings_[spec->key] = spec->default_value;
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

std::string SettingsManager::default_to_string(const SettingSpec& spec) {
  if(spec.default_value.is_boolean()) return spec.default_value.get<bool>() ? "true" : "false";
  if(spec.default_value.is_string()) return spec.default_value.get<std::string>();
  return spec.default_value.dump();
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}
