#include "manifest.hpp"

#include "errors.hpp"

#include <fstream>

namespace {

const char* const kKnownKeys[] = {
  "name", "version", "language", "run", "engines",
  "ports", "env", "secrets", "dependencies"
};

bool is_known_key(const std::string& key) {
  for(const auto* known : kKnownKeys) {
    if(key == known) return true;
  }
  return false;
}

template<typename T>
void read_optional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return;
  try {
    out = it->get<T>();
  } catch(const nlohmann::json::exception& e) {
    throw ParcelError(ErrorCode::InvalidManifest,
                      std::string("manifest field '") + key + "' has the wrong type: " + e.what());
  }
}

} // namespace

void to_json(nlohmann::json& j, const Manifest& m) {
  j = m.extra.is_object() ? m.extra : nlohmann::json::object();
  j["name"] = m.name;
  j["version"] = m.version;
  j["language"] = m.language;
  j["run"] = m.run;
  if(!m.engines.empty()) j["engines"] = m.engines;
  if(!m.ports.empty()) j["ports"] = m.ports;
  if(!m.env.empty()) j["env"] = m.env;
  if(!m.secrets.empty()) j["secrets"] = m.secrets;
  if(!m.dependencies.empty()) j["dependencies"] = m.dependencies;
}

void from_json(const nlohmann::json& j, Manifest& m) {
  if(!j.is_object()) {
    throw ParcelError(ErrorCode::InvalidManifest, "manifest must be a JSON object");
  }
  m = Manifest{};
  read_optional(j, "name", m.name);
  read_optional(j, "version", m.version);
  read_optional(j, "language", m.language);
  read_optional(j, "run", m.run);
  read_optional(j, "engines", m.engines);
  read_optional(j, "ports", m.ports);
  read_optional(j, "env", m.env);
  read_optional(j, "secrets", m.secrets);
  read_optional(j, "dependencies", m.dependencies);
  for(const auto& item : j.items()) {
    if(!is_known_key(item.key())) m.extra[item.key()] = item.value();
  }
}

std::optional<std::string> missing_manifest_field(const Manifest& m) {
  if(m.name.empty()) return std::string("name");
  if(m.version.empty()) return std::string("version");
  if(m.language.empty()) return std::string("language");
  if(m.run.empty()) return std::string("run");
  return std::nullopt;
}

void validate_manifest(const Manifest& m) {
  if(auto missing = missing_manifest_field(m)) {
    throw ParcelError(ErrorCode::InvalidManifest,
                      "manifest is missing required field '" + *missing + "'");
  }
}

Manifest load_manifest_file(const std::string& path) {
  std::ifstream in(path);
  if(!in) throw std::runtime_error("unable to open manifest " + path);
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw ParcelError(ErrorCode::InvalidManifest, "manifest " + path + " is not valid JSON: " + e.what());
  }
  Manifest m = doc.get<Manifest>();
  validate_manifest(m);
  return m;
}
