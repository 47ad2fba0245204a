#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Project description carried at the head of every bundle.
struct Manifest {
  std::string name;
  std::string version;
  std::string language;
  std::string run;
  std::map<std::string, std::string> engines;   // engine -> version range
  std::vector<uint16_t> ports;
  std::vector<std::string> env;                 // required env var names
  std::vector<std::string> secrets;             // required secret names
  std::map<std::string, std::string> dependencies;
  // Unknown keys survive a decode/encode cycle untouched.
  nlohmann::json extra = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const Manifest& m);
// Throws ParcelError(InvalidManifest) when a field has the wrong type.
void from_json(const nlohmann::json& j, Manifest& m);

// Empty when name, version, language and run are all present and non-empty;
// otherwise the first missing field.
std::optional<std::string> missing_manifest_field(const Manifest& m);

// Throws ParcelError(InvalidManifest).
void validate_manifest(const Manifest& m);

Manifest load_manifest_file(const std::string& path);
