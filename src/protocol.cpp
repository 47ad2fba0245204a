#include "protocol.hpp"

#include <limits>
#include <stdexcept>

namespace {

const json& require(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end()) throw std::invalid_argument(std::string("missing field '") + key + "'");
  return *it;
}

std::string require_string(const json& j, const char* key) {
  const auto& v = require(j, key);
  if(!v.is_string()) throw std::invalid_argument(std::string("field '") + key + "' must be a string");
  return v.get<std::string>();
}

int64_t require_integer(const json& j, const char* key) {
  const auto& v = require(j, key);
  if(!v.is_number_integer()) throw std::invalid_argument(std::string("field '") + key + "' must be an integer");
  if(v.is_number_unsigned() &&
     v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw std::invalid_argument(std::string("field '") + key + "' is out of range");
  }
  return v.get<int64_t>();
}

} // namespace

std::string canonical_payload(const PeerAnnouncement& a) {
  nlohmann::ordered_json j;
  j["type"] = "peer_announcement";
  j["id"] = a.id;
  j["name"] = a.name;
  j["port"] = a.port;
  j["publicKey"] = a.public_key;
  j["timestamp"] = a.timestamp;
  return j.dump();
}

std::string canonical_payload(const BundleAnnouncement& a) {
  nlohmann::ordered_json j;
  j["type"] = "bundle_announcement";
  j["peerId"] = a.peer_id;
  j["bundleId"] = a.bundle_id;
  j["bundleName"] = a.bundle_name;
  j["bundleSize"] = a.bundle_size;
  j["timestamp"] = a.timestamp;
  return j.dump();
}

json make_peer_announcement(const PeerAnnouncement& a) {
  json j;
  j["type"] = "peer_announcement";
  j["id"] = a.id;
  j["name"] = a.name;
  j["port"] = a.port;
  j["publicKey"] = a.public_key;
  j["timestamp"] = a.timestamp;
  j["signature"] = a.signature;
  return j;
}

json make_bundle_announcement(const BundleAnnouncement& a) {
  json j;
  j["type"] = "bundle_announcement";
  j["peerId"] = a.peer_id;
  j["bundleId"] = a.bundle_id;
  j["bundleName"] = a.bundle_name;
  j["bundleSize"] = a.bundle_size;
  j["timestamp"] = a.timestamp;
  j["signature"] = a.signature;
  return j;
}

std::string serialize_discovery_message(const DiscoveryMessage& message) {
  if(const auto* peer = std::get_if<PeerAnnouncement>(&message)) {
    return make_peer_announcement(*peer).dump();
  }
  return make_bundle_announcement(std::get<BundleAnnouncement>(message)).dump();
}

DiscoveryMessage parse_discovery_message(const std::string& datagram) {
  if(datagram.size() > kMaxDatagramBytes) throw std::invalid_argument("datagram too large");
  json j;
  try {
    j = json::parse(datagram);
  } catch(const json::parse_error& e) {
    throw std::invalid_argument(std::string("not JSON: ") + e.what());
  }
  if(!j.is_object()) throw std::invalid_argument("discovery message must be an object");

  auto type = require_string(j, "type");
  if(type == "peer_announcement") {
    PeerAnnouncement a;
    a.id = require_string(j, "id");
    a.name = require_string(j, "name");
    auto port = require_integer(j, "port");
    if(port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
      throw std::invalid_argument("port out of range");
    }
    a.port = static_cast<uint16_t>(port);
    a.public_key = require_string(j, "publicKey");
    a.timestamp = require_integer(j, "timestamp");
    a.signature = require_string(j, "signature");
    return a;
  }
  if(type == "bundle_announcement") {
    BundleAnnouncement a;
    a.peer_id = require_string(j, "peerId");
    a.bundle_id = require_string(j, "bundleId");
    a.bundle_name = require_string(j, "bundleName");
    auto size = require_integer(j, "bundleSize");
    if(size < 0) throw std::invalid_argument("bundleSize is negative");
    a.bundle_size = static_cast<uint64_t>(size);
    a.timestamp = require_integer(j, "timestamp");
    a.signature = require_string(j, "signature");
    return a;
  }
  throw std::invalid_argument("unknown discovery message type '" + type + "'");
}
