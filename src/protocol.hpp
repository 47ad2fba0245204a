#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kProtocolVersion = "0.1.0";
inline constexpr uint16_t kDefaultTransferPort = 7682;
inline constexpr uint16_t kDefaultDiscoveryPort = 7683;
inline constexpr const char* kDefaultMulticastGroup = "239.255.42.99";
inline constexpr int64_t kAnnouncementMaxAgeMs = 5 * 60 * 1000;
inline constexpr std::size_t kMaxDatagramBytes = 8192;

struct PeerAnnouncement {
  std::string id;
  std::string name;
  uint16_t port = 0;
  std::string public_key;
  int64_t timestamp = 0;
  std::string signature;
};

struct BundleAnnouncement {
  std::string peer_id;
  std::string bundle_id;
  std::string bundle_name;
  uint64_t bundle_size = 0;
  int64_t timestamp = 0;
  std::string signature;
};

using DiscoveryMessage = std::variant<PeerAnnouncement, BundleAnnouncement>;

// Compact JSON of the signed fields in wire order.
std::string canonical_payload(const PeerAnnouncement& a);
std::string canonical_payload(const BundleAnnouncement& a);

json make_peer_announcement(const PeerAnnouncement& a);
json make_bundle_announcement(const BundleAnnouncement& a);

std::string serialize_discovery_message(const DiscoveryMessage& message);
// Throws std::invalid_argument for anything that is not a well-formed
// peer_announcement or bundle_announcement.
DiscoveryMessage parse_discovery_message(const std::string& datagram);
