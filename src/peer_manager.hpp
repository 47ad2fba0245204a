#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "event_stream.hpp"
#include "log.hpp"

inline constexpr std::chrono::milliseconds kDefaultPeerTimeout{90000};

struct PeerInfo {
  std::string id;               // first 16 hex chars of public_key
  std::string name;
  std::string address;          // IP the peer was seen from
  uint16_t port = 0;            // transfer service port
  std::string public_key;
  int64_t last_seen_ms = 0;
  bool manual = false;          // added by hand; never swept
  std::string backend;          // crypto backend, when known

  std::string base_url() const {
    return "http://" + address + ":" + std::to_string(port);
  }
};

void to_json(nlohmann::json& j, const PeerInfo& p);

// Live peer registry. Entries are created on first valid announcement,
// refreshed on each later one and swept after the timeout.
class PeerManager {
public:
  using Clock = std::function<int64_t()>;

  explicit PeerManager(std::shared_ptr<Logger> logger = nullptr,
                       Clock clock = {},
                       std::chrono::milliseconds peer_timeout = kDefaultPeerTimeout);

  // Inserts or refreshes `info` with last_seen = now. True on first sight.
  bool upsert(PeerInfo info);

  std::optional<PeerInfo> find(const std::string& peer_id) const;
  std::vector<PeerInfo> list() const;
  bool is_live(const std::string& peer_id) const;
  bool remove(const std::string& peer_id);

  // Removes peers unseen for longer than the timeout; fires peer_lost once
  // per removed id.
  std::vector<std::string> sweep_expired();

  std::size_t known_peer_count() const;
  int64_t now() const { return clock_(); }

  EventStream<PeerInfo> peer_discovered;
  EventStream<std::string> peer_lost;

private:
  std::shared_ptr<Logger> logger_;
  Clock clock_;
  std::chrono::milliseconds peer_timeout_;

  mutable std::mutex m_;
  std::unordered_map<std::string, PeerInfo> peers_;
};
