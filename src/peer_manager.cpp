#include "peer_manager.hpp"
#include "utils.hpp"
#include <algorithm>

void to_json(nlohmann::json& j, const PeerInfo& p) {
  j = nlohmann::json{
    {"id", p.id},
    {"name", p.name},
    {"address", p.address},
    {"port", p.port},
    {"publicKey", p.public_key},
    {"lastSeen", p.last_seen_ms},
    {"manual", p.manual}
  };
  if(!p.backend.empty()) j["backend"] = p.backend;
}

PeerManager::PeerManager(std::shared_ptr<Logger> logger,
                         Clock clock,
                         std::chrono::milliseconds peer_timeout)
  : peer_discovered("peer-discovered", logger),
    peer_lost("peer-lost", logger),
    logger_(std::move(logger)),
    clock_(clock ? std::move(clock) : Clock(now_ms)),
    peer_timeout_(peer_timeout)
{
}

bool PeerManager::upsert(PeerInfo info) {
  info.last_seen_ms = clock_();
  bool inserted = false;
  PeerInfo snapshot;
  {
    std::lock_guard lg(m_);
    auto it = peers_.find(info.id);
    if(it == peers_.end()){
      peers_[info.id] = info;
      inserted = true;
    } else {
      // a manual peer stays manual once it also shows up on multicast
      info.manual = info.manual || it->second.manual;
      if(info.backend.empty()) info.backend = it->second.backend;
      if(it->second.address != info.address || it->second.port != info.port){
        log_info(logger_.get(), "Updated peer {} address -> {}:{}", info.id, info.address, info.port);
      }
      it->second = info;
    }
    snapshot = info;
  }
  if(inserted){
    log_info(logger_.get(), "Discovered new peer {} ({}) at {}:{}",
             snapshot.name, snapshot.id, snapshot.address, snapshot.port);
    peer_discovered.emit(snapshot);
  }
  return inserted;
}

std::optional<PeerInfo> PeerManager::find(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_id);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

std::vector<PeerInfo> PeerManager::list() const {
  std::vector<PeerInfo> out;
  {
    std::lock_guard lg(m_);
    out.reserve(peers_.size());
    for(const auto& p : peers_) out.push_back(p.second);
  }
  std::sort(out.begin(), out.end(),
            [](const PeerInfo& a, const PeerInfo& b){ return a.id < b.id; });
  return out;
}

bool PeerManager::is_live(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_id);
  if(it == peers_.end()) return false;
  if(it->second.manual) return true;
  return clock_() - it->second.last_seen_ms <= peer_timeout_.count();
}

bool PeerManager::remove(const std::string& peer_id) {
  bool removed = false;
  {
    std::lock_guard lg(m_);
    removed = peers_.erase(peer_id) > 0;
  }
  if(removed){
    log_info(logger_.get(), "Removed peer {}", peer_id);
    peer_lost.emit(peer_id);
  }
  return removed;
}

std::vector<std::string> PeerManager::sweep_expired() {
  std::vector<std::string> expired;
  {
    std::lock_guard lg(m_);
    const auto now = clock_();
    for(auto it = peers_.begin(); it != peers_.end();){
      if(!it->second.manual && now - it->second.last_seen_ms > peer_timeout_.count()){
        expired.push_back(it->first);
        it = peers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for(const auto& id : expired){
    log_info(logger_.get(), "Peer {} timed out and removed", id);
    peer_lost.emit(id);
  }
  return expired;
}

std::size_t PeerManager::known_peer_count() const {
  std::lock_guard lg(m_);
  return peers_.size();
}
