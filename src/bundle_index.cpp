#include "bundle_index.hpp"
#include <algorithm>

void BundleIndex::add_or_update(const BundleInfo& e){
    std::lock_guard lg(m_);
    map_[e.id]=e;
}

std::vector<BundleInfo> BundleIndex::list_active(int64_t now) const {
    std::vector<BundleInfo> out;
    {
        std::lock_guard lg(m_);
        for(auto &p: map_) if(p.second.expires_at > now) out.push_back(p.second);
    }
    std::sort(out.begin(), out.end(), [](const BundleInfo& a, const BundleInfo& b){
        if(a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return out;
}

std::optional<BundleInfo> BundleIndex::find(const std::string& bundle_id) const {
    std::lock_guard lg(m_);
    auto it = map_.find(bundle_id);
    if(it == map_.end()) return std::nullopt;
    return it->second;
}

bool BundleIndex::remove(const std::string& bundle_id){
    std::lock_guard lg(m_);
    return map_.erase(bundle_id) > 0;
}

std::vector<std::string> BundleIndex::sweep_expired(int64_t now){
    std::lock_guard lg(m_);
    std::vector<std::string> removed;
    for(auto it = map_.begin(); it != map_.end();){
        if(it->second.expires_at <= now){
            removed.push_back(it->first);
            it = map_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

