#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "crypto_service.hpp"
#include "manifest.hpp"

inline constexpr int64_t kBundleLifetimeMs = 24LL * 60 * 60 * 1000;

struct BundleInfo {
    std::string id;
    Manifest manifest;
    std::filesystem::path path;
    uint64_t size = 0;
    std::size_t chunks = 0;
    std::size_t chunk_size = 0;
    std::string checksum;                      // hex
    std::vector<std::string> chunk_checksums;  // hex, one per chunk
    SignatureEnvelope signature;
    int64_t created_at = 0;
    int64_t expires_at = 0;
};

// Bundles this node is hosting.
class BundleIndex {
public:
    void add_or_update(const BundleInfo&);
    // Entries with expires_at > now, oldest first.
    std::vector<BundleInfo> list_active(int64_t now) const;
    std::optional<BundleInfo> find(const std::string& bundle_id) const;
    bool remove(const std::string& bundle_id);
    std::vector<std::string> sweep_expired(int64_t now);
private:
    mutable std::mutex m_;
    std::unordered_map<std::string, BundleInfo> map_; // bundle id -> entry
};
