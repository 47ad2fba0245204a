#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct TransferToken {
  std::string token;
  std::string bundle_id;
  std::string peer_id;
  int64_t expires_at = 0;
};

enum class TokenCheck { Valid, Unknown, Expired, WrongPeer };

const char* token_check_name(TokenCheck check);

// Issued transfer tokens, each bound to one (bundle, peer) pair.
class TokenStore {
public:
  using Generator = std::function<std::string()>;

  explicit TokenStore(Generator generator);

  // Every call yields a fresh token, even for a pair that already holds one.
  TransferToken issue(const std::string& bundle_id,
                      const std::string& peer_id,
                      int64_t now,
                      int64_t ttl_ms);

  // An empty `peer_id` skips the peer binding check.
  TokenCheck check(const std::string& token,
                   const std::string& peer_id,
                   int64_t now,
                   TransferToken* out = nullptr) const;

  std::optional<TransferToken> find(const std::string& token) const;
  bool revoke(const std::string& token);
  std::size_t revoke_bundle(const std::string& bundle_id);
  std::size_t sweep_expired(int64_t now);
  std::size_t size() const;

private:
  Generator generator_;
  mutable std::mutex m_;
  std::unordered_map<std::string, TransferToken> tokens_;
};
