#include "token_store.hpp"
#include <stdexcept>

const char* token_check_name(TokenCheck check) {
  switch(check) {
    case TokenCheck::Valid: return "valid";
    case TokenCheck::Unknown: return "unknown";
    case TokenCheck::Expired: return "expired";
    case TokenCheck::WrongPeer: return "wrong-peer";
  }
  return "unknown";
}

TokenStore::TokenStore(Generator generator)
  : generator_(std::move(generator)) {
  if(!generator_) throw std::invalid_argument("TokenStore needs a token generator");
}

TransferToken TokenStore::issue(const std::string& bundle_id,
                                const std::string& peer_id,
                                int64_t now,
                                int64_t ttl_ms) {
  TransferToken t;
  t.bundle_id = bundle_id;
  t.peer_id = peer_id;
  t.expires_at = now + ttl_ms;
  std::lock_guard lg(m_);
  do {
    t.token = generator_();
  } while(tokens_.count(t.token) > 0);
  tokens_[t.token] = t;
  return t;
}

TokenCheck TokenStore::check(const std::string& token,
                             const std::string& peer_id,
                             int64_t now,
                             TransferToken* out) const {
  std::lock_guard lg(m_);
  auto it = tokens_.find(token);
  if(it == tokens_.end()) return TokenCheck::Unknown;
  if(it->second.expires_at <= now) return TokenCheck::Expired;
  if(!peer_id.empty() && it->second.peer_id != peer_id) return TokenCheck::WrongPeer;
  if(out) *out = it->second;
  return TokenCheck::Valid;
}

std::optional<TransferToken> TokenStore::find(const std::string& token) const {
  std::lock_guard lg(m_);
  auto it = tokens_.find(token);
  if(it == tokens_.end()) return std::nullopt;
  return it->second;
}

bool TokenStore::revoke(const std::string& token) {
  std::lock_guard lg(m_);
  return tokens_.erase(token) > 0;
}

std::size_t TokenStore::revoke_bundle(const std::string& bundle_id) {
  std::lock_guard lg(m_);
  std::size_t removed = 0;
  for(auto it = tokens_.begin(); it != tokens_.end();) {
    if(it->second.bundle_id == bundle_id) {
      it = tokens_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t TokenStore::sweep_expired(int64_t now) {
  std::lock_guard lg(m_);
  std::size_t removed = 0;
  for(auto it = tokens_.begin(); it != tokens_.end();) {
    if(it->second.expires_at <= now) {
      it = tokens_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t TokenStore::size() const {
  std::lock_guard lg(m_);
  return tokens_.size();
}
