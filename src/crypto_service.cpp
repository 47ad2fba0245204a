#include "crypto_service.hpp"

#include "utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kEd25519KeyBytes = 32;
constexpr std::size_t kEd25519SignatureBytes = 64;

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

PkeyPtr generate_ed25519_key() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free);
  if(!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) return PkeyPtr(nullptr, EVP_PKEY_free);
  EVP_PKEY* raw = nullptr;
  if(EVP_PKEY_keygen(ctx.get(), &raw) != 1) return PkeyPtr(nullptr, EVP_PKEY_free);
  return PkeyPtr(raw, EVP_PKEY_free);
}

std::string raw_key_hex(EVP_PKEY* key, bool private_part) {
  std::array<unsigned char, kEd25519KeyBytes> buf{};
  std::size_t len = buf.size();
  int ok = private_part ? EVP_PKEY_get_raw_private_key(key, buf.data(), &len)
                        : EVP_PKEY_get_raw_public_key(key, buf.data(), &len);
  if(ok != 1) throw std::runtime_error("unable to export Ed25519 key");
  return hex_from_bytes(buf.data(), len);
}

PkeyPtr ed25519_private_from_hex(const std::string& hex) {
  auto raw = bytes_from_hex(hex);
  if(raw.size() != kEd25519KeyBytes) throw std::invalid_argument("Ed25519 private key must be 32 bytes");
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, raw.data(), raw.size()), EVP_PKEY_free);
  if(!key) throw std::runtime_error("unable to load Ed25519 private key");
  return key;
}

std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int len = 0;
  if(!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char*>(message.data()), message.size(),
           md.data(), &len)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return hex_from_bytes(md.data(), len);
}

bool constant_time_equal(const std::string& a, const std::string& b) {
  if(a.size() != b.size()) return false;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// The envelope signature covers the hash and the timestamp, so the timestamp
// cannot be refreshed without the signing key.
std::string envelope_message(const std::string& bundle_hash, int64_t timestamp) {
  return bundle_hash + ":" + std::to_string(timestamp);
}

} // namespace

const char* crypto_backend_name(CryptoBackend backend) {
  switch(backend) {
    case CryptoBackend::Ed25519: return "ed25519";
    case CryptoBackend::HashFallback: return "hmac-sha256";
  }
  return "ed25519";
}

std::optional<CryptoBackend> crypto_backend_from_name(const std::string& name) {
  if(name == "ed25519") return CryptoBackend::Ed25519;
  if(name == "hmac-sha256") return CryptoBackend::HashFallback;
  return std::nullopt;
}

void to_json(nlohmann::json& j, const SignatureEnvelope& e) {
  j = nlohmann::json{
    {"bundleHash", e.bundle_hash},
    {"signature", e.signature},
    {"publicKey", e.public_key},
    {"timestamp", e.timestamp},
    {"version", e.version},
    {"backend", e.backend}
  };
}

void from_json(const nlohmann::json& j, SignatureEnvelope& e) {
  e.bundle_hash = j.at("bundleHash").get<std::string>();
  e.signature = j.at("signature").get<std::string>();
  e.public_key = j.at("publicKey").get<std::string>();
  const auto& ts = j.at("timestamp");
  if(!ts.is_number_integer() || (ts.is_number_unsigned() &&
     ts.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
    throw std::invalid_argument("envelope timestamp must be a 64-bit integer");
  }
  e.timestamp = ts.get<int64_t>();
  e.version = j.value("version", std::string(kSignatureEnvelopeVersion));
  e.backend = j.value("backend", std::string());
}

std::string peer_id_from_public_key(const std::string& public_key) {
  return public_key.substr(0, std::min(kPeerIdLength, public_key.size()));
}

CryptoService::CryptoService() : CryptoService(nullptr) {}

CryptoService::CryptoService(std::shared_ptr<Logger> logger, Options options)
  : logger_(std::move(logger)),
    clock_(options.clock ? std::move(options.clock) : Clock(now_ms)) {
  if(options.backend) {
    backend_ = *options.backend;
    if(backend_ == CryptoBackend::Ed25519 && !ed25519_available()) {
      throw std::runtime_error("Ed25519 requested but OpenSSL cannot generate Ed25519 keys");
    }
  } else if(ed25519_available()) {
    backend_ = CryptoBackend::Ed25519;
  } else {
    backend_ = CryptoBackend::HashFallback;
    log_warn(logger_.get(),
             "Ed25519 unavailable; using the hmac-sha256 fallback (integrity only, no non-repudiation)");
  }
  identity_ = generate_key_pair();
  log_info(logger_.get(), "crypto backend {} (peer {})", backend_name(), peer_id_from_public_key(identity_.public_key));
}

bool CryptoService::ed25519_available() {
  return static_cast<bool>(generate_ed25519_key());
}

KeyPair CryptoService::generate_key_pair() const {
  KeyPair pair;
  pair.backend = backend_;
  if(backend_ == CryptoBackend::Ed25519) {
    auto key = generate_ed25519_key();
    if(!key) throw std::runtime_error("Ed25519 key generation failed");
    pair.private_key = raw_key_hex(key.get(), true);
    pair.public_key = raw_key_hex(key.get(), false);
  } else {
    pair.private_key = random_hex(32);
    pair.public_key = sha256_hex(pair.private_key);
  }
  return pair;
}

void CryptoService::set_identity(const KeyPair& pair) {
  if(pair.backend != backend_) {
    throw std::invalid_argument(std::string("key pair belongs to backend ") +
                                crypto_backend_name(pair.backend) + ", active backend is " + backend_name());
  }
  std::lock_guard lg(m_);
  identity_ = pair;
}

KeyPair CryptoService::identity() const {
  std::lock_guard lg(m_);
  return identity_;
}

std::string CryptoService::public_key() const {
  std::lock_guard lg(m_);
  return identity_.public_key;
}

std::string CryptoService::peer_id() const {
  return peer_id_from_public_key(public_key());
}

void CryptoService::load_or_create_identity(const fs::path& path) {
  std::error_code ec;
  if(fs::exists(path, ec)) {
    try {
      std::ifstream in(path);
      nlohmann::json doc;
      in >> doc;
      KeyPair stored;
      stored.public_key = doc.at("publicKey").get<std::string>();
      stored.private_key = doc.at("privateKey").get<std::string>();
      auto backend = crypto_backend_from_name(doc.value("backend", std::string()));
      if(backend && *backend == backend_) {
        stored.backend = *backend;
        std::string derived = backend_ == CryptoBackend::Ed25519
          ? raw_key_hex(ed25519_private_from_hex(stored.private_key).get(), false)
          : sha256_hex(stored.private_key);
        if(derived == stored.public_key) {
          set_identity(stored);
          log_info(logger_.get(), "loaded identity {} from {}", peer_id(), path.string());
          return;
        }
        log_warn(logger_.get(), "identity in {} is inconsistent; generating a new one", path.string());
      } else {
        log_warn(logger_.get(), "identity in {} was made by backend '{}'; generating a {} identity",
                 path.string(), doc.value("backend", std::string("?")), backend_name());
      }
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "unreadable identity {}: {}; generating a new one", path.string(), e.what());
    }
  }

  auto pair = generate_key_pair();
  set_identity(pair);
  if(path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
  {
    std::ofstream out(path, std::ios::trunc);
    if(!out) throw std::runtime_error("unable to write identity " + path.string());
    nlohmann::json doc{
      {"backend", backend_name()},
      {"publicKey", pair.public_key},
      {"privateKey", pair.private_key}
    };
    out << doc.dump(2);
  }
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  if(ec) log_warn(logger_.get(), "unable to restrict permissions on {}: {}", path.string(), ec.message());
  log_info(logger_.get(), "created identity {} in {}", peer_id(), path.string());
}

std::string CryptoService::hash(const std::string& data) const {
  return sha256_hex(data);
}

std::string CryptoService::hash_file(const fs::path& path) const {
  return sha256_file_hex(path);
}

std::string CryptoService::sign(const std::string& message) const {
  auto pair = identity();
  if(backend_ == CryptoBackend::HashFallback) {
    return hmac_sha256_hex(pair.public_key, message);
  }
  auto key = ed25519_private_from_hex(pair.private_key);
  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if(!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw std::runtime_error("Ed25519 sign init failed");
  }
  std::array<unsigned char, kEd25519SignatureBytes> sig{};
  std::size_t sig_len = sig.size();
  if(EVP_DigestSign(ctx.get(), sig.data(), &sig_len,
                    reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
    throw std::runtime_error("Ed25519 sign failed");
  }
  return hex_from_bytes(sig.data(), sig_len);
}

bool CryptoService::verify(const std::string& message,
                           const std::string& signature,
                           const std::string& public_key) const {
  try {
    if(backend_ == CryptoBackend::HashFallback) {
      return constant_time_equal(hmac_sha256_hex(public_key, message), signature);
    }
    auto pub = bytes_from_hex(public_key);
    auto sig = bytes_from_hex(signature);
    if(pub.size() != kEd25519KeyBytes || sig.size() != kEd25519SignatureBytes) return false;
    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pub.data(), pub.size()), EVP_PKEY_free);
    if(!key) return false;
    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if(!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) return false;
    return EVP_DigestVerify(ctx.get(), sig.data(), sig.size(),
                            reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1;
  } catch(const std::exception& e) {
    log_debug(logger_.get(), "signature check rejected input: {}", e.what());
    return false;
  }
}

SignatureEnvelope CryptoService::sign_bundle(const std::string& bundle_hash,
                                             std::optional<int64_t> timestamp) const {
  SignatureEnvelope envelope;
  envelope.bundle_hash = bundle_hash;
  envelope.timestamp = timestamp ? *timestamp : now();
  envelope.public_key = public_key();
  envelope.backend = backend_name();
  envelope.signature = sign(envelope_message(bundle_hash, envelope.timestamp));
  log_debug(logger_.get(), "signed bundle {}...", bundle_hash.substr(0, 8));
  return envelope;
}

bool CryptoService::verify_bundle_signature(const std::string& bundle_hash,
                                            const SignatureEnvelope& envelope) const {
  auto current = now();
  if(envelope.timestamp < current &&
     ms_between(current, envelope.timestamp) > static_cast<uint64_t>(kSignatureMaxAgeMs)) {
    log_warn(logger_.get(), "bundle signature expired (timestamp {})", envelope.timestamp);
    return false;
  }
  if(bundle_hash != envelope.bundle_hash) {
    log_warn(logger_.get(), "bundle hash mismatch");
    return false;
  }
  if(envelope.backend != backend_name()) {
    log_warn(logger_.get(), "bundle signed with backend '{}' cannot be checked by {}",
             envelope.backend, backend_name());
    return false;
  }
  bool ok = verify(envelope_message(envelope.bundle_hash, envelope.timestamp),
                   envelope.signature, envelope.public_key);
  if(ok) {
    log_debug(logger_.get(), "bundle signature verified ({}...)", envelope.public_key.substr(0, 8));
  } else {
    log_warn(logger_.get(), "bundle signature verification failed");
  }
  return ok;
}

std::vector<unsigned char> CryptoService::derive_key(const std::string& password,
                                                     const std::string& salt) const {
  std::vector<unsigned char> out(kDerivedKeyBytes);
  if(PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                       reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                       kPbkdf2Iterations, EVP_sha256(),
                       static_cast<int>(out.size()), out.data()) != 1) {
    throw std::runtime_error("PBKDF2 failed");
  }
  return out;
}

std::string CryptoService::encrypt(const std::string& plaintext,
                                   const std::vector<unsigned char>& key) const {
  if(key.size() != kDerivedKeyBytes) throw std::invalid_argument("AES-256-GCM expects a 32-byte key");
  std::vector<unsigned char> nonce(kGcmNonceBytes);
  if(RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) throw std::runtime_error("RAND_bytes failed");

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  if(!ctx) throw std::runtime_error("AES-GCM context allocation failed");
  if(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
     EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
     EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    throw std::runtime_error("AES-GCM init failed");
  }

  std::vector<unsigned char> out(nonce);
  out.resize(nonce.size() + plaintext.size() + kGcmTagBytes);
  int len = 0;
  if(EVP_EncryptUpdate(ctx.get(), out.data() + nonce.size(), &len,
                       reinterpret_cast<const unsigned char*>(plaintext.data()),
                       static_cast<int>(plaintext.size())) != 1) {
    throw std::runtime_error("AES-GCM encrypt failed");
  }
  std::size_t written = static_cast<std::size_t>(len);
  if(EVP_EncryptFinal_ex(ctx.get(), out.data() + nonce.size() + written, &len) != 1) {
    throw std::runtime_error("AES-GCM final failed");
  }
  written += static_cast<std::size_t>(len);
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagBytes),
                         out.data() + nonce.size() + written) != 1) {
    throw std::runtime_error("AES-GCM get tag failed");
  }
  out.resize(nonce.size() + written + kGcmTagBytes);
  return base64_encode(out.data(), out.size());
}

std::string CryptoService::decrypt(const std::string& ciphertext,
                                   const std::vector<unsigned char>& key) const {
  if(key.size() != kDerivedKeyBytes) throw std::invalid_argument("AES-256-GCM expects a 32-byte key");
  std::vector<unsigned char> raw;
  try {
    raw = base64_decode(ciphertext);
  } catch(const std::invalid_argument& e) {
    throw std::runtime_error(std::string("ciphertext is not base64: ") + e.what());
  }
  if(raw.size() < kGcmNonceBytes + kGcmTagBytes) throw std::runtime_error("ciphertext too short");

  const unsigned char* nonce = raw.data();
  const unsigned char* body = raw.data() + kGcmNonceBytes;
  std::size_t body_len = raw.size() - kGcmNonceBytes - kGcmTagBytes;
  std::vector<unsigned char> tag(raw.end() - kGcmTagBytes, raw.end());

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  if(!ctx) throw std::runtime_error("AES-GCM context allocation failed");
  if(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
     EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kGcmNonceBytes), nullptr) != 1 ||
     EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    throw std::runtime_error("AES-GCM init failed");
  }
  std::string plain(body_len + kGcmTagBytes, '\0');
  int len = 0;
  if(EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()), &len,
                       body, static_cast<int>(body_len)) != 1) {
    throw std::runtime_error("AES-GCM decrypt failed");
  }
  std::size_t written = static_cast<std::size_t>(len);
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
    throw std::runtime_error("AES-GCM set tag failed");
  }
  if(EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()) + written, &len) != 1) {
    throw std::runtime_error("AES-GCM authentication failed");
  }
  written += static_cast<std::size_t>(len);
  plain.resize(written);
  return plain;
}

std::string CryptoService::generate_token() const {
  return random_hex(32);
}
