#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"

inline constexpr const char* kSignatureEnvelopeVersion = "1.0.0";
inline constexpr int64_t kSignatureMaxAgeMs = 24LL * 60 * 60 * 1000;
inline constexpr int kPbkdf2Iterations = 100000;
inline constexpr std::size_t kDerivedKeyBytes = 32;
inline constexpr std::size_t kGcmNonceBytes = 12;
inline constexpr std::size_t kGcmTagBytes = 16;
inline constexpr std::size_t kPeerIdLength = 16;

// Ed25519 signs with a private key. HashFallback is an HMAC keyed by the
// public key: it detects corruption but anyone holding the public key can
// produce a valid signature.
enum class CryptoBackend { Ed25519, HashFallback };

const char* crypto_backend_name(CryptoBackend backend);
std::optional<CryptoBackend> crypto_backend_from_name(const std::string& name);

struct KeyPair {
  std::string public_key;    // hex
  std::string private_key;   // hex
  CryptoBackend backend = CryptoBackend::Ed25519;
};

struct SignatureEnvelope {
  std::string bundle_hash;
  std::string signature;
  std::string public_key;
  int64_t timestamp = 0;     // ms since epoch
  std::string version = kSignatureEnvelopeVersion;
  std::string backend;
};

void to_json(nlohmann::json& j, const SignatureEnvelope& e);
void from_json(const nlohmann::json& j, SignatureEnvelope& e);

std::string peer_id_from_public_key(const std::string& public_key);

class CryptoService {
public:
  using Clock = std::function<int64_t()>;

  struct Options {
    // Unset probes for Ed25519 and falls back when OpenSSL lacks it.
    std::optional<CryptoBackend> backend;
    Clock clock;
  };

  CryptoService();
  explicit CryptoService(std::shared_ptr<Logger> logger, Options options = {});

  CryptoBackend backend() const { return backend_; }
  const char* backend_name() const { return crypto_backend_name(backend_); }
  bool non_repudiable() const { return backend_ == CryptoBackend::Ed25519; }

  KeyPair generate_key_pair() const;
  // Throws std::invalid_argument when the pair belongs to another backend.
  void set_identity(const KeyPair& pair);
  KeyPair identity() const;
  std::string public_key() const;
  std::string peer_id() const;

  // Reads the key pair from `path`, creating it (mode 0600) when missing or
  // when it was produced by another backend.
  void load_or_create_identity(const std::filesystem::path& path);

  std::string hash(const std::string& data) const;
  std::string hash_file(const std::filesystem::path& path) const;

  std::string sign(const std::string& message) const;
  // Never throws; malformed input verifies as false.
  bool verify(const std::string& message,
              const std::string& signature,
              const std::string& public_key) const;

  SignatureEnvelope sign_bundle(const std::string& bundle_hash,
                                std::optional<int64_t> timestamp = std::nullopt) const;
  bool verify_bundle_signature(const std::string& bundle_hash,
                               const SignatureEnvelope& envelope) const;

  std::vector<unsigned char> derive_key(const std::string& password,
                                        const std::string& salt) const;
  // base64(nonce || ciphertext || tag)
  std::string encrypt(const std::string& plaintext,
                      const std::vector<unsigned char>& key) const;
  // Throws std::runtime_error when the input was altered or the key is wrong.
  std::string decrypt(const std::string& ciphertext,
                      const std::vector<unsigned char>& key) const;

  std::string generate_token() const;

  int64_t now() const { return clock_(); }

private:
  static bool ed25519_available();

  std::shared_ptr<Logger> logger_;
  Clock clock_;
  CryptoBackend backend_ = CryptoBackend::Ed25519;
  mutable std::mutex m_;
  KeyPair identity_;
};
