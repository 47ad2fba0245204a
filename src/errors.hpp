#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCode {
  CorruptBundle,
  InvalidManifest,
  DestinationConflict,
  SignatureInvalid,
  TokenInvalid,
  BundleNotFound,
  PeerUnavailable,
  TransferFailed
};

inline const char* error_code_name(ErrorCode code) {
  switch(code) {
    case ErrorCode::CorruptBundle: return "CORRUPT_BUNDLE";
    case ErrorCode::InvalidManifest: return "INVALID_MANIFEST";
    case ErrorCode::DestinationConflict: return "DESTINATION_CONFLICT";
    case ErrorCode::SignatureInvalid: return "SIGNATURE_INVALID";
    case ErrorCode::TokenInvalid: return "TOKEN_INVALID";
    case ErrorCode::BundleNotFound: return "BUNDLE_NOT_FOUND";
    case ErrorCode::PeerUnavailable: return "PEER_UNAVAILABLE";
    case ErrorCode::TransferFailed: return "TRANSFER_FAILED";
  }
  return "UNKNOWN";
}

class ParcelError : public std::runtime_error {
public:
  ParcelError(ErrorCode code, const std::string& message,
              std::string bundle_id = {}, std::string peer_id = {})
    : std::runtime_error(message),
      code_(code),
      bundle_id_(std::move(bundle_id)),
      peer_id_(std::move(peer_id)) {}

  ErrorCode code() const { return code_; }
  const std::string& bundle_id() const { return bundle_id_; }
  const std::string& peer_id() const { return peer_id_; }

private:
  ErrorCode code_;
  std::string bundle_id_;
  std::string peer_id_;
};
