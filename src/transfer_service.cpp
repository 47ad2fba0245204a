#include "transfer_service.hpp"

#include <fstream>
#include <stdexcept>

#include "errors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::string encode_envelope_header(const SignatureEnvelope& envelope) {
  return base64_encode(nlohmann::json(envelope).dump());
}

SignatureEnvelope decode_envelope(const nlohmann::json& j) {
  try {
    return j.get<SignatureEnvelope>();
  } catch(const nlohmann::json::exception& e) {
    throw ParcelError(ErrorCode::SignatureInvalid, std::string("Malformed signature envelope: ") + e.what());
  } catch(const std::invalid_argument& e) {
    throw ParcelError(ErrorCode::SignatureInvalid, std::string("Malformed signature envelope: ") + e.what());
  }
}

SignatureEnvelope decode_envelope_header(const std::string& header) {
  std::string text;
  try {
    auto bytes = base64_decode(header);
    text.assign(bytes.begin(), bytes.end());
  } catch(const std::invalid_argument& e) {
    throw ParcelError(ErrorCode::SignatureInvalid, std::string("Malformed envelope header: ") + e.what());
  }
  auto doc = nlohmann::json::parse(text, nullptr, false);
  if(doc.is_discarded()) throw ParcelError(ErrorCode::SignatureInvalid, "Envelope header is not JSON");
  return decode_envelope(doc);
}

bool all_digits(const std::string& s) {
  return !s.empty() && s.size() <= 18 && s.find_first_not_of("0123456789") == std::string::npos;
}

ParcelError status_error(int status, const std::string& body, const std::string& what,
                         const std::string& bundle_id, const std::string& peer_id) {
  std::string detail = what + " failed: HTTP " + std::to_string(status);
  auto doc = nlohmann::json::parse(body, nullptr, false);
  if(doc.is_object() && doc.contains("error") && doc["error"].is_string()) {
    detail += " (" + doc["error"].get<std::string>() + ")";
  }
  switch(status) {
    case 401: return ParcelError(ErrorCode::TokenInvalid, detail, bundle_id, peer_id);
    case 404: return ParcelError(ErrorCode::BundleNotFound, detail, bundle_id, peer_id);
    default: return ParcelError(ErrorCode::TransferFailed, detail, bundle_id, peer_id);
  }
}

} // namespace

const char* pull_mode_name(PullMode mode) {
  return mode == PullMode::Chunked ? "chunked" : "full";
}

std::optional<PullMode> pull_mode_from_name(const std::string& name) {
  if(name == "full") return PullMode::Full;
  if(name == "chunked") return PullMode::Chunked;
  return std::nullopt;
}

struct TransferService::PullContext {
  std::string transfer_id;
  PeerInfo peer;
  std::string bundle_id;
  TokenGrant grant;
  fs::path temp_path;
  std::ofstream out;
  Sha256Stream hasher;
  uint64_t expected = 0;
  uint64_t written = 0;
  uint64_t last_notified = 0;
  std::size_t next_chunk = 0;
  bool track_chunks = false;
  bool cancelled = false;
  std::string header_checksum;
  std::optional<SignatureEnvelope> envelope;
};

TransferService::TransferService(asio::io_context& io,
                                 std::shared_ptr<CryptoService> crypto,
                                 std::shared_ptr<PeerManager> peers,
                                 std::shared_ptr<PeerDiscovery> discovery,
                                 std::shared_ptr<BundleCodec> codec,
                                 TransferConfig config,
                                 std::shared_ptr<Logger> logger)
  : transfer_progress("transfer-progress", logger),
    io_(io),
    crypto_(std::move(crypto)),
    peers_(std::move(peers)),
    discovery_(std::move(discovery)),
    codec_(std::move(codec)),
    config_(std::move(config)),
    logger_(std::move(logger)),
    tokens_([this]{ return crypto_->generate_token(); }),
    server_(io, config_.listen_ip, config_.port,
            [this](const HttpRequest& request){ return handle_request(request); },
            logger_),
    cleanup_timer_(io) {
  if(!crypto_ || !peers_ || !codec_) {
    throw std::invalid_argument("TransferService needs crypto, peer registry and codec");
  }
  if(config_.chunk_size == 0) throw std::invalid_argument("chunk_size must be positive");
  if(config_.worker_threads == 0) config_.worker_threads = 1;
  if(config_.temp_dir.empty()) config_.temp_dir = fs::temp_directory_path() / "parcel" / "transfers";
  workers_ = std::make_unique<asio::thread_pool>(config_.worker_threads);
}

TransferService::~TransferService() {
  stop();
  if(workers_) workers_->join();
}

void TransferService::start() {
  if(running_) return;
  if(!workers_) workers_ = std::make_unique<asio::thread_pool>(config_.worker_threads);
  server_.start();
  running_ = true;
  if(discovery_) discovery_->set_transfer_port(server_.port());
  schedule_cleanup();
  log_info(logger_.get(), "Transfer service ready on port {} (chunk size {}, pull mode {})",
           server_.port(), config_.chunk_size, pull_mode_name(config_.pull_mode));
}

void TransferService::stop() {
  if(!running_) return;
  running_ = false;
  log_info(logger_.get(), "Shutting down transfer service...");
  std::error_code ec;
  cleanup_timer_.cancel(ec);
  for(const auto& state : transfers_.list()) {
    if(state.direction == TransferDirection::Download && !is_terminal(state.status)) {
      cancel_transfer(state.transfer_id);
    }
  }
  server_.stop();
  if(workers_) {
    workers_->join();
    workers_.reset();
  }
  log_info(logger_.get(), "Transfer service shutdown complete");
}

uint16_t TransferService::port() const {
  return server_.port();
}

// ---- hosting side ----------------------------------------------------------

BundleInfo TransferService::announce_bundle(const std::string& bundle_id,
                                            const fs::path& bundle_path,
                                            const Manifest& manifest) {
  log_info(logger_.get(), "Announcing bundle {} for sharing", bundle_id);
  std::error_code ec;
  auto size = fs::file_size(bundle_path, ec);
  if(ec) {
    throw ParcelError(ErrorCode::BundleNotFound,
                      "Bundle file " + bundle_path.string() + " is not readable: " + ec.message(),
                      bundle_id);
  }

  BundleInfo info;
  info.id = bundle_id;
  info.manifest = manifest;
  info.path = bundle_path;
  info.size = size;
  info.chunk_size = config_.chunk_size;
  info.checksum = crypto_->hash_file(bundle_path);
  for(const auto& chunk : codec_->split_chunks(bundle_path, config_.chunk_size)) {
    info.chunk_checksums.push_back(chunk.checksum);
  }
  info.chunks = info.chunk_checksums.size();
  info.signature = crypto_->sign_bundle(info.checksum);
  info.created_at = crypto_->now();
  info.expires_at = info.created_at + kBundleLifetimeMs;
  bundles_.add_or_update(info);

  if(discovery_) {
    auto discovery = discovery_;
    asio::post(io_, [discovery, bundle_id, name = manifest.name, size]{
      discovery->announce_bundle(bundle_id, name, size);
    });
  }
  log_info(logger_.get(), "Bundle {} announced successfully ({} bytes, {} chunks)",
           bundle_id, info.size, info.chunks);
  return info;
}

bool TransferService::withdraw_bundle(const std::string& bundle_id) {
  if(!bundles_.remove(bundle_id)) return false;
  auto revoked = tokens_.revoke_bundle(bundle_id);
  log_info(logger_.get(), "Withdrew bundle {} ({} tokens revoked)", bundle_id, revoked);
  return true;
}

std::vector<BundleInfo> TransferService::list_bundles() const {
  return bundles_.list_active(crypto_->now());
}

nlohmann::json TransferService::peer_info_json() const {
  auto public_key = crypto_->public_key();
  auto id = peer_id_from_public_key(public_key);
  return nlohmann::json{
    {"id", id},
    {"name", config_.display_name.empty() ? id : config_.display_name},
    {"publicKey", public_key},
    {"version", kProtocolVersion},
    {"backend", crypto_->backend_name()}
  };
}

HttpResponse TransferService::handle_request(const HttpRequest& request) {
  auto parts = split_path(request.path);
  HttpResponse response;
  if(request.method == "OPTIONS") {
    response.status = 200;
  } else if(request.path == "/api/peer-info" && request.method == "GET") {
    response = handle_peer_info();
  } else if(request.path == "/api/bundles" && request.method == "GET") {
    response = handle_list_bundles();
  } else if(request.path == "/api/transfer/token" && request.method == "POST") {
    response = handle_token_request(request);
  } else if(request.method == "GET" && parts.size() >= 3 && parts.size() <= 4 &&
            parts[0] == "api" && parts[1] == "transfer") {
    response = handle_download(request, parts);
  } else {
    response = HttpResponse::error(404, "Not found");
  }
  response.set_header("Access-Control-Allow-Origin", "*");
  response.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  response.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Peer-Id");
  return response;
}

HttpResponse TransferService::handle_peer_info() {
  return HttpResponse::json(200, peer_info_json());
}

HttpResponse TransferService::handle_list_bundles() {
  auto list = nlohmann::json::array();
  for(const auto& bundle : list_bundles()) {
    list.push_back({
      {"bundleId", bundle.id},
      {"manifest", bundle.manifest},
      {"size", bundle.size},
      {"chunks", bundle.chunks},
      {"createdAt", iso8601_from_ms(bundle.created_at)}
    });
  }
  return HttpResponse::json(200, nlohmann::json{{"bundles", list}});
}

HttpResponse TransferService::handle_token_request(const HttpRequest& request) {
  auto doc = nlohmann::json::parse(request.body, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) return HttpResponse::error(400, "Body must be a JSON object");
  auto bundle_id = doc.value("bundleId", std::string());
  auto peer_id = doc.value("peerId", std::string());
  if(bundle_id.empty() || peer_id.empty()) return HttpResponse::error(400, "bundleId and peerId are required");

  auto now = crypto_->now();
  auto bundle = bundles_.find(bundle_id);
  if(!bundle || bundle->expires_at <= now) return HttpResponse::error(404, "Bundle not found");

  auto ttl = std::chrono::duration_cast<std::chrono::milliseconds>(config_.transfer_timeout).count();
  auto grant = tokens_.issue(bundle_id, peer_id, now, ttl);
  log_info(logger_.get(), "Issued transfer token for bundle {} to peer {}", bundle_id, peer_id);
  return HttpResponse::json(200, nlohmann::json{
    {"token", grant.token},
    {"size", bundle->size},
    {"chunks", bundle->chunks},
    {"chunkSize", bundle->chunk_size},
    {"checksum", bundle->checksum},
    {"envelope", bundle->signature},
    {"expiresAt", iso8601_from_ms(grant.expires_at)}
  });
}

HttpResponse TransferService::handle_download(const HttpRequest& request,
                                              const std::vector<std::string>& parts) {
  const auto& token = parts[2];
  auto requester = request.header("X-Peer-Id");
  TransferToken grant;
  auto check = requester.empty() ? TokenCheck::WrongPeer
                                 : tokens_.check(token, requester, crypto_->now(), &grant);
  if(check != TokenCheck::Valid) {
    log_warn(logger_.get(), "Rejected transfer request from {}: token {}",
             requester.empty() ? std::string("<anonymous>") : requester, token_check_name(check));
    return HttpResponse::error(401, "Invalid or expired token");
  }

  auto bundle = bundles_.find(grant.bundle_id);
  if(!bundle || bundle->expires_at <= crypto_->now()) return HttpResponse::error(404, "Bundle not found");

  HttpResponse response;
  response.set_header("Content-Type", "application/octet-stream");

  if(parts.size() == 4) {
    if(!all_digits(parts[3])) return HttpResponse::error(400, "Chunk index must be a number");
    auto index = static_cast<std::size_t>(std::stoull(parts[3]));
    if(index >= bundle->chunks) {
      auto r = HttpResponse::error(416, "Chunk index out of range");
      r.set_header("Content-Range", "bytes */" + std::to_string(bundle->size));
      return r;
    }
    uint64_t start = static_cast<uint64_t>(index) * bundle->chunk_size;
    uint64_t end = std::min<uint64_t>(start + bundle->chunk_size, bundle->size) - 1;
    response.file = FileBody{bundle->path, start, end - start + 1};
    response.set_header("Content-Range", "bytes " + std::to_string(start) + "-" +
                                         std::to_string(end) + "/" + std::to_string(bundle->size));
    response.set_header("X-Chunk-Index", std::to_string(index));
    response.set_header("X-Chunk-Checksum", bundle->chunk_checksums.at(index));
    log_debug(logger_.get(), "Serving chunk {} of bundle {} to {}", index, bundle->id, requester);
    return response;
  }

  response.file = FileBody{bundle->path, 0, bundle->size};
  response.set_header("X-Bundle-Checksum", bundle->checksum);
  response.set_header("X-Bundle-Signature", bundle->signature.signature);
  response.set_header("X-Bundle-Envelope", encode_envelope_header(bundle->signature));

  TransferState upload;
  upload.transfer_id = "upload_" + std::to_string(crypto_->now()) + "_" + random_hex(5);
  upload.bundle_id = bundle->id;
  upload.peer_id = requester;
  upload.direction = TransferDirection::Upload;
  upload.total_chunks = bundle->chunks;
  upload.total_bytes = bundle->size;
  upload.start_time = crypto_->now();
  auto upload_id = upload.transfer_id;
  transfers_.insert(std::move(upload));
  transfers_.transition(upload_id, TransferStatus::Transferring, crypto_->now());

  auto size = bundle->size;
  auto bundle_id = bundle->id;
  response.on_complete = [this, token, upload_id, size, bundle_id](bool ok){
    if(ok) {
      tokens_.revoke(token);
      transfers_.add_bytes(upload_id, size);
      transfers_.transition(upload_id, TransferStatus::Completed, crypto_->now());
      log_info(logger_.get(), "Sent bundle {} ({} bytes)", bundle_id, size);
    } else {
      transfers_.transition(upload_id, TransferStatus::Failed, crypto_->now(),
                            std::string("connection closed during upload"));
    }
    notify(upload_id);
  };
  log_info(logger_.get(), "Serving bundle {} to {}", bundle->id, requester);
  return response;
}

// ---- pulling side ----------------------------------------------------------

HttpHeaders TransferService::identity_headers() const {
  return HttpHeaders{{"X-Peer-Id", crypto_->peer_id()}};
}

PeerInfo TransferService::require_live_peer(const std::string& peer_id) const {
  auto peer = peers_->find(peer_id);
  if(!peer || !peers_->is_live(peer_id)) {
    throw ParcelError(ErrorCode::PeerUnavailable, "Peer " + peer_id + " not available", {}, peer_id);
  }
  return *peer;
}

std::string TransferService::open_transfer(const PeerInfo& peer, const std::string& bundle_id) {
  TransferState state;
  state.transfer_id = "transfer_" + std::to_string(crypto_->now()) + "_" + random_hex(5);
  state.bundle_id = bundle_id;
  state.peer_id = peer.id;
  state.direction = TransferDirection::Download;
  state.start_time = crypto_->now();
  state.temp_path = config_.temp_dir / (state.transfer_id + ".bundle");
  auto id = state.transfer_id;
  transfers_.insert(std::move(state));
  notify(id);
  return id;
}

std::string TransferService::request_bundle(const std::string& peer_id, const std::string& bundle_id) {
  log_info(logger_.get(), "Requesting bundle {} from peer {}", bundle_id, peer_id);
  auto peer = require_live_peer(peer_id);
  auto id = open_transfer(peer, bundle_id);
  run_pull(id, peer, bundle_id);
  return id;
}

std::string TransferService::start_request_bundle(const std::string& peer_id, const std::string& bundle_id) {
  if(!workers_) throw std::runtime_error("Transfer service is stopped");
  log_info(logger_.get(), "Queueing bundle {} from peer {}", bundle_id, peer_id);
  auto peer = require_live_peer(peer_id);
  auto id = open_transfer(peer, bundle_id);
  asio::post(*workers_, [this, id, peer, bundle_id]{
    try {
      run_pull(id, peer, bundle_id);
    } catch(const ParcelError& e) {
      log_error(logger_.get(), "Background transfer {} failed [{}]: {}", id, error_code_name(e.code()), e.what());
    }
  });
  return id;
}

TransferService::TokenGrant TransferService::request_token(const PeerInfo& peer, const std::string& bundle_id) {
  HttpClient client(logger_, config_.http);
  auto response = client.post_json(peer.address, peer.port, "/api/transfer/token",
                                   nlohmann::json{{"bundleId", bundle_id}, {"peerId", crypto_->peer_id()}},
                                   identity_headers());
  if(response.head.status != 200) {
    throw status_error(response.head.status, response.body, "Token request", bundle_id, peer.id);
  }
  auto doc = nlohmann::json::parse(response.body, nullptr, false);
  if(!doc.is_object()) {
    throw ParcelError(ErrorCode::TransferFailed, "Malformed token response", bundle_id, peer.id);
  }
  TokenGrant grant;
  try {
    grant.token = doc.at("token").get<std::string>();
    grant.size = doc.at("size").get<uint64_t>();
    grant.chunks = doc.at("chunks").get<std::size_t>();
    grant.chunk_size = doc.value("chunkSize", config_.chunk_size);
    grant.checksum = doc.value("checksum", std::string());
  } catch(const nlohmann::json::exception& e) {
    throw ParcelError(ErrorCode::TransferFailed, std::string("Malformed token response: ") + e.what(),
                      bundle_id, peer.id);
  }
  if(doc.contains("envelope") && doc["envelope"].is_object()) grant.envelope = decode_envelope(doc["envelope"]);
  if(grant.token.empty() || grant.chunk_size == 0) {
    throw ParcelError(ErrorCode::TransferFailed, "Malformed token response", bundle_id, peer.id);
  }
  return grant;
}

void TransferService::run_pull(const std::string& transfer_id, const PeerInfo& peer, const std::string& bundle_id) {
  PullContext ctx;
  ctx.transfer_id = transfer_id;
  ctx.peer = peer;
  ctx.bundle_id = bundle_id;
  if(auto state = transfers_.find(transfer_id)) ctx.temp_path = state->temp_path;

  auto fail = [&](const std::string& message) {
    if(ctx.out.is_open()) ctx.out.close();
    delete_temp(ctx.temp_path);
    if(transfers_.transition(transfer_id, TransferStatus::Failed, crypto_->now(), message)) {
      notify(transfer_id);
    }
    log_error(logger_.get(), "Failed to request bundle {} from peer {}: {}", bundle_id, peer.id, message);
  };

  try {
    ctx.grant = request_token(peer, bundle_id);
    ctx.expected = ctx.grant.size;
    transfers_.set_totals(transfer_id, ctx.grant.size, ctx.grant.chunks);
    if(!transfers_.transition(transfer_id, TransferStatus::Transferring, crypto_->now())) {
      throw ParcelError(ErrorCode::TransferFailed, "Transfer " + transfer_id + " cancelled", bundle_id, peer.id);
    }
    notify(transfer_id);
    log_info(logger_.get(), "Starting download of bundle {} from {}:{}", bundle_id, peer.address, peer.port);

    std::error_code ec;
    fs::create_directories(ctx.temp_path.parent_path(), ec);
    ctx.out.open(ctx.temp_path, std::ios::binary | std::ios::trunc);
    if(!ctx.out) {
      throw ParcelError(ErrorCode::TransferFailed, "Unable to open " + ctx.temp_path.string(), bundle_id, peer.id);
    }

    if(config_.pull_mode == PullMode::Chunked && ctx.grant.chunks > 0) {
      pull_chunked(ctx);
    } else {
      pull_full(ctx);
    }
    if(ctx.cancelled) {
      throw ParcelError(ErrorCode::TransferFailed, "Transfer " + transfer_id + " cancelled", bundle_id, peer.id);
    }
    ctx.out.close();
    if(!ctx.out) {
      throw ParcelError(ErrorCode::TransferFailed, "Unable to finish writing " + ctx.temp_path.string(),
                        bundle_id, peer.id);
    }
    verify_download(ctx);
    if(!transfers_.transition(transfer_id, TransferStatus::Completed, crypto_->now())) {
      throw ParcelError(ErrorCode::TransferFailed, "Transfer " + transfer_id + " cancelled", bundle_id, peer.id);
    }
    notify(transfer_id);
    log_info(logger_.get(), "Bundle {} downloaded successfully", bundle_id);
  } catch(const ParcelError& e) {
    fail(e.what());
    throw;
  } catch(const std::exception& e) {
    fail(e.what());
    throw ParcelError(ErrorCode::TransferFailed, e.what(), bundle_id, peer.id);
  }
}

void TransferService::pull_full(PullContext& ctx) {
  HttpClient client(logger_, config_.http);
  int status = 0;
  std::string error_body;
  ctx.track_chunks = true;
  client.get_stream(ctx.peer.address, ctx.peer.port, "/api/transfer/" + ctx.grant.token, identity_headers(),
    [&](const HttpResponseHead& head){
      status = head.status;
      if(status != 200) return true;
      ctx.header_checksum = head.header("X-Bundle-Checksum");
      auto envelope = head.header("X-Bundle-Envelope");
      if(!envelope.empty()) ctx.envelope = decode_envelope_header(envelope);
      if(auto length = head.content_length()) {
        if(*length != ctx.grant.size) {
          log_warn(logger_.get(), "Peer announced {} bytes but is sending {}", ctx.grant.size, *length);
        }
        ctx.expected = *length;
        transfers_.set_totals(ctx.transfer_id, *length, BundleCodec::chunk_count(*length, ctx.grant.chunk_size));
      }
      return true;
    },
    [&](const char* data, std::size_t size){
      if(status != 200) {
        error_body.append(data, size);
        return error_body.size() < 4096;
      }
      write_bytes(ctx, data, size);
      return !ctx.cancelled;
    });
  if(status != 200) throw status_error(status, error_body, "Download", ctx.bundle_id, ctx.peer.id);
}

void TransferService::pull_chunked(PullContext& ctx) {
  HttpClient client(logger_, config_.http);
  const auto base = "/api/transfer/" + ctx.grant.token + "/";
  for(std::size_t index = 0; index < ctx.grant.chunks; ++index) {
    int status = 0;
    std::string chunk_index;
    std::string chunk_checksum;
    std::string body;
    bool complete = client.get_stream(ctx.peer.address, ctx.peer.port, base + std::to_string(index),
      identity_headers(),
      [&](const HttpResponseHead& head){
        status = head.status;
        chunk_index = head.header("X-Chunk-Index");
        chunk_checksum = head.header("X-Chunk-Checksum");
        return true;
      },
      [&](const char* data, std::size_t size){
        body.append(data, size);
        return body.size() <= ctx.grant.chunk_size;
      });
    if(status != 200) throw status_error(status, body, "Chunk " + std::to_string(index), ctx.bundle_id, ctx.peer.id);
    uint64_t offset = static_cast<uint64_t>(index) * ctx.grant.chunk_size;
    uint64_t want = std::min<uint64_t>(ctx.grant.chunk_size, ctx.grant.size - offset);
    if(!complete || body.size() != want) {
      throw ParcelError(ErrorCode::TransferFailed,
                        "Chunk " + std::to_string(index) + " has " + std::to_string(body.size()) +
                        " bytes, expected " + std::to_string(want), ctx.bundle_id, ctx.peer.id);
    }
    if(chunk_index != std::to_string(index)) {
      throw ParcelError(ErrorCode::TransferFailed, "Peer answered chunk '" + chunk_index +
                        "' for request " + std::to_string(index), ctx.bundle_id, ctx.peer.id);
    }
    if(chunk_checksum.empty() || sha256_hex(body) != chunk_checksum) {
      throw ParcelError(ErrorCode::TransferFailed, "Checksum mismatch for chunk " + std::to_string(index),
                        ctx.bundle_id, ctx.peer.id);
    }
    write_bytes(ctx, body.data(), body.size());
    if(ctx.cancelled) return;
    transfers_.complete_chunk(ctx.transfer_id, index);
  }
}

void TransferService::write_bytes(PullContext& ctx, const char* data, std::size_t size) {
  if(!transfers_.add_bytes(ctx.transfer_id, size)) {
    ctx.cancelled = true;
    return;
  }
  ctx.out.write(data, static_cast<std::streamsize>(size));
  if(!ctx.out) throw std::runtime_error("write to " + ctx.temp_path.string() + " failed");
  ctx.hasher.update(data, size);
  ctx.written += size;
  if(ctx.track_chunks && ctx.grant.chunk_size > 0) {
    while(ctx.next_chunk < ctx.grant.chunks &&
          (static_cast<uint64_t>(ctx.next_chunk + 1) * ctx.grant.chunk_size <= ctx.written ||
           ctx.written >= ctx.expected)) {
      transfers_.complete_chunk(ctx.transfer_id, ctx.next_chunk++);
    }
  }
  maybe_notify(ctx);
}

void TransferService::maybe_notify(PullContext& ctx) {
  uint64_t delta = ctx.written - ctx.last_notified;
  bool by_bytes = delta >= kProgressByteStep;
  bool by_fraction = ctx.expected > 0 &&
                     static_cast<double>(delta) / static_cast<double>(ctx.expected) >= kProgressFractionStep;
  if(by_bytes || by_fraction) {
    ctx.last_notified = ctx.written;
    notify(ctx.transfer_id);
  }
}

void TransferService::verify_download(PullContext& ctx) {
  auto actual = ctx.hasher.finish_hex();
  if(ctx.written != ctx.expected) {
    throw ParcelError(ErrorCode::TransferFailed,
                      "Received " + std::to_string(ctx.written) + " of " + std::to_string(ctx.expected) + " bytes",
                      ctx.bundle_id, ctx.peer.id);
  }
  auto expected = ctx.header_checksum.empty() ? ctx.grant.checksum : ctx.header_checksum;
  if(expected.empty()) {
    throw ParcelError(ErrorCode::SignatureInvalid, "Peer sent no bundle checksum", ctx.bundle_id, ctx.peer.id);
  }
  if(!ctx.grant.checksum.empty() && ctx.grant.checksum != expected) {
    throw ParcelError(ErrorCode::TransferFailed, "Peer announced two different checksums", ctx.bundle_id, ctx.peer.id);
  }
  if(actual != expected) {
    throw ParcelError(ErrorCode::TransferFailed, "Checksum mismatch: expected " + expected + ", got " + actual,
                      ctx.bundle_id, ctx.peer.id);
  }
  auto envelope = ctx.envelope ? ctx.envelope : ctx.grant.envelope;
  if(!envelope) {
    throw ParcelError(ErrorCode::SignatureInvalid, "Peer sent no signature envelope", ctx.bundle_id, ctx.peer.id);
  }
  if(envelope->public_key != ctx.peer.public_key) {
    throw ParcelError(ErrorCode::SignatureInvalid, "Bundle was signed by a key other than the peer's",
                      ctx.bundle_id, ctx.peer.id);
  }
  if(!crypto_->verify_bundle_signature(actual, *envelope)) {
    throw ParcelError(ErrorCode::SignatureInvalid, "Bundle signature did not verify", ctx.bundle_id, ctx.peer.id);
  }
}

void TransferService::notify(const std::string& transfer_id) {
  if(auto progress = transfers_.progress(transfer_id, crypto_->now())) {
    transfer_progress.emit(*progress);
  }
}

void TransferService::delete_temp(const fs::path& path) {
  if(path.empty()) return;
  std::error_code ec;
  if(fs::remove(path, ec) || !ec) return;
  log_warn(logger_.get(), "Failed to clean up temp file {}: {}", path.string(), ec.message());
}

std::optional<TransferProgress> TransferService::get_transfer_progress(const std::string& transfer_id) const {
  return transfers_.progress(transfer_id, crypto_->now());
}

std::vector<TransferProgress> TransferService::list_transfers() const {
  std::vector<TransferProgress> out;
  auto now = crypto_->now();
  for(const auto& state : transfers_.list()) out.push_back(TransferProgress::from(state, now));
  return out;
}

std::optional<fs::path> TransferService::downloaded_bundle(const std::string& transfer_id) const {
  auto state = transfers_.find(transfer_id);
  if(!state || state->direction != TransferDirection::Download ||
     state->status != TransferStatus::Completed) {
    return std::nullopt;
  }
  return state->temp_path;
}

bool TransferService::cancel_transfer(const std::string& transfer_id) {
  auto now = crypto_->now();
  if(!transfers_.transition(transfer_id, TransferStatus::Cancelled, now)) return false;
  log_info(logger_.get(), "Cancelling transfer {}", transfer_id);
  auto state = transfers_.remove(transfer_id);
  if(!state) return true;
  delete_temp(state->temp_path);
  transfer_progress.emit(TransferProgress::from(*state, now));
  return true;
}

bool TransferService::release_transfer(const std::string& transfer_id) {
  auto state = transfers_.find(transfer_id);
  if(!state || !is_terminal(state->status)) return false;
  transfers_.remove(transfer_id);
  delete_temp(state->temp_path);
  return true;
}

PeerInfo TransferService::add_manual_peer(const std::string& address, uint16_t port, const std::string& name) {
  log_info(logger_.get(), "Adding manual peer at {}:{}", address, port);
  HttpClient client(logger_, config_.http);
  HttpClient::Response response;
  try {
    response = client.get(address, port, "/api/peer-info");
  } catch(const std::exception& e) {
    throw ParcelError(ErrorCode::PeerUnavailable,
                      "Peer info request to " + address + ":" + std::to_string(port) + " failed: " + e.what());
  }
  if(response.head.status != 200) {
    throw ParcelError(ErrorCode::PeerUnavailable,
                      "Peer info request failed: HTTP " + std::to_string(response.head.status));
  }
  auto doc = nlohmann::json::parse(response.body, nullptr, false);
  PeerInfo info;
  try {
    if(!doc.is_object()) throw std::invalid_argument("not a JSON object");
    info.id = doc.at("id").get<std::string>();
    info.name = doc.value("name", info.id);
    info.public_key = doc.at("publicKey").get<std::string>();
    info.backend = doc.value("backend", std::string());
  } catch(const std::exception& e) {
    throw ParcelError(ErrorCode::PeerUnavailable, std::string("Malformed peer info: ") + e.what());
  }
  if(info.id.size() != kPeerIdLength || info.id != peer_id_from_public_key(info.public_key)) {
    throw ParcelError(ErrorCode::PeerUnavailable, "Peer id " + info.id + " does not match its public key",
                      {}, info.id);
  }
  if(info.id == crypto_->peer_id()) {
    throw std::invalid_argument(address + ":" + std::to_string(port) + " is this node");
  }
  if(!name.empty()) info.name = name;
  info.address = address;
  info.port = port;
  info.manual = true;
  peers_->upsert(info);
  log_info(logger_.get(), "Manual peer added: {} ({})", info.name, info.id);
  return peers_->find(info.id).value_or(info);
}

std::vector<PeerInfo> TransferService::discover_peers() const {
  std::vector<PeerInfo> live;
  for(auto& peer : peers_->list()) {
    if(peers_->is_live(peer.id)) live.push_back(std::move(peer));
  }
  return live;
}

std::vector<RemoteBundle> TransferService::remote_bundles(const std::string& peer_id) {
  auto peer = require_live_peer(peer_id);
  HttpClient client(logger_, config_.http);
  HttpClient::Response response;
  try {
    response = client.get(peer.address, peer.port, "/api/bundles", identity_headers());
  } catch(const std::exception& e) {
    throw ParcelError(ErrorCode::PeerUnavailable, std::string("Bundle listing failed: ") + e.what(), {}, peer_id);
  }
  if(response.head.status != 200) {
    throw ParcelError(ErrorCode::PeerUnavailable,
                      "Bundle listing failed: HTTP " + std::to_string(response.head.status), {}, peer_id);
  }
  std::vector<RemoteBundle> out;
  try {
    auto doc = nlohmann::json::parse(response.body);
    for(const auto& entry : doc.at("bundles")) {
      RemoteBundle b;
      b.bundle_id = entry.at("bundleId").get<std::string>();
      b.manifest = entry.at("manifest").get<Manifest>();
      b.size = entry.at("size").get<uint64_t>();
      b.chunks = entry.at("chunks").get<std::size_t>();
      b.created_at = entry.value("createdAt", std::string());
      out.push_back(std::move(b));
    }
  } catch(const std::exception& e) {
    throw ParcelError(ErrorCode::PeerUnavailable, std::string("Malformed bundle listing: ") + e.what(), {}, peer_id);
  }
  return out;
}

CleanupReport TransferService::cleanup_expired() {
  CleanupReport report;
  auto now = crypto_->now();
  report.bundles = bundles_.sweep_expired(now);
  for(const auto& id : report.bundles) tokens_.revoke_bundle(id);
  report.tokens = tokens_.sweep_expired(now);
  auto grace = std::chrono::duration_cast<std::chrono::milliseconds>(config_.transfer_timeout).count();
  for(auto& state : transfers_.reap_terminal(now, grace)) {
    if(state.direction == TransferDirection::Download) delete_temp(state.temp_path);
    report.transfers.push_back(state.transfer_id);
  }
  if(!report.bundles.empty() || report.tokens > 0 || !report.transfers.empty()) {
    log_info(logger_.get(), "Cleanup removed {} bundles, {} tokens, {} transfers",
             report.bundles.size(), report.tokens, report.transfers.size());
  }
  return report;
}

void TransferService::schedule_cleanup() {
  cleanup_timer_.expires_after(config_.cleanup_interval);
  cleanup_timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    try {
      cleanup_expired();
    } catch(const std::exception& e) {
      log_error(logger_.get(), "Cleanup failed: {}", e.what());
    }
    schedule_cleanup();
  });
}
