#pragma once
#include <asio.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bundle_codec.hpp"
#include "bundle_index.hpp"
#include "crypto_service.hpp"
#include "event_stream.hpp"
#include "http_client.hpp"
#include "http_message.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "peer_discovery.hpp"
#include "peer_manager.hpp"
#include "token_store.hpp"
#include "transfer_state.hpp"

inline constexpr uint64_t kProgressByteStep = 1024 * 1024;
inline constexpr double kProgressFractionStep = 0.05;

enum class PullMode { Full, Chunked };

const char* pull_mode_name(PullMode mode);
std::optional<PullMode> pull_mode_from_name(const std::string& name);

struct TransferConfig {
  std::string listen_ip = "0.0.0.0";
  uint16_t port = kDefaultTransferPort;
  std::size_t chunk_size = kDefaultChunkSize;
  // Token lifetime and grace period for finished transfer states.
  std::chrono::seconds transfer_timeout{300};
  PullMode pull_mode = PullMode::Full;
  std::size_t worker_threads = 2;
  std::filesystem::path temp_dir;   // empty: <tmp>/parcel/transfers
  std::string display_name;
  std::chrono::milliseconds cleanup_interval{60000};
  HttpClient::Options http;
};

struct CleanupReport {
  std::vector<std::string> bundles;
  std::size_t tokens = 0;
  std::vector<std::string> transfers;
};

struct RemoteBundle {
  std::string bundle_id;
  Manifest manifest;
  uint64_t size = 0;
  std::size_t chunks = 0;
  std::string created_at;
};

// Hosts bundles behind token-gated HTTP endpoints and pulls bundles from
// peers with progress tracking.
class TransferService {
public:
  TransferService(asio::io_context& io,
                  std::shared_ptr<CryptoService> crypto,
                  std::shared_ptr<PeerManager> peers,
                  std::shared_ptr<PeerDiscovery> discovery,
                  std::shared_ptr<BundleCodec> codec,
                  TransferConfig config,
                  std::shared_ptr<Logger> logger = nullptr);
  ~TransferService();

  TransferService(const TransferService&) = delete;
  TransferService& operator=(const TransferService&) = delete;

  // Binds the HTTP server and arms the cleanup timer.
  void start();
  // Cancels active transfers, closes the server and joins the workers.
  void stop();

  uint16_t port() const;
  const TransferConfig& config() const { return config_; }

  // ---- hosting side --------------------------------------------------------
  BundleInfo announce_bundle(const std::string& bundle_id,
                             const std::filesystem::path& bundle_path,
                             const Manifest& manifest);
  bool withdraw_bundle(const std::string& bundle_id);
  std::vector<BundleInfo> list_bundles() const;
  nlohmann::json peer_info_json() const;

  HttpResponse handle_request(const HttpRequest& request);

  // ---- pulling side --------------------------------------------------------
  // Blocks until the bundle is downloaded and verified; returns the transfer
  // id. Throws ParcelError (PeerUnavailable, BundleNotFound, TokenInvalid,
  // SignatureInvalid, TransferFailed).
  std::string request_bundle(const std::string& peer_id, const std::string& bundle_id);
  // Same pull on the worker pool. Only PeerUnavailable is thrown here.
  std::string start_request_bundle(const std::string& peer_id, const std::string& bundle_id);

  std::optional<TransferProgress> get_transfer_progress(const std::string& transfer_id) const;
  std::vector<TransferProgress> list_transfers() const;
  // Path of a completed download, while its state is kept.
  std::optional<std::filesystem::path> downloaded_bundle(const std::string& transfer_id) const;
  // False for unknown or already finished transfers.
  bool cancel_transfer(const std::string& transfer_id);
  // Drops a finished transfer and its temp file.
  bool release_transfer(const std::string& transfer_id);

  PeerInfo add_manual_peer(const std::string& address, uint16_t port, const std::string& name = {});
  std::vector<PeerInfo> discover_peers() const;
  std::vector<RemoteBundle> remote_bundles(const std::string& peer_id);

  CleanupReport cleanup_expired();

  EventStream<TransferProgress> transfer_progress;

private:
  struct TokenGrant {
    std::string token;
    uint64_t size = 0;
    std::size_t chunks = 0;
    std::size_t chunk_size = 0;
    std::string checksum;
    std::optional<SignatureEnvelope> envelope;
  };

  struct PullContext;

  PeerInfo require_live_peer(const std::string& peer_id) const;
  std::string open_transfer(const PeerInfo& peer, const std::string& bundle_id);
  void run_pull(const std::string& transfer_id, const PeerInfo& peer, const std::string& bundle_id);
  TokenGrant request_token(const PeerInfo& peer, const std::string& bundle_id);
  void pull_full(PullContext& ctx);
  void pull_chunked(PullContext& ctx);
  void verify_download(PullContext& ctx);
  void write_bytes(PullContext& ctx, const char* data, std::size_t size);
  void notify(const std::string& transfer_id);
  void maybe_notify(PullContext& ctx);
  void delete_temp(const std::filesystem::path& path);
  HttpHeaders identity_headers() const;

  HttpResponse handle_peer_info();
  HttpResponse handle_list_bundles();
  HttpResponse handle_token_request(const HttpRequest& request);
  HttpResponse handle_download(const HttpRequest& request, const std::vector<std::string>& parts);

  void schedule_cleanup();

  asio::io_context& io_;
  std::shared_ptr<CryptoService> crypto_;
  std::shared_ptr<PeerManager> peers_;
  std::shared_ptr<PeerDiscovery> discovery_;
  std::shared_ptr<BundleCodec> codec_;
  TransferConfig config_;
  std::shared_ptr<Logger> logger_;

  BundleIndex bundles_;
  TokenStore tokens_;
  TransferTable transfers_;
  HttpServer server_;
  asio::steady_timer cleanup_timer_;
  std::unique_ptr<asio::thread_pool> workers_;
  std::atomic<bool> running_{false};
};
