#pragma once

#include <asio.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bundle_codec.hpp"
#include "bundle_index.hpp"
#include "crypto_service.hpp"
#include "log.hpp"

class NodeCLI;
class PeerDiscovery;
class PeerManager;
class SettingsManager;
class TransferService;

// One Parcel node: owns the io_context, the settings, the logger and one
// instance of every service, and sequences them for share and import.
class NodeEngine {
public:
  struct Options {
    std::string display_name;
    bool start_cli_thread = false;
    // Empty uses the data_dir setting.
    std::filesystem::path data_dir;
    CryptoService::Clock clock;
  };

  struct ShareResult {
    BundleResult encoded;
    BundleInfo bundle;
  };

  struct ImportResult {
    std::string transfer_id;
    ExtractResult extracted;
  };

  NodeEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~NodeEngine();

  void start();
  void run();
  void start_background();
  void stop();

  // Encodes `project_root` (manifest from <root>/parcel.json unless given),
  // signs it and announces it to peers.
  ShareResult share_project(const std::filesystem::path& project_root,
                            std::optional<Manifest> manifest = std::nullopt,
                            const std::vector<std::string>& exclude = {});

  // Pulls a bundle from a peer and extracts it into `destination`.
  ImportResult import_bundle(const std::string& peer_id,
                             const std::string& bundle_id,
                             const std::filesystem::path& destination,
                             bool overwrite = false);

  // False when the command failed or was not recognised.
  bool execute_command(const std::string& line);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<CryptoService> crypto() const { return crypto_; }
  std::shared_ptr<PeerManager> peers() const { return peers_; }
  std::shared_ptr<PeerDiscovery> discovery() const { return discovery_; }
  std::shared_ptr<BundleCodec> codec() const { return codec_; }
  TransferService* transfer() const { return transfer_.get(); }

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t live_peers = 0;
    std::size_t hosted_bundles = 0;
    std::size_t transfers = 0;
  };

  Stats stats() const;

  bool started() const { return started_; }
  uint16_t transfer_port() const;
  std::string peer_id() const;
  const std::string& display_name() const { return display_name_; }
  const std::filesystem::path& data_dir() const { return data_dir_; }
  std::filesystem::path bundle_dir() const { return data_dir_ / "bundles"; }

private:
  void ensure_data_dir() const;
  void add_configured_peers();
  void start_cli();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::filesystem::path data_dir_;
  std::string display_name_;
  asio::io_context io_;
  std::thread io_thread_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<CryptoService> crypto_;
  std::shared_ptr<PeerManager> peers_;
  std::shared_ptr<BundleCodec> codec_;
  std::shared_ptr<PeerDiscovery> discovery_;
  std::unique_ptr<TransferService> transfer_;
  std::unique_ptr<NodeCLI> cli_;
  bool started_ = false;
  bool cli_thread_running_ = false;
};
