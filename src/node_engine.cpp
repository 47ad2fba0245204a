#include "node_engine.hpp"

#include <stdexcept>

#include "errors.hpp"
#include "node_cli.hpp"
#include "peer_discovery.hpp"
#include "peer_manager.hpp"
#include "settings_manager.hpp"
#include "transfer_service.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::optional<CryptoBackend> backend_setting(const std::string& value) {
  if(value == "auto") return std::nullopt;
  auto backend = crypto_backend_from_name(value);
  if(!backend) throw std::runtime_error("Invalid crypto_backend '" + value + "'");
  return backend;
}

uint16_t port_setting(const SettingsManager& settings, const std::string& key) {
  auto value = settings.get<int>(key);
  if(value < 0 || value > 65535) throw std::runtime_error("Invalid " + key + " '" + std::to_string(value) + "'");
  return static_cast<uint16_t>(value);
}

} // namespace

NodeEngine::NodeEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("parcel")) {
  data_dir_ = options_.data_dir.empty()
    ? fs::path(settings_->get<std::string>("data_dir"))
    : options_.data_dir;
  if(data_dir_.empty()) data_dir_ = fs::current_path() / ".parcel";
}

NodeEngine::~NodeEngine() {
  stop();
}

void NodeEngine::ensure_data_dir() const {
  std::error_code ec;
  fs::create_directories(data_dir_ / ".config", ec);
  if(ec) throw std::runtime_error("Unable to create " + data_dir_.string() + ": " + ec.message());
  fs::create_directories(bundle_dir(), ec);
}

void NodeEngine::start() {
  if(started_) return;

  ensure_data_dir();
  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(data_dir_ / ".config" / "settings.json");
  }

  LogOptions log_options;
  log_options.verbose = settings_->get<bool>("verbose");
  log_options.log_file = settings_->get<std::string>("log_file");
  init(log_options);

  CryptoService::Options crypto_options;
  crypto_options.backend = backend_setting(settings_->get<std::string>("crypto_backend"));
  crypto_options.clock = options_.clock;
  crypto_ = std::make_shared<CryptoService>(logger_, crypto_options);
  crypto_->load_or_create_identity(data_dir_ / ".config" / "identity.json");

  display_name_ = options_.display_name;
  if(display_name_.empty()) display_name_ = settings_->get<std::string>("display_name");
  if(display_name_.empty()) display_name_ = "parcel-" + crypto_->peer_id();
  logger_->set_name(display_name_);
  if(log_options.verbose) logger_->debug("Verbose logging enabled");

  auto crypto = crypto_;
  peers_ = std::make_shared<PeerManager>(logger_, [crypto]{ return crypto->now(); });
  codec_ = std::make_shared<BundleCodec>(logger_);

  PeerDiscovery::Options discovery_options;
  discovery_options.multicast_group = settings_->get<std::string>("multicast_group");
  discovery_options.discovery_port = port_setting(*settings_, "discovery_port");
  discovery_options.display_name = display_name_;
  discovery_options.enable_multicast = settings_->get<bool>("discovery");
  discovery_ = std::make_shared<PeerDiscovery>(io_, crypto_, peers_, discovery_options, logger_);

  TransferConfig transfer_config;
  transfer_config.listen_ip = settings_->get<std::string>("listen_ip");
  transfer_config.port = port_setting(*settings_, "transfer_port");
  transfer_config.chunk_size = static_cast<std::size_t>(settings_->get<long long>("chunk_size"));
  transfer_config.transfer_timeout = std::chrono::seconds(settings_->get<long long>("transfer_timeout"));
  auto mode = pull_mode_from_name(settings_->get<std::string>("pull_mode"));
  if(!mode) throw std::runtime_error("Invalid pull_mode '" + settings_->get<std::string>("pull_mode") + "'");
  transfer_config.pull_mode = *mode;
  transfer_config.worker_threads = static_cast<std::size_t>(settings_->get<int>("worker_threads"));
  transfer_config.temp_dir = data_dir_ / "transfers";
  transfer_config.display_name = display_name_;
  transfer_ = std::make_unique<TransferService>(io_, crypto_, peers_, discovery_, codec_,
                                                transfer_config, logger_);

  transfer_->start();
  discovery_->start();
  started_ = true;

  logger_->info("Node {} ({}) up; transfers on port {}, crypto backend {}",
                display_name_, crypto_->peer_id(), transfer_->port(), crypto_->backend_name());
  if(!crypto_->non_repudiable()) {
    logger_->warn("Ed25519 unavailable: signatures only detect corruption, not forgery");
  }

  add_configured_peers();

  cli_ = std::make_unique<NodeCLI>(*this, settings_);
  if(options_.start_cli_thread) start_cli();
}

void NodeEngine::add_configured_peers() {
  auto configured = settings_->get<std::string>("manual_peer");
  std::size_t start = 0;
  while(start < configured.size()) {
    auto end = configured.find(',', start);
    if(end == std::string::npos) end = configured.size();
    auto entry = trim_copy(configured.substr(start, end - start));
    start = end + 1;
    if(entry.empty()) continue;
    auto colon = entry.rfind(':');
    if(colon == std::string::npos) {
      logger_->error("Manual peer must be host:port (got '{}')", entry);
      continue;
    }
    try {
      auto port = std::stoi(entry.substr(colon + 1));
      if(port <= 0 || port > 65535) throw std::out_of_range("port out of range");
      transfer_->add_manual_peer(entry.substr(0, colon), static_cast<uint16_t>(port));
    } catch(const std::exception& e) {
      logger_->warn("Unable to add manual peer {}: {}", entry, e.what());
    }
  }
}

void NodeEngine::run() {
  if(!started_) start();
  io_.run();
}

void NodeEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void NodeEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
    cli_thread_running_ = false;
  }
  // Sockets and timers belong to the io thread; halt it before closing them.
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();

  if(discovery_) discovery_->stop();
  if(transfer_) transfer_->stop();
  io_.poll();
  io_.restart();
  logger_->info("Node {} stopped", display_name_);
}

NodeEngine::ShareResult NodeEngine::share_project(const fs::path& project_root,
                                                  std::optional<Manifest> manifest,
                                                  const std::vector<std::string>& exclude) {
  if(!started_) throw std::runtime_error("Node is not running");
  std::error_code ec;
  if(!fs::is_directory(project_root, ec)) {
    throw std::invalid_argument(project_root.string() + " is not a directory");
  }
  if(!manifest) {
    auto manifest_path = project_root / "parcel.json";
    if(!fs::exists(manifest_path, ec)) {
      throw ParcelError(ErrorCode::InvalidManifest, "No manifest given and " + manifest_path.string() + " is missing");
    }
    manifest = load_manifest_file(manifest_path.string());
  }

  std::string bundle_id = "bundle_" + std::to_string(crypto_->now()) + "_" + random_hex(5);
  BundleOptions options;
  options.project_root = project_root;
  options.manifest = *manifest;
  options.output_path = bundle_dir() / (bundle_id + ".bundle");
  options.exclude = exclude;

  ShareResult result;
  result.encoded = codec_->create_bundle(options);
  try {
    result.bundle = transfer_->announce_bundle(bundle_id, result.encoded.path, *manifest);
  } catch(const std::exception& e) {
    logger_->error("Announcing {} failed: {}", bundle_id, e.what());
    fs::remove(result.encoded.path, ec);
    throw;
  }
  logger_->info("Shared {} {} as {} ({} files, {} bytes)",
                manifest->name, manifest->version, bundle_id, result.encoded.file_count, result.encoded.size);
  return result;
}

NodeEngine::ImportResult NodeEngine::import_bundle(const std::string& peer_id,
                                                   const std::string& bundle_id,
                                                   const fs::path& destination,
                                                   bool overwrite) {
  if(!started_) throw std::runtime_error("Node is not running");
  ImportResult result;
  result.transfer_id = transfer_->request_bundle(peer_id, bundle_id);
  auto bundle_path = transfer_->downloaded_bundle(result.transfer_id);
  if(!bundle_path) {
    throw ParcelError(ErrorCode::TransferFailed, "Transfer " + result.transfer_id + " finished without a bundle",
                      bundle_id, peer_id);
  }
  ExtractOptions options;
  options.bundle_path = *bundle_path;
  options.destination = destination;
  options.overwrite = overwrite;
  options.write_manifest_file = true;
  try {
    result.extracted = codec_->extract_bundle(options);
  } catch(const std::exception& e) {
    logger_->error("Extracting {} into {} failed: {}", bundle_id, destination.string(), e.what());
    transfer_->release_transfer(result.transfer_id);
    throw;
  }
  transfer_->release_transfer(result.transfer_id);
  logger_->info("Imported {} from {} into {} ({} files)",
                bundle_id, peer_id, destination.string(), result.extracted.file_count);
  return result;
}

void NodeEngine::start_cli() {
  if(!cli_ || cli_thread_running_) return;
  cli_->set_quit_handler([this]{ io_.stop(); });
  cli_->start();
  cli_thread_running_ = true;
}

bool NodeEngine::execute_command(const std::string& line) {
  if(!cli_) return false;
  return cli_->execute_command(line);
}

uint16_t NodeEngine::transfer_port() const {
  return transfer_ ? transfer_->port() : 0;
}

std::string NodeEngine::peer_id() const {
  return crypto_ ? crypto_->peer_id() : std::string();
}

NodeEngine::Stats NodeEngine::stats() const {
  Stats s;
  if(peers_) {
    s.known_peers = peers_->known_peer_count();
  }
  if(transfer_) {
    s.live_peers = transfer_->discover_peers().size();
    s.hosted_bundles = transfer_->list_bundles().size();
    s.transfers = transfer_->list_transfers().size();
  }
  return s;
}
