#include "peer_discovery.hpp"
#include "utils.hpp"

#include <stdexcept>

const char* discovery_outcome_name(PeerDiscovery::Outcome outcome) {
  switch(outcome) {
    case PeerDiscovery::Outcome::PeerDiscovered: return "peer-discovered";
    case PeerDiscovery::Outcome::PeerRefreshed: return "peer-refreshed";
    case PeerDiscovery::Outcome::BundleAnnounced: return "bundle-announced";
    case PeerDiscovery::Outcome::IgnoredSelf: return "ignored-self";
    case PeerDiscovery::Outcome::Stale: return "stale";
    case PeerDiscovery::Outcome::BadSignature: return "bad-signature";
    case PeerDiscovery::Outcome::UnknownSender: return "unknown-sender";
    case PeerDiscovery::Outcome::Malformed: return "malformed";
  }
  return "unknown";
}

PeerDiscovery::PeerDiscovery(asio::io_context& io,
                             std::shared_ptr<CryptoService> crypto,
                             std::shared_ptr<PeerManager> peers,
                             Options options,
                             std::shared_ptr<Logger> logger)
  : bundle_announced("bundle-announced", logger),
    io_(io),
    crypto_(std::move(crypto)),
    peers_(std::move(peers)),
    options_(std::move(options)),
    logger_(std::move(logger)),
    socket_(io),
    announce_timer_(io),
    sweep_timer_(io) {
  if(!crypto_ || !peers_) throw std::invalid_argument("PeerDiscovery needs a crypto service and a peer registry");
}

PeerDiscovery::~PeerDiscovery() {
  std::error_code ec;
  socket_.close(ec);
}

bool PeerDiscovery::open_socket() {
  std::error_code ec;
  auto group = asio::ip::make_address(options_.multicast_group, ec);
  if(ec || !group.is_multicast()) {
    log_warn(logger_.get(), "Invalid multicast group '{}'; discovery limited to manual peers", options_.multicast_group);
    return false;
  }
  auto listen = asio::ip::make_address(options_.listen_address, ec);
  if(ec) {
    log_warn(logger_.get(), "Invalid discovery listen address '{}': {}", options_.listen_address, ec.message());
    return false;
  }
  asio::ip::udp::endpoint listen_ep(listen, options_.discovery_port);
  group_endpoint_ = asio::ip::udp::endpoint(group, options_.discovery_port);

  socket_.open(listen_ep.protocol(), ec);
  if(!ec) socket_.set_option(asio::ip::udp::socket::reuse_address(true), ec);
  if(!ec) socket_.bind(listen_ep, ec);
  if(ec) {
    log_warn(logger_.get(), "Unable to bind UDP {}:{}: {}; discovery limited to manual peers",
             options_.listen_address, options_.discovery_port, ec.message());
    socket_.close(ec);
    return false;
  }
  socket_.set_option(asio::ip::multicast::join_group(group), ec);
  if(ec) {
    log_warn(logger_.get(), "Failed to join multicast group {}: {}; discovery limited to manual peers",
             options_.multicast_group, ec.message());
    socket_.close(ec);
    return false;
  }
  socket_.set_option(asio::ip::multicast::enable_loopback(true), ec);
  socket_.set_option(asio::ip::multicast::hops(1), ec);
  log_info(logger_.get(), "UDP discovery listening on {}:{} (group {})",
           options_.listen_address, options_.discovery_port, options_.multicast_group);
  return true;
}

void PeerDiscovery::start() {
  if(running_) return;
  running_ = true;
  multicast_active_ = options_.enable_multicast && open_socket();
  if(multicast_active_) {
    do_receive();
    announce_peer();
    schedule_announce();
  }
  schedule_sweep();
}

void PeerDiscovery::stop() {
  if(!running_) return;
  running_ = false;
  std::error_code ec;
  announce_timer_.cancel(ec);
  sweep_timer_.cancel(ec);
  if(socket_.is_open()) {
    if(multicast_active_) {
      socket_.set_option(asio::ip::multicast::leave_group(group_endpoint_.address()), ec);
    }
    socket_.close(ec);
  }
  multicast_active_ = false;
  log_info(logger_.get(), "UDP peer discovery stopped");
}

void PeerDiscovery::do_receive() {
  auto self = shared_from_this();
  socket_.async_receive_from(asio::buffer(recv_buf_), sender_,
    [this, self](std::error_code ec, std::size_t bytes){
      if(ec) {
        if(ec != asio::error::operation_aborted && running_) {
          log_warn(logger_.get(), "Discovery receive error: {}", ec.message());
          do_receive();
        }
        return;
      }
      auto source = sender_.address().to_string();
      auto outcome = handle_datagram(std::string(recv_buf_.data(), bytes), source);
      log_debug(logger_.get(), "Datagram from {}: {}", source, discovery_outcome_name(outcome));
      if(running_) do_receive();
    });
}

void PeerDiscovery::send(const std::string& payload) {
  if(!multicast_active_ || !socket_.is_open()) {
    log_debug(logger_.get(), "Multicast inactive; announcement not sent");
    return;
  }
  auto buffer = std::make_shared<std::string>(payload);
  auto self = shared_from_this();
  socket_.async_send_to(asio::buffer(*buffer), group_endpoint_,
    [this, self, buffer](std::error_code ec, std::size_t){
      if(ec && ec != asio::error::operation_aborted) {
        log_warn(logger_.get(), "Discovery send failed: {}", ec.message());
      }
    });
}

void PeerDiscovery::schedule_announce() {
  auto self = shared_from_this();
  announce_timer_.expires_after(options_.announce_interval);
  announce_timer_.async_wait([this, self](const std::error_code& ec){
    if(ec || !running_) return;
    announce_peer();
    schedule_announce();
  });
}

void PeerDiscovery::schedule_sweep() {
  auto self = shared_from_this();
  sweep_timer_.expires_after(options_.sweep_interval);
  sweep_timer_.async_wait([this, self](const std::error_code& ec){
    if(ec || !running_) return;
    peers_->sweep_expired();
    schedule_sweep();
  });
}

PeerAnnouncement PeerDiscovery::build_peer_announcement() const {
  PeerAnnouncement a;
  a.public_key = crypto_->public_key();
  a.id = peer_id_from_public_key(a.public_key);
  a.name = options_.display_name.empty() ? a.id : options_.display_name;
  a.port = options_.transfer_port;
  a.timestamp = crypto_->now();
  a.signature = crypto_->sign(canonical_payload(a));
  return a;
}

BundleAnnouncement PeerDiscovery::build_bundle_announcement(const std::string& bundle_id,
                                                            const std::string& bundle_name,
                                                            uint64_t bundle_size) const {
  BundleAnnouncement a;
  a.peer_id = crypto_->peer_id();
  a.bundle_id = bundle_id;
  a.bundle_name = bundle_name;
  a.bundle_size = bundle_size;
  a.timestamp = crypto_->now();
  a.signature = crypto_->sign(canonical_payload(a));
  return a;
}

void PeerDiscovery::announce_peer() {
  try {
    auto a = build_peer_announcement();
    send(serialize_discovery_message(a));
    log_debug(logger_.get(), "Announced peer {} to network", a.id);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Failed to announce peer: {}", e.what());
  }
}

void PeerDiscovery::announce_bundle(const std::string& bundle_id,
                                    const std::string& bundle_name,
                                    uint64_t bundle_size) {
  try {
    auto a = build_bundle_announcement(bundle_id, bundle_name, bundle_size);
    send(serialize_discovery_message(a));
    log_info(logger_.get(), "Announced bundle {} ({}) to network", bundle_id, bundle_name);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Failed to announce bundle {}: {}", bundle_id, e.what());
  }
}

bool PeerDiscovery::fresh(int64_t timestamp, const std::string& sender) const {
  auto now = crypto_->now();
  auto distance = ms_between(now, timestamp);
  if(timestamp <= now && distance > static_cast<uint64_t>(kAnnouncementMaxAgeMs)) {
    log_debug(logger_.get(), "Ignoring old announcement from {}", sender);
    return false;
  }
  if(timestamp > now && distance > static_cast<uint64_t>(kAnnouncementMaxAgeMs)) {
    log_debug(logger_.get(), "Ignoring future-dated announcement from {}", sender);
    return false;
  }
  return true;
}

PeerDiscovery::Outcome PeerDiscovery::handle_datagram(const std::string& payload,
                                                      const std::string& source_address) {
  DiscoveryMessage message;
  try {
    message = parse_discovery_message(payload);
  } catch(const std::invalid_argument& e) {
    log_warn(logger_.get(), "Dropping malformed discovery datagram from {}: {}", source_address, e.what());
    return Outcome::Malformed;
  }
  if(const auto* peer = std::get_if<PeerAnnouncement>(&message)) {
    return handle_peer_announcement(*peer, source_address);
  }
  return handle_bundle_announcement(std::get<BundleAnnouncement>(message));
}

PeerDiscovery::Outcome PeerDiscovery::handle_peer_announcement(const PeerAnnouncement& a,
                                                               const std::string& source_address) {
  if(a.id == crypto_->peer_id() || a.public_key == crypto_->public_key()) return Outcome::IgnoredSelf;
  if(a.id != peer_id_from_public_key(a.public_key) || a.id.size() != kPeerIdLength) {
    log_warn(logger_.get(), "Dropping peer announcement whose id {} does not match its key", a.id);
    return Outcome::Malformed;
  }
  if(!fresh(a.timestamp, a.id)) return Outcome::Stale;
  if(!crypto_->verify(canonical_payload(a), a.signature, a.public_key)) {
    log_warn(logger_.get(), "Invalid signature in peer announcement from {}", a.id);
    return Outcome::BadSignature;
  }
  PeerInfo info;
  info.id = a.id;
  info.name = a.name;
  info.address = source_address;
  info.port = a.port;
  info.public_key = a.public_key;
  info.backend = crypto_->backend_name();
  return peers_->upsert(std::move(info)) ? Outcome::PeerDiscovered : Outcome::PeerRefreshed;
}

PeerDiscovery::Outcome PeerDiscovery::handle_bundle_announcement(const BundleAnnouncement& a) {
  if(a.peer_id == crypto_->peer_id()) return Outcome::IgnoredSelf;
  if(!fresh(a.timestamp, a.peer_id)) return Outcome::Stale;
  auto sender = peers_->find(a.peer_id);
  if(!sender) {
    log_debug(logger_.get(), "Received bundle announcement from unknown peer {}", a.peer_id);
    return Outcome::UnknownSender;
  }
  if(!crypto_->verify(canonical_payload(a), a.signature, sender->public_key)) {
    log_warn(logger_.get(), "Invalid signature in bundle announcement from {}", a.peer_id);
    return Outcome::BadSignature;
  }
  log_info(logger_.get(), "Peer {} announced bundle {} ({}, {} bytes)",
           a.peer_id, a.bundle_id, a.bundle_name, a.bundle_size);
  bundle_announced.emit(a);
  return Outcome::BundleAnnounced;
}
