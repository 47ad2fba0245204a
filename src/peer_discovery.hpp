#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "crypto_service.hpp"
#include "event_stream.hpp"
#include "log.hpp"
#include "peer_manager.hpp"
#include "protocol.hpp"

// Signed announce/listen protocol over UDP multicast. Keeps the PeerManager
// registry fresh; when the socket cannot be bound or the group joined, the
// node keeps running with manually added peers only.
class PeerDiscovery : public std::enable_shared_from_this<PeerDiscovery> {
public:
  struct Options {
    std::string multicast_group = kDefaultMulticastGroup;
    uint16_t discovery_port = kDefaultDiscoveryPort;
    std::string listen_address = "0.0.0.0";
    std::string display_name;
    uint16_t transfer_port = kDefaultTransferPort;
    std::chrono::milliseconds announce_interval{30000};
    std::chrono::milliseconds sweep_interval{30000};
    bool enable_multicast = true;
  };

  enum class Outcome {
    PeerDiscovered,
    PeerRefreshed,
    BundleAnnounced,
    IgnoredSelf,
    Stale,
    BadSignature,
    UnknownSender,
    Malformed
  };

  PeerDiscovery(asio::io_context& io,
                std::shared_ptr<CryptoService> crypto,
                std::shared_ptr<PeerManager> peers,
                Options options,
                std::shared_ptr<Logger> logger = nullptr);
  ~PeerDiscovery();

  void start();
  void stop();

  bool running() const { return running_; }
  bool multicast_active() const { return multicast_active_; }
  const Options& options() const { return options_; }
  void set_transfer_port(uint16_t port) { options_.transfer_port = port; }

  PeerAnnouncement build_peer_announcement() const;
  BundleAnnouncement build_bundle_announcement(const std::string& bundle_id,
                                               const std::string& bundle_name,
                                               uint64_t bundle_size) const;

  void announce_peer();
  void announce_bundle(const std::string& bundle_id,
                       const std::string& bundle_name,
                       uint64_t bundle_size);

  // Applies one inbound datagram as if it arrived from `source_address`.
  Outcome handle_datagram(const std::string& payload, const std::string& source_address);

  std::shared_ptr<PeerManager> peers() const { return peers_; }

  EventStream<BundleAnnouncement> bundle_announced;

private:
  bool open_socket();
  void do_receive();
  void send(const std::string& payload);
  void schedule_announce();
  void schedule_sweep();
  bool fresh(int64_t timestamp, const std::string& sender) const;

  Outcome handle_peer_announcement(const PeerAnnouncement& a, const std::string& source_address);
  Outcome handle_bundle_announcement(const BundleAnnouncement& a);

  asio::io_context& io_;
  std::shared_ptr<CryptoService> crypto_;
  std::shared_ptr<PeerManager> peers_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::ip::udp::socket socket_;
  asio::ip::udp::endpoint group_endpoint_;
  asio::ip::udp::endpoint sender_;
  std::array<char, kMaxDatagramBytes> recv_buf_{};
  asio::steady_timer announce_timer_;
  asio::steady_timer sweep_timer_;
  std::atomic<bool> running_{false};
  std::atomic<bool> multicast_active_{false};
};

const char* discovery_outcome_name(PeerDiscovery::Outcome outcome);
