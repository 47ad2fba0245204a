#include "crypto_service.hpp"
#include "peer_discovery.hpp"
#include "peer_manager.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

using parcel::test::ManualClock;
using parcel::test::TestContext;

// One simulated node: its own clock, identity, registry and discovery.
struct Node {
  ManualClock clock;
  std::shared_ptr<CryptoService> crypto;
  std::shared_ptr<PeerManager> peers;
  std::shared_ptr<PeerDiscovery> discovery;

  Node(asio::io_context& io, const std::string& name, int64_t start_ms = 1700000000000LL)
    : clock(start_ms) {
    CryptoService::Options crypto_options;
    crypto_options.clock = clock.fn();
    crypto = std::make_shared<CryptoService>(nullptr, crypto_options);
    peers = std::make_shared<PeerManager>(nullptr, clock.fn());
    PeerDiscovery::Options options;
    options.display_name = name;
    options.transfer_port = 9100;
    options.enable_multicast = false;
    discovery = std::make_shared<PeerDiscovery>(io, crypto, peers, options);
  }

  std::string peer_datagram() const {
    return serialize_discovery_message(discovery->build_peer_announcement());
  }
};

bool test_discovers_and_refreshes_peer(TestContext&) {
  asio::io_context io;
  Node local(io, "local");
  Node remote(io, "remote");

  int discovered = 0;
  local.peers->peer_discovered.subscribe([&](const PeerInfo&){ ++discovered; });

  auto outcome = local.discovery->handle_datagram(remote.peer_datagram(), "10.0.0.7");
  PARCEL_CHECK(outcome == PeerDiscovery::Outcome::PeerDiscovered);
  auto peer = local.peers->find(remote.crypto->peer_id());
  PARCEL_CHECK(peer.has_value());
  PARCEL_CHECK(peer->name == "remote");
  PARCEL_CHECK(peer->address == "10.0.0.7");
  PARCEL_CHECK(peer->port == 9100);
  PARCEL_CHECK(peer->public_key == remote.crypto->public_key());
  PARCEL_CHECK(peer->base_url() == "http://10.0.0.7:9100");
  PARCEL_CHECK(!peer->manual);

  local.clock.advance(10000);
  remote.clock.advance(10000);
  outcome = local.discovery->handle_datagram(remote.peer_datagram(), "10.0.0.8");
  PARCEL_CHECK(outcome == PeerDiscovery::Outcome::PeerRefreshed);
  PARCEL_CHECK(discovered == 1);
  peer = local.peers->find(remote.crypto->peer_id());
  PARCEL_CHECK(peer->address == "10.0.0.8");
  PARCEL_CHECK(peer->last_seen_ms == local.clock.now());
  PARCEL_CHECK(local.peers->known_peer_count() == 1);
  return true;
}

bool test_ignores_own_announcements(TestContext&) {
  asio::io_context io;
  Node local(io, "local");
  auto outcome = local.discovery->handle_datagram(local.peer_datagram(), "127.0.0.1");
  PARCEL_CHECK(outcome == PeerDiscovery::Outcome::IgnoredSelf);
  PARCEL_CHECK(local.peers->known_peer_count() == 0);
  return true;
}

bool test_rejects_stale_and_future_announcements(TestContext&) {
  asio::io_context io;
  const int64_t base = 1700000000000LL;
  Node local(io, "local", base);
  Node old_remote(io, "old", base - kAnnouncementMaxAgeMs - 1);
  Node future_remote(io, "future", base + kAnnouncementMaxAgeMs + 1);
  Node skewed_remote(io, "skewed", base + 4 * 60 * 1000);

  PARCEL_CHECK(local.discovery->handle_datagram(old_remote.peer_datagram(), "10.0.0.2") ==
               PeerDiscovery::Outcome::Stale);
  PARCEL_CHECK(local.discovery->handle_datagram(future_remote.peer_datagram(), "10.0.0.3") ==
               PeerDiscovery::Outcome::Stale);
  PARCEL_CHECK(local.discovery->handle_datagram(skewed_remote.peer_datagram(), "10.0.0.4") ==
               PeerDiscovery::Outcome::PeerDiscovered);
  PARCEL_CHECK(local.peers->known_peer_count() == 1);
  return true;
}

bool test_extreme_timestamps(TestContext&) {
  asio::io_context io;
  Node local(io, "local");
  Node remote(io, "remote");

  auto wrapped = make_peer_announcement(remote.discovery->build_peer_announcement());
  wrapped["timestamp"] = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
  PARCEL_CHECK(local.discovery->handle_datagram(wrapped.dump(), "10.0.0.5") ==
               PeerDiscovery::Outcome::Malformed);
  wrapped["timestamp"] = std::numeric_limits<uint64_t>::max();
  PARCEL_CHECK(local.discovery->handle_datagram(wrapped.dump(), "10.0.0.5") ==
               PeerDiscovery::Outcome::Malformed);

  for(auto ts : {std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max()}) {
    auto a = remote.discovery->build_peer_announcement();
    a.timestamp = ts;
    PARCEL_CHECK(local.discovery->handle_datagram(serialize_discovery_message(a), "10.0.0.5") ==
                 PeerDiscovery::Outcome::Stale);
  }
  PARCEL_CHECK(local.peers->known_peer_count() == 0);

  PARCEL_CHECK(local.discovery->handle_datagram(remote.peer_datagram(), "10.0.0.5") ==
               PeerDiscovery::Outcome::PeerDiscovered);
  for(auto ts : {std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max()}) {
    auto b = remote.discovery->build_bundle_announcement("bundle_x", "x", 10);
    b.timestamp = ts;
    PARCEL_CHECK(local.discovery->handle_datagram(serialize_discovery_message(b), "10.0.0.5") ==
                 PeerDiscovery::Outcome::Stale);
  }
  auto bundle = make_bundle_announcement(remote.discovery->build_bundle_announcement("bundle_y", "y", 10));
  bundle["timestamp"] = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
  PARCEL_CHECK(local.discovery->handle_datagram(bundle.dump(), "10.0.0.5") ==
               PeerDiscovery::Outcome::Malformed);
  return true;
}

bool test_rejects_bad_signature(TestContext&) {
  asio::io_context io;
  Node local(io, "local");
  Node remote(io, "remote");
  auto announcement = remote.discovery->build_peer_announcement();
  announcement.name = "impostor";
  auto outcome = local.discovery->handle_datagram(serialize_discovery_message(announcement), "10.0.0.9");
  PARCEL_CHECK(outcome == PeerDiscovery::Outcome::BadSignature);

  announcement = remote.discovery->build_peer_announcement();
  announcement.port = 9999;
  outcome = local.discovery->handle_datagram(serialize_discovery_message(announcement), "10.0.0.9");
  PARCEL_CHECK(outcome == PeerDiscovery::Outcome::BadSignature);
  PARCEL_CHECK(local.peers->known_peer_count() == 0);
  return true;
}

bool test_rejects_id_key_mismatch(TestContext&) {
  asio::io_context io;
  Node local(io, "local");
  Node remote(io, "remote");
  auto announcement = remote.discovery->build_peer_announcement();
  announcement.id = "0000000000000000";
  announcement.signature = remote.crypto->sign(canonical_payload(announcement));
  auto outcome = local.discovery->handle_datagram(serialize_discovery_message(announcement), "10.0.0.9");
  PARCEL_CHECK(outcome == PeerDiscovery::Outcome::Malformed);
  PARCEL_CHECK(local.peers->known_peer_count() == 0);
  return true;
}

bool test_drops_malformed_datagrams(TestContext&) {
  asio::io_context io;
  Node local(io, "local");
  Node remote(io, "remote");
  auto valid = make_peer_announcement(remote.discovery->build_peer_announcement());

  std::vector<std::string> bad = {
    "",
    "not json",
    "[1,2,3]",
    "{\"type\":\"chat\",\"text\":\"hi\"}",
    "{\"type\":\"peer_announcement\"}",
  };
  auto missing_sig = valid;
  missing_sig.erase("signature");
  bad.push_back(missing_sig.dump());
  auto wrong_type = valid;
  wrong_type["port"] = "7682";
  bad.push_back(wrong_type.dump());
  auto zero_port = valid;
  zero_port["port"] = 0;
  bad.push_back(zero_port.dump());
  auto huge = valid;
  huge["name"] = std::string(kMaxDatagramBytes, 'x');
  bad.push_back(huge.dump());
  auto negative_size = make_bundle_announcement(
    remote.discovery->build_bundle_announcement("bundle_1", "app", 10));
  negative_size["bundleSize"] = -5;
  bad.push_back(negative_size.dump());

  for(const auto& datagram : bad) {
    PARCEL_CHECK(local.discovery->handle_datagram(datagram, "10.0.0.5") ==
                 PeerDiscovery::Outcome::Malformed);
  }
  PARCEL_CHECK(local.peers->known_peer_count() == 0);
  return true;
}

bool test_bundle_announcements(TestContext&) {
  asio::io_context io;
  Node local(io, "local");
  Node remote(io, "remote");

  std::vector<BundleAnnouncement> seen;
  local.discovery->bundle_announced.subscribe([&](const BundleAnnouncement& a){ seen.push_back(a); });

  auto bundle_datagram = serialize_discovery_message(
    remote.discovery->build_bundle_announcement("bundle_42", "web-app", 123456));
  PARCEL_CHECK(local.discovery->handle_datagram(bundle_datagram, "10.0.0.7") ==
               PeerDiscovery::Outcome::UnknownSender);
  PARCEL_CHECK(seen.empty());

  PARCEL_CHECK(local.discovery->handle_datagram(remote.peer_datagram(), "10.0.0.7") ==
               PeerDiscovery::Outcome::PeerDiscovered);
  PARCEL_CHECK(local.discovery->handle_datagram(bundle_datagram, "10.0.0.7") ==
               PeerDiscovery::Outcome::BundleAnnounced);
  PARCEL_CHECK(seen.size() == 1);
  PARCEL_CHECK(seen[0].bundle_id == "bundle_42");
  PARCEL_CHECK(seen[0].bundle_name == "web-app");
  PARCEL_CHECK(seen[0].bundle_size == 123456);
  PARCEL_CHECK(seen[0].peer_id == remote.crypto->peer_id());

  auto forged = remote.discovery->build_bundle_announcement("bundle_43", "web-app", 1);
  forged.bundle_size = 999;
  PARCEL_CHECK(local.discovery->handle_datagram(serialize_discovery_message(forged), "10.0.0.7") ==
               PeerDiscovery::Outcome::BadSignature);

  auto own = serialize_discovery_message(local.discovery->build_bundle_announcement("mine", "x", 1));
  PARCEL_CHECK(local.discovery->handle_datagram(own, "127.0.0.1") == PeerDiscovery::Outcome::IgnoredSelf);
  PARCEL_CHECK(seen.size() == 1);
  return true;
}

bool test_peer_expiry(TestContext&) {
  ManualClock clock;
  PeerManager peers(nullptr, clock.fn());
  std::vector<std::string> lost;
  peers.peer_lost.subscribe([&](const std::string& id){ lost.push_back(id); });

  PeerInfo announced;
  announced.id = "aaaaaaaaaaaaaaaa";
  announced.address = "10.0.0.1";
  announced.port = 7682;
  PARCEL_CHECK(peers.upsert(announced));

  PeerInfo manual;
  manual.id = "bbbbbbbbbbbbbbbb";
  manual.address = "10.0.0.2";
  manual.port = 7682;
  manual.manual = true;
  PARCEL_CHECK(peers.upsert(manual));

  clock.advance(kDefaultPeerTimeout.count());
  PARCEL_CHECK(peers.is_live(announced.id));
  PARCEL_CHECK(peers.sweep_expired().empty());

  clock.advance(1);
  PARCEL_CHECK(!peers.is_live(announced.id));
  PARCEL_CHECK(peers.is_live(manual.id));
  auto expired = peers.sweep_expired();
  PARCEL_CHECK(expired == std::vector<std::string>{announced.id});
  PARCEL_CHECK(lost == std::vector<std::string>{announced.id});
  PARCEL_CHECK(!peers.find(announced.id));
  PARCEL_CHECK(peers.find(manual.id));

  clock.advance(24LL * 60 * 60 * 1000);
  PARCEL_CHECK(peers.sweep_expired().empty());
  PARCEL_CHECK(peers.remove(manual.id));
  PARCEL_CHECK(!peers.remove(manual.id));
  PARCEL_CHECK(lost.size() == 2);
  return true;
}

bool test_manual_flag_survives_multicast_refresh(TestContext&) {
  ManualClock clock;
  PeerManager peers(nullptr, clock.fn());
  PeerInfo info;
  info.id = "cccccccccccccccc";
  info.address = "10.0.0.3";
  info.port = 7682;
  info.manual = true;
  peers.upsert(info);
  info.manual = false;
  PARCEL_CHECK(!peers.upsert(info));
  PARCEL_CHECK(peers.find(info.id)->manual);
  return true;
}

bool test_runs_without_multicast(TestContext&) {
  asio::io_context io;
  Node local(io, "local");
  local.discovery->start();
  PARCEL_CHECK(local.discovery->running());
  PARCEL_CHECK(!local.discovery->multicast_active());
  local.discovery->announce_peer();
  local.discovery->announce_bundle("bundle_1", "app", 10);
  local.discovery->stop();
  PARCEL_CHECK(!local.discovery->running());
  io.run_for(std::chrono::milliseconds(20));
  return true;
}

bool test_invalid_group_falls_back(TestContext& ctx) {
  asio::io_context io;
  auto logger = std::make_shared<Logger>("discovery");
  ctx.logs.attach(logger);
  auto crypto = std::make_shared<CryptoService>(logger);
  auto peers = std::make_shared<PeerManager>(logger);
  PeerDiscovery::Options options;
  options.multicast_group = "10.1.2.3";
  auto discovery = std::make_shared<PeerDiscovery>(io, crypto, peers, options, logger);
  discovery->start();
  PARCEL_CHECK(discovery->running());
  PARCEL_CHECK(!discovery->multicast_active());
  PARCEL_CHECK(ctx.logs.contains("manual peers"));
  discovery->stop();
  io.run_for(std::chrono::milliseconds(20));
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<parcel::test::TestCase> tests = {
    {"discovers_and_refreshes_peer", test_discovers_and_refreshes_peer},
    {"ignores_own_announcements", test_ignores_own_announcements},
    {"rejects_stale_and_future_announcements", test_rejects_stale_and_future_announcements},
    {"extreme_timestamps", test_extreme_timestamps},
    {"rejects_bad_signature", test_rejects_bad_signature},
    {"rejects_id_key_mismatch", test_rejects_id_key_mismatch},
    {"drops_malformed_datagrams", test_drops_malformed_datagrams},
    {"bundle_announcements", test_bundle_announcements},
    {"peer_expiry", test_peer_expiry},
    {"manual_flag_survives_multicast_refresh", test_manual_flag_survives_multicast_refresh},
    {"runs_without_multicast", test_runs_without_multicast},
    {"invalid_group_falls_back", test_invalid_group_falls_back},
  };
  return parcel::test::run_test_cases("discovery", tests, argc, argv);
}
