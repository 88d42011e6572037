#include <catch2/catch_test_macros.hpp>
#include <vector>
#include <string>
#include <thread>
#include <atomic>
#include "lanshare/discovery/peer_registry.h"

using namespace lanshare;
using namespace std::chrono_literals;

namespace {

Peer make_peer(const std::string& id, const std::string& address, uint16_t port,
               Clock::time_point last_seen = Clock::now()) {
    Peer peer;
    peer.id = id;
    peer.address = address;
    peer.port = port;
    peer.last_seen = last_seen;
    peer.hostname = "host-" + id;
    return peer;
}

} // anonymous namespace

TEST_CASE("Registry basic operations", "[registry]") {
    PeerRegistry registry(30s);

    REQUIRE(registry.upsert(make_peer("test-id", "192.168.1.100", 8080)) == UpsertResult::Inserted);
    REQUIRE(registry.count() == 1);

    auto peers = registry.snapshot();
    REQUIRE(peers.size() == 1);
    REQUIRE(peers[0].id == "test-id");
    REQUIRE(peers[0].hostname == "host-test-id");

    auto found = registry.find("test-id");
    REQUIRE(found.has_value());
    REQUIRE(found->endpoint() == "192.168.1.100:8080");

    REQUIRE(registry.remove("test-id") == true);
    REQUIRE(registry.count() == 0);
    REQUIRE(registry.remove("test-id") == false);
    REQUIRE_FALSE(registry.find("test-id").has_value());
}

TEST_CASE("Registry upsert is last-write-wins", "[registry][upsert]") {
    PeerRegistry registry;

    registry.upsert(make_peer("node", "10.0.0.1", 1000));
    registry.upsert(make_peer("node", "10.0.0.2", 2000));

    Peer last = make_peer("node", "10.0.0.3", 3000);
    last.hostname.reset();
    registry.upsert(last);

    REQUIRE(registry.count() == 1);
    auto stored = registry.find("node");
    REQUIRE(stored.has_value());
    REQUIRE(*stored == last);
    REQUIRE_FALSE(stored->hostname.has_value());
}

TEST_CASE("Registry emits updated event only when the endpoint changes", "[registry][events]") {
    PeerRegistry registry;

    int discovered = 0;
    int updated = 0;
    registry.set_on_peer_discovered([&](const Peer&) { ++discovered; });
    registry.set_on_peer_updated([&](const Peer&) { ++updated; });

    Peer peer = make_peer("node", "10.0.0.1", 7878);
    REQUIRE(registry.upsert(peer) == UpsertResult::Inserted);

    SECTION("Unchanged peer refreshes without an update event") {
        peer.last_seen = Clock::now();
        REQUIRE(registry.upsert(peer) == UpsertResult::Refreshed);
        REQUIRE(registry.upsert(peer) == UpsertResult::Refreshed);
        REQUIRE(registry.count() == 1);
        REQUIRE(updated == 0);
    }

    SECTION("Port change is reported exactly once") {
        peer.port = 7879;
        REQUIRE(registry.upsert(peer) == UpsertResult::Updated);
        REQUIRE(registry.upsert(peer) == UpsertResult::Refreshed);
        REQUIRE(updated == 1);
        REQUIRE(registry.find("node")->port == 7879);
    }

    SECTION("Address change is an update") {
        peer.address = "10.0.0.9";
        REQUIRE(registry.upsert(peer) == UpsertResult::Updated);
        REQUIRE(updated == 1);
    }

    REQUIRE(discovered == 1);
}

TEST_CASE("Registry sweep removes stale peers", "[registry][sweep]") {
    // Peer last seen two seconds ago with a one second timeout
    PeerRegistry registry(1s);
    registry.upsert(make_peer("old", "192.168.1.100", 8080, Clock::now() - 2s));
    REQUIRE(registry.count() == 1);

    REQUIRE(registry.sweep() == 1);
    REQUIRE(registry.count() == 0);
}

TEST_CASE("Registry sweep boundary is exclusive", "[registry][sweep]") {
    PeerRegistry registry;
    const auto now = Clock::now();

    registry.upsert(make_peer("exact", "10.0.0.1", 1, now - 10s));
    registry.upsert(make_peer("over", "10.0.0.2", 2, now - 10s - 1ms));
    registry.upsert(make_peer("fresh", "10.0.0.3", 3, now));
    registry.upsert(make_peer("ancient", "10.0.0.4", 4, now - 1h));

    std::vector<std::string> removed;
    registry.set_on_peer_removed([&](const std::string& id) { removed.push_back(id); });

    REQUIRE(registry.sweep(10s, now) == 2);
    REQUIRE(registry.count() == 2);
    REQUIRE(registry.find("exact").has_value());
    REQUIRE(registry.find("fresh").has_value());
    REQUIRE_FALSE(registry.find("over").has_value());
    REQUIRE_FALSE(registry.find("ancient").has_value());
    REQUIRE(removed.size() == 2);

    // Nothing left to remove
    REQUIRE(registry.sweep(10s, now) == 0);
}

TEST_CASE("Peer staleness predicate", "[registry][peer]") {
    const auto now = Clock::now();
    Peer peer = make_peer("p", "10.0.0.1", 1, now - 30s);

    REQUIRE_FALSE(peer.is_stale(30s, now));
    REQUIRE(peer.is_stale(29s, now));
    REQUIRE_FALSE(peer.is_stale(8s, now - 25s));
}

TEST_CASE("Registry tolerates concurrent readers and writers", "[registry][concurrency]") {
    PeerRegistry registry;
    constexpr int kWriters = 4;
    constexpr int kPeersPerWriter = 200;

    std::atomic<bool> done{false};
    std::atomic<size_t> snapshots{0};
    std::atomic<size_t> max_snapshot_size{0};
    std::atomic<size_t> inconsistent{0};

    // Catch2 assertions are not thread-safe; readers only record what they see
    std::vector<std::thread> readers;
    for (int r = 0; r < 2; ++r) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                auto peers = registry.snapshot();
                size_t seen = max_snapshot_size.load();
                while (peers.size() > seen && !max_snapshot_size.compare_exchange_weak(seen, peers.size())) {
                }
                for (const auto& peer : peers) {
                    if (peer.id.empty() || peer.port == 0) {
                        ++inconsistent;
                    }
                }
                // Writers only insert, so the registry never shrinks below a prior snapshot
                if (registry.count() < peers.size()) {
                    ++inconsistent;
                }
                ++snapshots;
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w]() {
            for (int i = 0; i < kPeersPerWriter; ++i) {
                std::string id = "w" + std::to_string(w) + "-" + std::to_string(i);
                registry.upsert(make_peer(id, "10.0.0.1", static_cast<uint16_t>(i + 1)));
                registry.upsert(make_peer(id, "10.0.0.2", static_cast<uint16_t>(i + 1)));
            }
        });
    }

    for (auto& t : writers) t.join();
    done = true;
    for (auto& t : readers) t.join();

    INFO("Snapshots taken: " << snapshots.load());
    REQUIRE(max_snapshot_size.load() <= static_cast<size_t>(kWriters * kPeersPerWriter));
    REQUIRE(inconsistent.load() == 0);
    REQUIRE(registry.count() == static_cast<size_t>(kWriters * kPeersPerWriter));
    for (const auto& peer : registry.snapshot()) {
        REQUIRE(peer.address == "10.0.0.2");
    }
}
