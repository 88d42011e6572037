#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include "lanshare/discovery/discovery_service.h"
#include "lanshare/discovery/background_task.h"
#include "lanshare/discovery/broadcaster.h"
#include "lanshare/discovery/cleanup_sweeper.h"
#include "lanshare/discovery/udp_socket.h"
#include "lanshare/discovery/message.h"

using namespace lanshare;
using namespace std::chrono_literals;

namespace {

// Loopback-only configuration with an ephemeral listener port and quiet timers
DiscoveryConfig test_config() {
    DiscoveryConfig config;
    config.port = 0;
    config.bind_address = "127.0.0.1";
    config.broadcast_address = "127.0.0.1";
    config.broadcast_interval_sec = 60;
    config.cleanup_interval_sec = 60;
    config.peer_timeout_sec = 120;
    config.announce_on_start = false;
    return config;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 3s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

Peer loopback_peer(const std::string& id, uint16_t port) {
    Peer peer;
    peer.id = id;
    peer.address = "127.0.0.1";
    peer.port = port;
    return peer;
}

} // anonymous namespace

TEST_CASE("Service operations before start", "[service]") {
    DiscoveryService service(test_config(), std::string("test-host"));

    REQUIRE(service.state() == ServiceState::Uninitialized);
    REQUIRE_FALSE(service.own_identity().has_value());
    REQUIRE(service.listen_port() == 0);
    REQUIRE(service.peer_count() == 0);

    REQUIRE(service.spawn_broadcaster() == make_error_code(ErrorCode::NotStarted));
    REQUIRE(service.spawn_listener() == make_error_code(ErrorCode::NotStarted));
    REQUIRE(service.spawn_sweeper() == make_error_code(ErrorCode::NotStarted));

    auto result = service.broadcast_text("hello");
    REQUIRE(result.code == ErrorCode::NotStarted);

    // Stop before start is a no-op
    service.stop();
    REQUIRE(service.state() == ServiceState::Uninitialized);
}

TEST_CASE("Service lifecycle", "[service]") {
    DiscoveryService service(test_config());

    REQUIRE_FALSE(service.start());
    REQUIRE(service.state() == ServiceState::Running);

    auto id = service.own_identity();
    REQUIRE(id.has_value());
    REQUIRE(id->size() == 36);
    REQUIRE(service.listen_port() != 0);

    REQUIRE(service.start() == make_error_code(ErrorCode::AlreadyStarted));
    REQUIRE(service.spawn_listener() == make_error_code(ErrorCode::AlreadyStarted));
    REQUIRE(service.own_identity() == id);

    // Tasks observe cancellation well before the 60s timers elapse
    auto begin = std::chrono::steady_clock::now();
    service.stop();
    REQUIRE(std::chrono::steady_clock::now() - begin < 3s);
    REQUIRE(service.state() == ServiceState::Stopped);
    REQUIRE(service.own_identity() == id);

    service.stop();
    REQUIRE(service.start() == make_error_code(ErrorCode::AlreadyStarted));
}

TEST_CASE("Service send validation", "[service][send]") {
    DiscoveryService service(test_config());
    REQUIRE_FALSE(service.start());

    SECTION("All with no peers succeeds without sending") {
        auto result = service.broadcast_text("anyone?");
        REQUIRE(result.ok());
        REQUIRE(result.datagrams_sent == 0);
    }

    SECTION("Unknown peer is an error") {
        auto result = service.send_text_to("missing", "hi");
        REQUIRE(result.code == ErrorCode::PeerNotFound);
        REQUIRE_THAT(result.error_message, Catch::Matchers::ContainsSubstring("missing"));
        REQUIRE(result.datagrams_sent == 0);
    }

    SECTION("Text over the character limit is rejected") {
        auto result = service.broadcast_text(std::string(6001, 'x'));
        REQUIRE(result.code == ErrorCode::TextTooLong);
        REQUIRE_THAT(result.error_message, Catch::Matchers::ContainsSubstring("6000"));
    }

    SECTION("Text at the character limit is accepted") {
        auto result = service.broadcast_text(std::string(6000, 'x'));
        REQUIRE(result.ok());
    }

    SECTION("Multi-byte characters count once") {
        std::string text;
        for (int i = 0; i < 6000; ++i) text += "é";
        REQUIRE(service.broadcast_text(text).ok());
        REQUIRE(service.broadcast_text(text + "é").code == ErrorCode::TextTooLong);
    }

    service.stop();
}

TEST_CASE("Service rejects messages larger than one datagram", "[service][send]") {
    auto config = test_config();
    config.max_datagram_size = 256;
    DiscoveryService service(config);
    REQUIRE_FALSE(service.start());

    service.registry()->upsert(loopback_peer("sink-peer", 9));
    auto result = service.send_text_to("sink-peer", std::string(300, 'y'));
    REQUIRE(result.code == ErrorCode::MessageTooLarge);
    REQUIRE(result.datagrams_sent == 0);

    service.stop();
}

TEST_CASE("Text delivery over loopback", "[service][integration]") {
    DiscoveryService sender(test_config(), std::string("sender-host"));
    DiscoveryService receiver(test_config(), std::string("receiver-host"));

    std::promise<std::pair<std::string, std::string>> received;
    auto future = received.get_future();
    receiver.set_text_sink([&received](const std::string& peer_id, const std::string& text) {
        received.set_value({peer_id, text});
    });

    REQUIRE_FALSE(sender.start());
    REQUIRE_FALSE(receiver.start());

    const std::string receiver_id = *receiver.own_identity();
    sender.registry()->upsert(loopback_peer(receiver_id, receiver.listen_port()));

    auto result = sender.send_text_to(receiver_id, "hello over udp");
    REQUIRE(result.ok());
    REQUIRE(result.datagrams_sent == 1);

    REQUIRE(future.wait_for(3s) == std::future_status::ready);
    auto [from, text] = future.get();
    REQUIRE(from == *sender.own_identity());
    REQUIRE(text == "hello over udp");

    sender.stop();
    receiver.stop();
}

TEST_CASE("Presence announcement registers the sender", "[service][integration]") {
    DiscoveryService receiver(test_config());
    REQUIRE_FALSE(receiver.start());

    auto config = test_config();
    config.port = receiver.listen_port();
    Broadcaster broadcaster(config, "remote-node", 4242, std::string("remote-host"));
    REQUIRE_FALSE(broadcaster.open());
    REQUIRE(broadcaster.announce_once());
    REQUIRE(broadcaster.announcements_sent() == 1);

    REQUIRE(wait_until([&]() { return receiver.find_peer("remote-node").has_value(); }));
    auto peer = receiver.find_peer("remote-node");
    REQUIRE(peer->address == "127.0.0.1");
    REQUIRE(peer->port == 4242);
    REQUIRE(peer->hostname == "remote-host");

    receiver.stop();
}

TEST_CASE("Listener keeps running after malformed datagrams", "[service][integration]") {
    DiscoveryService receiver(test_config());
    REQUIRE_FALSE(receiver.start());

    std::error_code ec;
    auto sock = UdpSocket::bind("127.0.0.1", 0, false, ec);
    REQUIRE(sock.has_value());
    REQUIRE_FALSE(sock->send_to("{\"broken", "127.0.0.1", receiver.listen_port()));
    REQUIRE_FALSE(sock->send_to(
        serialize_message(DiscoveryMessage::presence("after-garbage", 5000, std::nullopt)),
        "127.0.0.1", receiver.listen_port()));

    REQUIRE(wait_until([&]() { return receiver.peer_count() == 1; }));
    REQUIRE(receiver.find_peer("after-garbage")->port == 5000);

    receiver.stop();
}

TEST_CASE("Broadcaster loop announces on every tick", "[service][broadcaster]") {
    std::error_code ec;
    auto sock = UdpSocket::bind("127.0.0.1", 0, false, ec);
    REQUIRE(sock.has_value());

    auto config = test_config();
    config.port = sock->local_port();
    config.broadcast_interval_sec = 1;
    config.announce_on_start = true;

    Broadcaster broadcaster(config, "ticker", 4321, std::nullopt);
    REQUIRE_FALSE(broadcaster.open());
    BackgroundTask task("broadcaster", [&broadcaster](std::stop_token stop) { return broadcaster.run(stop); });

    // The start announcement plus at least one interval tick
    int presences = 0;
    auto deadline = std::chrono::steady_clock::now() + 4s;
    while (presences < 2 && std::chrono::steady_clock::now() < deadline) {
        auto datagram = sock->receive(config.max_datagram_size, 200ms, ec);
        REQUIRE_FALSE(ec);
        if (!datagram) continue;
        auto msg = deserialize_message(datagram->payload);
        REQUIRE(msg.has_value());
        REQUIRE(msg->type == MessageType::PeerDiscovery);
        REQUIRE(msg->peer_id == "ticker");
        REQUIRE(msg->port == 4321);
        ++presences;
    }

    task.stop();
    REQUIRE(presences >= 2);
    REQUIRE(broadcaster.announcements_sent() >= 2);
    REQUIRE(broadcaster.announcements_failed() == 0);
}

TEST_CASE("Broadcaster loop keeps going after send failures", "[service][broadcaster]") {
    auto config = test_config();
    config.port = 7878;
    config.broadcast_address = "not-an-address";
    config.broadcast_interval_sec = 1;
    config.announce_on_start = true;

    Broadcaster broadcaster(config, "unlucky", 4321, std::nullopt);
    REQUIRE_FALSE(broadcaster.open());
    BackgroundTask task("broadcaster", [&broadcaster](std::stop_token stop) { return broadcaster.run(stop); });

    REQUIRE(wait_until([&]() { return broadcaster.announcements_failed() >= 2; }, 4s));
    REQUIRE(task.is_running());

    auto begin = std::chrono::steady_clock::now();
    task.stop();
    REQUIRE(std::chrono::steady_clock::now() - begin < 2s);
    REQUIRE_FALSE(task.is_running());
    REQUIRE(broadcaster.announcements_sent() == 0);
}

TEST_CASE("Cleanup sweeper loop evicts stale peers", "[service][cleanup]") {
    auto registry = std::make_shared<PeerRegistry>();
    auto stale = loopback_peer("stale", 1);
    stale.last_seen = Clock::now() - 5s;
    registry->upsert(stale);

    std::atomic<int> removed{0};
    registry->set_on_peer_removed([&removed](const std::string&) { ++removed; });

    CleanupSweeper sweeper(registry, 1s, 2s);
    BackgroundTask task("cleanup", [&sweeper](std::stop_token stop) { return sweeper.run(stop); });

    REQUIRE(wait_until([&]() { return registry->count() == 0; }, 4s));
    task.stop();
    REQUIRE(removed.load() == 1);
}

TEST_CASE("Cleanup sweeper evicts stale peers", "[service][cleanup]") {
    auto registry = std::make_shared<PeerRegistry>();
    CleanupSweeper sweeper(registry, 10s, 1s);

    auto stale = loopback_peer("stale", 1);
    stale.last_seen = Clock::now() - 2s;
    registry->upsert(stale);
    registry->upsert(loopback_peer("fresh", 2));

    REQUIRE(sweeper.sweep_once() == 1);
    REQUIRE(registry->count() == 1);
    REQUIRE(registry->find("fresh").has_value());
}
