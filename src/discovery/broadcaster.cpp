#include "lanshare/discovery/broadcaster.h"
#include "lanshare/discovery/background_task.h"
#include "lanshare/discovery/message.h"
#include "lanshare/base/error_code.h"
#include "lanshare/base/logger.h"

namespace lanshare {

Broadcaster::Broadcaster(const DiscoveryConfig& config, std::string peer_id, uint16_t advertised_port,
                         std::optional<std::string> hostname)
    : config_(config),
      peer_id_(std::move(peer_id)),
      advertised_port_(advertised_port),
      hostname_(std::move(hostname)) {}

std::error_code Broadcaster::open() {
    std::error_code ec;
    auto sock = UdpSocket::bind("0.0.0.0", 0, false, ec);
    if (!sock) {
        Logger::instance().error("Failed to bind UDP socket for broadcasting: " + ec.message());
        return make_error_code(ErrorCode::BindFailed);
    }

    if (auto err = sock->enable_broadcast()) {
        Logger::instance().error("Failed to enable broadcast on UDP socket: " + err.message());
        return make_error_code(ErrorCode::BroadcastSetupFailed);
    }

    socket_ = std::move(sock);
    return {};
}

bool Broadcaster::announce_once() {
    if (!socket_) {
        Logger::instance().error("Broadcaster socket is not open");
        return false;
    }

    std::string payload;
    try {
        payload = serialize_message(DiscoveryMessage::presence(peer_id_, advertised_port_, hostname_));
    } catch (const std::exception& e) {
        Logger::instance().error("Failed to serialize discovery message: " + std::string(e.what()));
        ++announcements_failed_;
        return false;
    }

    if (auto ec = socket_->send_to(payload, config_.broadcast_address, config_.port)) {
        Logger::instance().error("Failed to broadcast presence message: " + ec.message());
        ++announcements_failed_;
        return false;
    }

    ++announcements_sent_;
    Logger::instance().debug("Broadcasted presence message to {}:{}", config_.broadcast_address, config_.port);
    return true;
}

elio::coro::task<void> Broadcaster::run(std::stop_token stop) {
    Logger::instance().info("Starting UDP broadcast on port {} with peer ID: {}", config_.port, peer_id_);

    if (config_.announce_on_start) {
        announce_once();
    }

    const auto interval = std::chrono::milliseconds(
        static_cast<int64_t>(config_.broadcast_interval_sec) * 1000);
    while (co_await sleep_unless_stopped(interval, stop)) {
        announce_once();
    }

    Logger::instance().info("UDP broadcast stopped");
}

} // namespace lanshare
