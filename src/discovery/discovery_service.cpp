#include "lanshare/discovery/discovery_service.h"
#include "lanshare/discovery/background_task.h"
#include "lanshare/discovery/broadcaster.h"
#include "lanshare/discovery/cleanup_sweeper.h"
#include "lanshare/discovery/message.h"
#include "lanshare/discovery/udp_socket.h"
#include "lanshare/base/logger.h"
#include <fmt/format.h>
#include <mutex>

namespace lanshare {

const char* to_string(ServiceState state) {
    switch (state) {
        case ServiceState::Uninitialized: return "uninitialized";
        case ServiceState::Running: return "running";
        case ServiceState::Stopped: return "stopped";
    }
    return "unknown";
}

struct DiscoveryService::Impl {
    DiscoveryConfig config;
    std::optional<std::string> hostname;
    std::shared_ptr<PeerRegistry> registry;

    mutable std::mutex mutex;
    ServiceState state = ServiceState::Uninitialized;
    std::optional<std::string> peer_id;
    TextSink sink;

    std::shared_ptr<Broadcaster> broadcaster;
    std::shared_ptr<Listener> listener;
    std::shared_ptr<CleanupSweeper> sweeper;

    std::unique_ptr<BackgroundTask> broadcaster_task;
    std::unique_ptr<BackgroundTask> listener_task;
    std::unique_ptr<BackgroundTask> sweeper_task;

    Impl(const DiscoveryConfig& cfg, std::optional<std::string> name)
        : config(cfg),
          hostname(std::move(name)),
          registry(std::make_shared<PeerRegistry>(std::chrono::seconds(cfg.peer_timeout_sec))) {}

    std::error_code check_spawnable(const std::unique_ptr<BackgroundTask>& task) const {
        if (!peer_id || state != ServiceState::Running) {
            return make_error_code(ErrorCode::NotStarted);
        }
        if (task) {
            return make_error_code(ErrorCode::AlreadyStarted);
        }
        return {};
    }

    std::error_code spawn_broadcaster_locked() {
        if (auto ec = check_spawnable(broadcaster_task)) {
            return ec;
        }
        broadcaster_task = std::make_unique<BackgroundTask>(
            "broadcaster", [b = broadcaster](std::stop_token stop) { return b->run(stop); });
        return {};
    }

    std::error_code spawn_listener_locked() {
        if (auto ec = check_spawnable(listener_task)) {
            return ec;
        }
        listener_task = std::make_unique<BackgroundTask>(
            "listener", [l = listener](std::stop_token stop) { return l->run(stop); });
        return {};
    }

    std::error_code spawn_sweeper_locked() {
        if (auto ec = check_spawnable(sweeper_task)) {
            return ec;
        }
        sweeper_task = std::make_unique<BackgroundTask>(
            "cleanup", [s = sweeper](std::stop_token stop) { return s->run(stop); });
        return {};
    }
};

DiscoveryService::DiscoveryService(const DiscoveryConfig& config, std::optional<std::string> hostname)
    : impl_(std::make_unique<Impl>(config, std::move(hostname))) {}

DiscoveryService::~DiscoveryService() {
    stop();
}

std::error_code DiscoveryService::start() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->state != ServiceState::Uninitialized) {
        Logger::instance().warning("Discovery service already started");
        return make_error_code(ErrorCode::AlreadyStarted);
    }

    std::string peer_id = generate_peer_id();

    auto listener = std::make_shared<Listener>(impl_->config, impl_->registry, peer_id);
    if (auto ec = listener->open()) {
        return ec;
    }

    auto broadcaster = std::make_shared<Broadcaster>(impl_->config, peer_id, listener->local_port(),
                                                     impl_->hostname);
    if (auto ec = broadcaster->open()) {
        return ec;
    }

    if (impl_->sink) {
        listener->set_text_sink(impl_->sink);
    }

    impl_->listener = std::move(listener);
    impl_->broadcaster = std::move(broadcaster);
    impl_->sweeper = std::make_shared<CleanupSweeper>(
        impl_->registry,
        std::chrono::seconds(impl_->config.cleanup_interval_sec),
        std::chrono::seconds(impl_->config.peer_timeout_sec));
    impl_->peer_id = peer_id;
    impl_->state = ServiceState::Running;

    Logger::instance().info("Discovery service initialized with peer ID: {}", peer_id);

    if (auto ec = impl_->spawn_listener_locked()) return ec;
    if (auto ec = impl_->spawn_broadcaster_locked()) return ec;
    if (auto ec = impl_->spawn_sweeper_locked()) return ec;
    return {};
}

void DiscoveryService::stop() {
    std::unique_ptr<BackgroundTask> tasks[3];
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->state != ServiceState::Running) {
            return;
        }
        Logger::instance().info("Stopping discovery service");
        tasks[0] = std::move(impl_->broadcaster_task);
        tasks[1] = std::move(impl_->listener_task);
        tasks[2] = std::move(impl_->sweeper_task);
        impl_->state = ServiceState::Stopped;
    }

    // Signal everything first so the joins overlap
    for (auto& task : tasks) {
        if (task) task->request_stop();
    }
    for (auto& task : tasks) {
        if (task) task->stop();
    }
    Logger::instance().info("Discovery service stopped");
}

std::error_code DiscoveryService::spawn_broadcaster() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->spawn_broadcaster_locked();
}

std::error_code DiscoveryService::spawn_listener() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->spawn_listener_locked();
}

std::error_code DiscoveryService::spawn_sweeper() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->spawn_sweeper_locked();
}

ServiceState DiscoveryService::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

PeerList DiscoveryService::current_peers() const {
    return impl_->registry->snapshot();
}

size_t DiscoveryService::peer_count() const {
    return impl_->registry->count();
}

std::optional<Peer> DiscoveryService::find_peer(const std::string& peer_id) const {
    return impl_->registry->find(peer_id);
}

std::optional<std::string> DiscoveryService::own_identity() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->peer_id;
}

std::shared_ptr<PeerRegistry> DiscoveryService::registry() const {
    return impl_->registry;
}

uint16_t DiscoveryService::listen_port() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->listener ? impl_->listener->local_port() : 0;
}

void DiscoveryService::set_text_sink(TextSink sink) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->sink = sink;
    if (impl_->listener) {
        impl_->listener->set_text_sink(std::move(sink));
    }
}

SendResult DiscoveryService::send_text(const SendTarget& target, const std::string& text) {
    SendResult result;

    const size_t chars = utf8_length(text);
    if (chars > impl_->config.max_text_chars) {
        result.code = ErrorCode::TextTooLong;
        result.error_message = fmt::format("Text exceeds the {} character limit ({} characters)",
                                           impl_->config.max_text_chars, chars);
        return result;
    }

    std::string peer_id;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->state != ServiceState::Running || !impl_->peer_id) {
            result.code = ErrorCode::NotStarted;
            result.error_message = "Discovery service is not running";
            return result;
        }
        peer_id = *impl_->peer_id;
        port = impl_->listener->local_port();
    }

    PeerList recipients;
    if (target.is_all()) {
        recipients = impl_->registry->snapshot();
        if (recipients.empty()) {
            Logger::instance().debug("No peers online, text not sent");
            return result;
        }
    } else {
        auto peer = impl_->registry->find(*target.peer_id);
        if (!peer) {
            result.code = ErrorCode::PeerNotFound;
            result.error_message = "Peer not found: " + *target.peer_id;
            return result;
        }
        recipients.push_back(std::move(*peer));
    }

    const std::string payload = serialize_message(
        DiscoveryMessage::text_message(peer_id, port, impl_->hostname, text));
    if (payload.size() > impl_->config.max_datagram_size) {
        result.code = ErrorCode::MessageTooLarge;
        result.error_message = fmt::format("Encoded message is {} bytes, exceeding the {} byte datagram limit",
                                           payload.size(), impl_->config.max_datagram_size);
        return result;
    }

    std::error_code ec;
    auto sock = UdpSocket::bind("0.0.0.0", 0, false, ec);
    if (!sock) {
        Logger::instance().error("Failed to bind UDP socket for sending: " + ec.message());
        result.code = ErrorCode::SocketError;
        result.error_message = "Failed to open send socket: " + ec.message();
        return result;
    }

    for (const auto& peer : recipients) {
        if (auto err = sock->send_to(payload, peer.address, peer.port)) {
            Logger::instance().warning("Failed to send text to {} at {}: {}", peer.id, peer.endpoint(), err.message());
            ++result.failed_sends;
        } else {
            ++result.datagrams_sent;
        }
    }

    if (result.datagrams_sent == 0) {
        result.code = ErrorCode::SendFailed;
        result.error_message = fmt::format("Failed to send text to {} peer(s)", result.failed_sends);
    } else {
        Logger::instance().info("Sent text to {} peer(s)", result.datagrams_sent);
    }
    return result;
}

SendResult DiscoveryService::send_text_to(const std::string& peer_id, const std::string& text) {
    return send_text(SendTarget::peer(peer_id), text);
}

SendResult DiscoveryService::broadcast_text(const std::string& text) {
    return send_text(SendTarget::all(), text);
}

} // namespace lanshare
