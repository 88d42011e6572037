#include "lanshare/discovery/listener.h"
#include "lanshare/discovery/background_task.h"
#include "lanshare/discovery/message.h"
#include "lanshare/base/error_code.h"
#include "lanshare/base/logger.h"

namespace lanshare {

namespace {

// Upper bound on a single blocking receive so stop requests are observed promptly
constexpr std::chrono::milliseconds kReceivePollInterval{200};

} // anonymous namespace

const char* to_string(DatagramOutcome outcome) {
    switch (outcome) {
        case DatagramOutcome::PeerUpserted: return "peer upserted";
        case DatagramOutcome::TextDelivered: return "text delivered";
        case DatagramOutcome::IgnoredSelf: return "ignored (self)";
        case DatagramOutcome::IgnoredEmptyText: return "ignored (no text)";
        case DatagramOutcome::DecodeFailed: return "decode failed";
    }
    return "unknown";
}

Listener::Listener(const DiscoveryConfig& config, std::shared_ptr<PeerRegistry> registry,
                   std::string own_peer_id)
    : config_(config),
      registry_(std::move(registry)),
      own_peer_id_(std::move(own_peer_id)) {}

std::error_code Listener::open() {
    std::error_code ec;
    auto sock = UdpSocket::bind(config_.bind_address, config_.port, true, ec);
    if (!sock) {
        Logger::instance().error("Failed to bind UDP socket for listening on {}:{}: {}",
                                 config_.bind_address, config_.port, ec.message());
        return make_error_code(ErrorCode::BindFailed);
    }

    socket_ = std::move(sock);
    Logger::instance().info("UDP listener started on port {}", socket_->local_port());
    return {};
}

uint16_t Listener::local_port() const {
    return socket_ ? socket_->local_port() : 0;
}

void Listener::set_text_sink(TextSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

DatagramOutcome Listener::handle_datagram(const std::string& payload, const std::string& source_address,
                                          bool truncated) {
    auto msg = deserialize_message(payload);
    if (!msg) {
        if (truncated) {
            Logger::instance().warning("Dropped corrupted datagram from {}: truncated at {} bytes",
                                       source_address, payload.size());
        } else {
            Logger::instance().warning("Failed to deserialize discovery message from {} ({} bytes)",
                                       source_address, payload.size());
        }
        return DatagramOutcome::DecodeFailed;
    }

    // Broadcasts are also received by their sender
    if (msg->peer_id == own_peer_id_) {
        return DatagramOutcome::IgnoredSelf;
    }

    switch (msg->type) {
        case MessageType::PeerDiscovery: {
            Peer peer;
            peer.id = msg->peer_id;
            peer.address = source_address;
            peer.port = msg->port;
            peer.hostname = msg->hostname;
            peer.last_seen = Clock::now();
            registry_->upsert(peer);
            return DatagramOutcome::PeerUpserted;
        }
        case MessageType::TextMessage:
            if (!msg->text) {
                return DatagramOutcome::IgnoredEmptyText;
            }
            Logger::instance().info("Received text message from {}", msg->peer_id);
            deliver_text(msg->peer_id, *msg->text);
            return DatagramOutcome::TextDelivered;
    }
    return DatagramOutcome::DecodeFailed;
}

void Listener::deliver_text(const std::string& peer_id, const std::string& text) {
    TextSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (!sink) {
        Logger::instance().debug("No text sink registered, dropping text from {}", peer_id);
        return;
    }

    try {
        sink(peer_id, text);
    } catch (const std::exception& e) {
        Logger::instance().error("Text sink failed for message from {}: {}", peer_id, e.what());
    }
}

elio::coro::task<void> Listener::run(std::stop_token stop) {
    if (!socket_) {
        Logger::instance().error("Listener socket is not open");
        co_return;
    }

    const auto backoff = std::chrono::milliseconds(config_.receive_error_backoff_ms);

    while (!stop.stop_requested()) {
        std::error_code ec;
        auto datagram = socket_->receive(config_.max_datagram_size, kReceivePollInterval, ec);
        if (ec) {
            Logger::instance().error("Failed to receive UDP message: " + ec.message());
            if (!co_await sleep_unless_stopped(backoff, stop)) {
                break;
            }
            continue;
        }
        if (!datagram) {
            continue;
        }

        Logger::instance().debug("Received {} byte datagram from {}:{}",
                                 datagram->payload.size(), datagram->source_address, datagram->source_port);
        handle_datagram(datagram->payload, datagram->source_address, datagram->truncated);
    }

    Logger::instance().info("UDP listener stopped");
}

} // namespace lanshare
