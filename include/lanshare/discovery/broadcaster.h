#ifndef LANSHARE_DISCOVERY_BROADCASTER_H
#define LANSHARE_DISCOVERY_BROADCASTER_H

#include "lanshare/base/config.h"
#include "lanshare/discovery/udp_socket.h"
#include <elio/elio.hpp>
#include <string>
#include <optional>
#include <stop_token>
#include <system_error>
#include <atomic>

namespace lanshare {

// Periodically announces this process to the subnet broadcast address
class Broadcaster {
public:
    Broadcaster(const DiscoveryConfig& config, std::string peer_id, uint16_t advertised_port,
                std::optional<std::string> hostname);

    // Bind an ephemeral socket and enable broadcast on it
    std::error_code open();

    // Build, serialize and send one presence announcement.
    // Failures are logged; returns whether the datagram was sent.
    bool announce_once();

    elio::coro::task<void> run(std::stop_token stop);

    const std::string& peer_id() const { return peer_id_; }
    uint16_t advertised_port() const { return advertised_port_; }
    uint64_t announcements_sent() const { return announcements_sent_.load(); }
    uint64_t announcements_failed() const { return announcements_failed_.load(); }

private:
    DiscoveryConfig config_;
    std::string peer_id_;
    uint16_t advertised_port_;
    std::optional<std::string> hostname_;
    std::optional<UdpSocket> socket_;
    std::atomic<uint64_t> announcements_sent_{0};
    std::atomic<uint64_t> announcements_failed_{0};
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_BROADCASTER_H
