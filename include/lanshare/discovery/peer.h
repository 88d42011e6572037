#ifndef LANSHARE_DISCOVERY_PEER_H
#define LANSHARE_DISCOVERY_PEER_H

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>

namespace lanshare {

using Clock = std::chrono::system_clock;

struct Peer {
    std::string id;
    std::string address;        // Source address observed on the wire
    uint16_t port = 0;          // Advertised listening port
    Clock::time_point last_seen = Clock::now();
    std::optional<std::string> hostname;

    // True when the peer has been silent for strictly longer than timeout
    bool is_stale(std::chrono::seconds timeout, Clock::time_point now = Clock::now()) const;

    // "address:port"
    std::string endpoint() const;

    bool operator==(const Peer& other) const = default;
};

using PeerList = std::vector<Peer>;
using PeerCallback = std::function<void(const Peer&)>;

// Random UUID v4, used as the process identity
std::string generate_peer_id();

// Best-effort display name: HOSTNAME, COMPUTERNAME, USER, then gethostname()
std::optional<std::string> local_hostname();

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_PEER_H
