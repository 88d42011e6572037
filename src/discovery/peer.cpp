#include "lanshare/discovery/peer.h"
#include <fmt/format.h>
#include <random>
#include <cstdlib>
#include <unistd.h>
#include <climits>

namespace lanshare {

bool Peer::is_stale(std::chrono::seconds timeout, Clock::time_point now) const {
    return now - last_seen > timeout;
}

std::string Peer::endpoint() const {
    return fmt::format("{}:{}", address, port);
}

std::string generate_peer_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                       static_cast<uint32_t>(hi & 0xFFFF),
                       static_cast<uint32_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}

std::optional<std::string> local_hostname() {
    for (const char* name : {"HOSTNAME", "COMPUTERNAME", "USER"}) {
        if (const char* val = std::getenv(name); val != nullptr && *val != '\0') {
            return std::string(val);
        }
    }

    char buffer[HOST_NAME_MAX + 1] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
        return std::string(buffer);
    }
    return std::nullopt;
}

} // namespace lanshare
