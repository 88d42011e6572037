#ifndef LANSHARE_DISCOVERY_PEER_REGISTRY_H
#define LANSHARE_DISCOVERY_PEER_REGISTRY_H

#include "lanshare/discovery/peer.h"
#include <string>
#include <unordered_map>
#include <optional>
#include <shared_mutex>
#include <mutex>
#include <chrono>

namespace lanshare {

using PeerRemovedCallback = std::function<void(const std::string& peer_id)>;

// Outcome of PeerRegistry::upsert
enum class UpsertResult {
    Inserted,   // New identity
    Updated,    // Known identity, address or port changed
    Refreshed   // Known identity, same address and port
};

// Concurrent map from peer identity to Peer.
// Writers (upsert, remove, sweep) are exclusive; readers share the lock.
// Callbacks are invoked after the lock is released.
class PeerRegistry {
public:
    explicit PeerRegistry(std::chrono::seconds timeout = std::chrono::seconds(30));

    // Insert or replace; the incoming values always win
    UpsertResult upsert(const Peer& peer);

    // Returns true if the peer was present
    bool remove(const std::string& peer_id);

    std::optional<Peer> find(const std::string& peer_id) const;

    // Point-in-time copy
    PeerList snapshot() const;

    size_t count() const;

    // Remove every peer with now - last_seen > timeout; returns the number removed
    size_t sweep(std::chrono::seconds timeout, Clock::time_point now = Clock::now());

    // Sweep with the configured timeout
    size_t sweep();

    std::chrono::seconds timeout() const { return timeout_; }

    void set_on_peer_discovered(PeerCallback callback);
    void set_on_peer_updated(PeerCallback callback);
    void set_on_peer_removed(PeerRemovedCallback callback);

private:
    const std::chrono::seconds timeout_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Peer> peers_;

    mutable std::mutex callback_mutex_;
    PeerCallback on_discovered_;
    PeerCallback on_updated_;
    PeerRemovedCallback on_removed_;
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_PEER_REGISTRY_H
