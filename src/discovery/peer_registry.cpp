#include "lanshare/discovery/peer_registry.h"
#include "lanshare/base/logger.h"
#include <vector>

namespace lanshare {

PeerRegistry::PeerRegistry(std::chrono::seconds timeout)
    : timeout_(timeout) {}

UpsertResult PeerRegistry::upsert(const Peer& peer) {
    UpsertResult result = UpsertResult::Inserted;
    std::string previous_endpoint;
    {
        std::unique_lock lock(mutex_);
        auto it = peers_.find(peer.id);
        if (it == peers_.end()) {
            peers_.emplace(peer.id, peer);
        } else {
            if (it->second.address != peer.address || it->second.port != peer.port) {
                result = UpsertResult::Updated;
                previous_endpoint = it->second.endpoint();
            } else {
                result = UpsertResult::Refreshed;
            }
            it->second = peer;
        }
    }

    PeerCallback callback;
    switch (result) {
        case UpsertResult::Inserted: {
            Logger::instance().info("New peer discovered: {} at {}", peer.id, peer.endpoint());
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = on_discovered_;
            break;
        }
        case UpsertResult::Updated: {
            Logger::instance().info("Peer {} updated: {} -> {}", peer.id, previous_endpoint, peer.endpoint());
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = on_updated_;
            break;
        }
        case UpsertResult::Refreshed:
            Logger::instance().debug("Peer {} refreshed", peer.id);
            break;
    }

    if (callback) {
        callback(peer);
    }
    return result;
}

bool PeerRegistry::remove(const std::string& peer_id) {
    std::optional<Peer> removed;
    {
        std::unique_lock lock(mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return false;
        }
        removed = std::move(it->second);
        peers_.erase(it);
    }

    Logger::instance().info("Peer removed: {} at {}", peer_id, removed->endpoint());

    PeerRemovedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_removed_;
    }
    if (callback) {
        callback(peer_id);
    }
    return true;
}

std::optional<Peer> PeerRegistry::find(const std::string& peer_id) const {
    std::shared_lock lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PeerList PeerRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    PeerList result;
    result.reserve(peers_.size());
    for (const auto& [id, peer] : peers_) {
        result.push_back(peer);
    }
    return result;
}

size_t PeerRegistry::count() const {
    std::shared_lock lock(mutex_);
    return peers_.size();
}

size_t PeerRegistry::sweep(std::chrono::seconds timeout, Clock::time_point now) {
    std::vector<Peer> stale;
    {
        std::unique_lock lock(mutex_);
        for (auto it = peers_.begin(); it != peers_.end();) {
            if (it->second.is_stale(timeout, now)) {
                stale.push_back(std::move(it->second));
                it = peers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (stale.empty()) {
        return 0;
    }

    for (const auto& peer : stale) {
        Logger::instance().warning("Removing stale peer: {} at {}", peer.id, peer.endpoint());
    }
    Logger::instance().info("Cleaned up {} stale peers", stale.size());

    PeerRemovedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_removed_;
    }
    if (callback) {
        for (const auto& peer : stale) {
            callback(peer.id);
        }
    }
    return stale.size();
}

size_t PeerRegistry::sweep() {
    return sweep(timeout_);
}

void PeerRegistry::set_on_peer_discovered(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_discovered_ = std::move(callback);
}

void PeerRegistry::set_on_peer_updated(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_updated_ = std::move(callback);
}

void PeerRegistry::set_on_peer_removed(PeerRemovedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_removed_ = std::move(callback);
}

} // namespace lanshare
