#ifndef LANSHARE_DISCOVERY_CLEANUP_SWEEPER_H
#define LANSHARE_DISCOVERY_CLEANUP_SWEEPER_H

#include "lanshare/discovery/peer_registry.h"
#include <elio/elio.hpp>
#include <memory>
#include <chrono>
#include <stop_token>

namespace lanshare {

// Evicts peers whose last announcement is older than the timeout
class CleanupSweeper {
public:
    CleanupSweeper(std::shared_ptr<PeerRegistry> registry,
                   std::chrono::seconds interval,
                   std::chrono::seconds timeout);

    size_t sweep_once();

    elio::coro::task<void> run(std::stop_token stop);

    std::chrono::seconds interval() const { return interval_; }
    std::chrono::seconds timeout() const { return timeout_; }

private:
    std::shared_ptr<PeerRegistry> registry_;
    std::chrono::seconds interval_;
    std::chrono::seconds timeout_;
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_CLEANUP_SWEEPER_H
