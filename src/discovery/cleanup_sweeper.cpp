#include "lanshare/discovery/cleanup_sweeper.h"
#include "lanshare/discovery/background_task.h"
#include "lanshare/base/logger.h"

namespace lanshare {

CleanupSweeper::CleanupSweeper(std::shared_ptr<PeerRegistry> registry,
                               std::chrono::seconds interval,
                               std::chrono::seconds timeout)
    : registry_(std::move(registry)), interval_(interval), timeout_(timeout) {}

size_t CleanupSweeper::sweep_once() {
    return registry_->sweep(timeout_);
}

elio::coro::task<void> CleanupSweeper::run(std::stop_token stop) {
    Logger::instance().info("Stale peer cleanup every {}s (timeout {}s)", interval_.count(), timeout_.count());

    while (co_await sleep_unless_stopped(interval_, stop)) {
        sweep_once();
    }
}

} // namespace lanshare
