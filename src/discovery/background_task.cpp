#include "lanshare/discovery/background_task.h"
#include "lanshare/base/logger.h"
#include <algorithm>

namespace lanshare {

elio::coro::task<bool> sleep_unless_stopped(std::chrono::milliseconds duration, std::stop_token stop) {
    auto remaining = duration;
    while (remaining.count() > 0) {
        if (stop.stop_requested()) {
            co_return false;
        }
        auto slice = std::min(remaining, kStopCheckInterval);
        co_await elio::time::sleep_for(slice);
        remaining -= slice;
    }
    co_return !stop.stop_requested();
}

BackgroundTask::BackgroundTask(std::string name, Body body)
    : name_(std::move(name)) {
    thread_ = std::thread([this, body = std::move(body), token = stop_source_.get_token()]() {
        Logger::instance().debug("{} task started", name_);

        try {
            elio::run(body(token));
        } catch (const std::exception& e) {
            Logger::instance().error("{} task terminated: {}", name_, e.what());
        }

        running_ = false;
        Logger::instance().debug("{} task stopped", name_);
    });
}

BackgroundTask::~BackgroundTask() {
    stop();
}

void BackgroundTask::request_stop() {
    stop_source_.request_stop();
}

void BackgroundTask::stop() {
    request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace lanshare
