#ifndef LANSHARE_DISCOVERY_BACKGROUND_TASK_H
#define LANSHARE_DISCOVERY_BACKGROUND_TASK_H

#include <elio/elio.hpp>
#include <string>
#include <thread>
#include <stop_token>
#include <atomic>
#include <functional>
#include <chrono>

namespace lanshare {

// Granularity of cancellation checks during interval waits
inline constexpr std::chrono::milliseconds kStopCheckInterval{100};

// Sleeps for `duration` in short slices; returns false if stop was requested
elio::coro::task<bool> sleep_unless_stopped(std::chrono::milliseconds duration, std::stop_token stop);

// One long-running coroutine driven by elio::run on a dedicated thread.
// The body receives a stop token and must return once it is signalled.
class BackgroundTask {
public:
    using Body = std::function<elio::coro::task<void>(std::stop_token)>;

    BackgroundTask(std::string name, Body body);
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    void request_stop();

    // Request stop and wait for the body to return
    void stop();

    bool is_running() const { return running_.load(); }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::stop_source stop_source_;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

} // namespace lanshare

#endif // LANSHARE_DISCOVERY_BACKGROUND_TASK_H
