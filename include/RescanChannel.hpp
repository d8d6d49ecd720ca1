#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

enum class WakeReason { Rescan, Timeout, Shutdown };

// "Rescan requested" notification between the watch thread and the monitor
// loop. Requests arriving while one is pending coalesce into it.
class RescanChannel {
public:
    RescanChannel() = default;
    RescanChannel(const RescanChannel&) = delete;
    RescanChannel& operator=(const RescanChannel&) = delete;

    void request();
    WakeReason wait_for(std::chrono::milliseconds timeout);
    void shutdown();

    bool isShutdown() const;
    uint64_t requested() const;   // total request() calls
    uint64_t delivered() const;   // wake-ups that returned Rescan

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool pending_{false};
    bool shutdown_{false};
    uint64_t requested_{0};
    uint64_t delivered_{0};
};
