#include "RescanChannel.hpp"


// Desc: post a rescan request (coalesces with a pending one)
// In: (none)
// Out: void
void RescanChannel::request() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pending_ = true;
        ++requested_;
    }
    cv_.notify_one();
}


// Desc: wait for a request, the timeout or shutdown
// In: std::chrono::milliseconds timeout
// Out: WakeReason (Shutdown wins over a pending request)
WakeReason RescanChannel::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, timeout, [this]{ return shutdown_ || pending_; });
    if (shutdown_) return WakeReason::Shutdown;
    if (pending_) {
        pending_ = false;
        ++delivered_;
        return WakeReason::Rescan;
    }
    return WakeReason::Timeout;
}


// Desc: wake every waiter and make further waits return immediately
// In: (none)
// Out: void
void RescanChannel::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        shutdown_ = true;
    }
    cv_.notify_all();
}

bool RescanChannel::isShutdown() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return shutdown_;
}

uint64_t RescanChannel::requested() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return requested_;
}

uint64_t RescanChannel::delivered() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return delivered_;
}
