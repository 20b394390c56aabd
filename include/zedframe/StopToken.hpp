#pragma once
// Cooperative cancellation for the acquisition worker.

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace zedframe {

class StopToken {
public:
    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        cv_.notify_all();
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_requested_;
    }

    // Sleeps for `interval` unless a stop arrives first. Returns true if stop
    // was requested.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> interval) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, interval, [this] { return stop_requested_; });
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool stop_requested_ = false;
};

} // namespace zedframe
