#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Process-wide cancellation flag every blocking wait can be woken from.
class StopSignal {
public:
    void requestStop() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    bool stopRequested() const { return stop_.load(); }

    // Sleeps for d unless stopped first. Returns true if stop was requested.
    template <class Rep, class Period>
    bool waitFor(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, d, [&] { return stop_.load(); });
    }

    void reset() {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_ = false;
    }

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::atomic<bool> stop_{false};
};
