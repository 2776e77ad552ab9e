#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// Interruptible sleep. wait_for() returns false as soon as cancel() is called
// from another thread, true when the full interval elapsed.
class CancellableWait {
public:
    bool wait_for(std::chrono::milliseconds interval) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, interval, [this] { return cancelled_; });
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};
