#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace fritz {

// Cooperative stop request shared between the signal handler and the polling loop.
class ShutdownSignal {
public:
    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_ = true;
        }
        cv_.notify_all();
    }

    bool requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }

    /**
     * Sleeps for the given duration unless shutdown is requested first.
     * @return true if the full duration elapsed, false if shutdown was requested.
     */
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return requested_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool requested_ = false;
};

}
