#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace stratus::concurrency {

// Cooperative cancellation flag shared between a task and whoever may cancel it.
class CancellationToken {
public:
    void cancel() {
        {
            std::scoped_lock lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Interruptible sleep; returns true if cancelled before the delay elapsed.
    template <class Rep, class Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& delay) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, delay, [this] { return isCancelled(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}
