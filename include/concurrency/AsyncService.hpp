#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace stratus::concurrency {

// A named service whose runLoop() executes on a dedicated thread.
class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    // Wakes sleepers in waitForInterrupt() and loops blocked on wakeCv_.
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;

    virtual void runLoop() = 0;

    // Sleep until the timeout passes or stop() is requested. Returns true when interrupted.
    template <class Rep, class Period>
    bool waitForInterrupt(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(wakeMutex_);
        return wakeCv_.wait_for(lock, timeout, [this] { return interruptFlag_.load(std::memory_order_acquire); });
    }
};

}
