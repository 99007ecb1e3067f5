#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace stratus::transfer {

// Byte progress with throughput measured over a sliding window.
class TransferProgress {
public:
    using Clock = std::chrono::steady_clock;

    explicit TransferProgress(uintmax_t totalBytes, std::chrono::seconds window = std::chrono::seconds(10));

    // Transferred counts are absolute and never move backwards.
    void update(uintmax_t transferred, Clock::time_point now = Clock::now());

    [[nodiscard]] uintmax_t total() const { return total_; }
    [[nodiscard]] uintmax_t transferred() const;
    [[nodiscard]] double fraction() const;
    [[nodiscard]] double bytesPerSecond() const;
    [[nodiscard]] std::optional<std::chrono::seconds> eta() const;

private:
    const uintmax_t total_;
    const std::chrono::seconds window_;
    mutable std::mutex mutex_;
    uintmax_t transferred_ = 0;
    std::deque<std::pair<Clock::time_point, uintmax_t>> samples_;
};

}
