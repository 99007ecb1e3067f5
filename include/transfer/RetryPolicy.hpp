#pragma once

#include "config/Config.hpp"

#include <algorithm>
#include <chrono>

namespace stratus::transfer {

// Exponential backoff with a hard attempt bound. Attempt numbers start at 0.
struct RetryPolicy {
    unsigned int max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};

    static RetryPolicy from(const config::TransferConfig& cfg) {
        return {cfg.max_retries, cfg.retry_base_delay, cfg.retry_max_delay};
    }

    static RetryPolicy from(const config::RemoteEventsConfig& cfg) {
        return {cfg.max_retries, cfg.initial_backoff, cfg.max_backoff};
    }

    [[nodiscard]] std::chrono::milliseconds delay(const unsigned int attempt) const {
        const auto scaled = base_delay * (1LL << std::min(attempt, 10u));
        return std::min<std::chrono::milliseconds>(scaled, max_delay);
    }

    [[nodiscard]] bool shouldRetry(const unsigned int attempt) const { return attempt < max_retries; }
};

}
