#include "transfer/TransferProgress.hpp"

#include <algorithm>

using namespace stratus::transfer;

TransferProgress::TransferProgress(const uintmax_t totalBytes, const std::chrono::seconds window)
    : total_(totalBytes), window_(window) {}

void TransferProgress::update(const uintmax_t transferred, const Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    transferred_ = std::max(transferred_, std::min(transferred, total_));
    samples_.emplace_back(now, transferred_);
    while (samples_.size() > 2 && now - samples_.front().first > window_) samples_.pop_front();
}

uintmax_t TransferProgress::transferred() const {
    std::scoped_lock lock(mutex_);
    return transferred_;
}

double TransferProgress::fraction() const {
    std::scoped_lock lock(mutex_);
    if (total_ == 0) return transferred_ == 0 && samples_.empty() ? 0.0 : 1.0;
    return static_cast<double>(transferred_) / static_cast<double>(total_);
}

double TransferProgress::bytesPerSecond() const {
    std::scoped_lock lock(mutex_);
    if (samples_.size() < 2) return 0.0;

    const auto& [t0, b0] = samples_.front();
    const auto& [t1, b1] = samples_.back();
    const auto secs = std::chrono::duration<double>(t1 - t0).count();
    if (secs <= 0.0) return 0.0;
    return static_cast<double>(b1 - b0) / secs;
}

std::optional<std::chrono::seconds> TransferProgress::eta() const {
    const auto rate = bytesPerSecond();
    const auto done = transferred();
    if (done >= total_) return std::chrono::seconds(0);
    if (rate <= 0.0) return std::nullopt;
    return std::chrono::seconds(static_cast<long long>(static_cast<double>(total_ - done) / rate + 0.5));
}
