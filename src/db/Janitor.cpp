#include "db/Janitor.hpp"
#include "log/Registry.hpp"

using namespace stratus::db;

Janitor::Janitor(MetadataStorePtr store, const std::chrono::minutes sweepInterval)
    : AsyncService("SessionJanitor"), store_(std::move(store)), sweep_interval_(sweepInterval) {}

Janitor::~Janitor() { stop(); }

size_t Janitor::sweepOnce() {
    const auto purged = store_->purgeExpiredSessions(util::Clock::now());
    if (purged > 0) log::Registry::db()->info("[SessionJanitor] Purged {} expired upload sessions", purged);
    return purged;
}

void Janitor::runLoop() {
    while (!interruptFlag_.load(std::memory_order_acquire)) {
        try {
            sweepOnce();
        } catch (const std::exception& e) {
            log::Registry::stratus()->warn("[SessionJanitor] Failed to purge expired upload sessions: {}", e.what());
        }

        if (waitForInterrupt(sweep_interval_)) break;
    }
}
