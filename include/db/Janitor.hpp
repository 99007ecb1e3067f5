#pragma once

#include "concurrency/AsyncService.hpp"
#include "db/MetadataStore.hpp"

#include <chrono>

namespace stratus::db {

// Periodically drops upload sessions that outlived their TTL.
class Janitor final : public concurrency::AsyncService {
public:
    Janitor(MetadataStorePtr store, std::chrono::minutes sweepInterval);
    ~Janitor() override;

    size_t sweepOnce();

protected:
    void runLoop() override;

private:
    MetadataStorePtr store_;
    std::chrono::minutes sweep_interval_;
};

}
