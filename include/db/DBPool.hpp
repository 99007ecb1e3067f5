#pragma once

#include "db/DBConnection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace stratus::db {

class DBPool {
  public:
    explicit DBPool(const config::DatabaseConfig& cfg) {
        const size_t size = cfg.pool_size == 0 ? 1 : cfg.pool_size;
        for (size_t i = 0; i < size; ++i) pool_.push(std::make_unique<DBConnection>(cfg));
    }

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        {
            std::lock_guard lock(mtx_);
            pool_.push(std::move(conn));
        }
        cv_.notify_one();
    }

    void initPreparedStatements() {
        std::lock_guard lock(mtx_);
        const auto n = pool_.size();
        for (size_t i = 0; i < n; ++i) {
            auto conn = std::move(pool_.front());
            pool_.pop();
            conn->initPrepared();
            pool_.push(std::move(conn));
        }
    }

  private:
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace stratus::db
