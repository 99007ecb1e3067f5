#pragma once

#include "db/DBPool.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"

#include <fmt/format.h>
#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <utility>

namespace stratus::db {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const config::DatabaseConfig& cfg) { dbPool_ = std::make_shared<DBPool>(cfg); }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            if (!conn->isOpen()) conn->reconnect();
            pqxx::work txn(conn->get());

            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const pqxx::broken_connection& e) {
            log::Registry::db()->error("[Transactions::exec] Connection lost in '{}': {}", ctx, e.what());
            dbPool_->release(std::move(conn));
            throw types::Error(types::ErrorKind::StoreUnavailable, fmt::format("{}: {}", ctx, e.what()));
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}",
                                       ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        }
    }
};

}
