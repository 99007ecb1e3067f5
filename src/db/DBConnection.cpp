#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace stratus::db;

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : connectionString_(fmt::format("host={} port={} dbname={} user={} password={}",
                                    cfg.host, cfg.port, cfg.name, cfg.user, cfg.password)),
      conn_(std::make_unique<pqxx::connection>(connectionString_)) {
    log::Registry::db()->debug("[DBConnection] Connected to {}:{}/{}", cfg.host, cfg.port, cfg.name);
}

DBConnection::~DBConnection() {
    if (conn_ && conn_->is_open()) conn_->close();
}

pqxx::connection& DBConnection::get() const { return *conn_; }

bool DBConnection::isOpen() const { return conn_ && conn_->is_open(); }

void DBConnection::reconnect() {
    log::Registry::db()->warn("[DBConnection] Re-establishing database connection");
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    if (prepared_) {
        prepared_ = false;
        initPrepared();
    }
}

void DBConnection::initPrepared() {
    if (!isOpen()) throw std::runtime_error("Database connection is not open");

    initPreparedFileMetadata();
    initPreparedUploadSessions();
    prepared_ = true;
}
