#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace stratus::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;
    [[nodiscard]] bool isOpen() const;

    // Re-prepares statements if they had been prepared on the old session.
    void reconnect();

    void initPrepared();

  private:
    std::string connectionString_;
    std::unique_ptr<pqxx::connection> conn_;
    bool prepared_ = false;

    void initPreparedFileMetadata() const;
    void initPreparedUploadSessions() const;
};

} // namespace stratus::db
