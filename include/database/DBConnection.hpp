#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace fk::database {

class DBConnection {
  public:
    // Connects to config.name, creating the database first (through
    // config.maintenance_db) if it does not exist yet.
    explicit DBConnection(const config::DatabaseConfig& config);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;
    [[nodiscard]] bool isOpen() const;

    void close();

  private:
    std::unique_ptr<pqxx::connection> conn_;

    static std::string connectionString(const config::DatabaseConfig& config, const std::string& dbName);
    static void ensureDatabase(const config::DatabaseConfig& config);
};

} // namespace fk::database
