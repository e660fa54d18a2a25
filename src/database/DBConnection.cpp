#include "database/DBConnection.hpp"
#include "logging/LogRegistry.hpp"

#include <pqxx/pqxx>
#include <stdexcept>

using namespace fk::logging;

namespace fk::database {

std::string DBConnection::connectionString(const config::DatabaseConfig& config, const std::string& dbName) {
    std::string out = "host=" + config.host + " port=" + std::to_string(config.port) + " dbname=" + dbName
                      + " user=" + config.user;
    if (!config.password.empty()) out += " password=" + config.password;
    return out;
}

void DBConnection::ensureDatabase(const config::DatabaseConfig& config) {
    pqxx::connection admin(connectionString(config, config.maintenance_db));
    pqxx::nontransaction txn(admin);

    const auto res = txn.exec_params("SELECT 1 FROM pg_database WHERE datname = $1", config.name);
    if (res.empty()) {
        LogRegistry::db()->info("[DBConnection] Creating database {}", config.name);
        txn.exec("CREATE DATABASE " + txn.quote_name(config.name));
    }
    admin.close();
}

DBConnection::DBConnection(const config::DatabaseConfig& config) {
    try {
        ensureDatabase(config);
        conn_ = std::make_unique<pqxx::connection>(connectionString(config, config.name));
    } catch (const pqxx::broken_connection& e) {
        throw std::runtime_error("Unable to connect to the Postgres server at " + config.host + ":"
                                 + std::to_string(config.port) + ": " + e.what());
    }
    LogRegistry::db()->debug("[DBConnection] Connected to {}", config.name);
}

DBConnection::~DBConnection() { close(); }

pqxx::connection& DBConnection::get() const {
    if (!conn_) throw std::runtime_error("Database connection is closed");
    return *conn_;
}

bool DBConnection::isOpen() const { return conn_ && conn_->is_open(); }

void DBConnection::close() {
    if (conn_ && conn_->is_open()) conn_->close();
    conn_.reset();
}

} // namespace fk::database
