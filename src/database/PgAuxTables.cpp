#include "database/PgAuxTables.hpp"

using namespace fk::database;
using namespace fk::logging;

PgAuxTables::PgAuxTables(const config::DatabaseConfig& config)
    : conn_(std::make_unique<DBConnection>(config)) {}

PgAuxTables::~PgAuxTables() { close(); }

bool PgAuxTables::tableExists(const std::string& name) {
    return exec("PgAuxTables::tableExists", [&](pqxx::work& txn) {
        return !txn.exec_params("SELECT 1 FROM information_schema.tables WHERE table_schema = current_schema() AND table_name = $1", name).empty();
    });
}

void PgAuxTables::dropTable(const std::string& name) {
    try {
        exec("PgAuxTables::dropTable", [&](pqxx::work& txn) {
            txn.exec("DROP TABLE IF EXISTS " + txn.quote_name(name));
        });
        LogRegistry::db()->info("[PgAuxTables] Dropped table {}", name);
    } catch (const pqxx::undefined_table&) {
        LogRegistry::db()->debug("[PgAuxTables] Table {} already absent", name);
    }
}

void PgAuxTables::flagForCleanup(const std::string& name) {
    std::scoped_lock lock(mutex_);
    flagged_.insert(name);
}

void PgAuxTables::dropFlagged() {
    std::set<std::string> tables;
    {
        std::scoped_lock lock(mutex_);
        tables.swap(flagged_);
    }
    for (const auto& table : tables) dropTable(table);
}

void PgAuxTables::close() {
    std::scoped_lock lock(mutex_);
    if (conn_ && conn_->isOpen()) {
        conn_->close();
        LogRegistry::db()->debug("[PgAuxTables] Connection closed");
    }
}
