#pragma once

#include "database/AuxTables.hpp"
#include "database/DBConnection.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <type_traits>
#include <utility>
#include <string>
#include <pqxx/pqxx>

namespace fk::database {

// AuxTables over one Postgres connection shared by all watch handlers.
class PgAuxTables final : public AuxTables {
public:
    explicit PgAuxTables(const config::DatabaseConfig& config);
    ~PgAuxTables() override;

    [[nodiscard]] bool tableExists(const std::string& name) override;
    void dropTable(const std::string& name) override;
    void flagForCleanup(const std::string& name) override;
    void dropFlagged() override;
    void close() override;

private:
    std::unique_ptr<DBConnection> conn_;
    std::set<std::string> flagged_;
    std::mutex mutex_;

    template <typename Func>
    auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        std::scoped_lock lock(mutex_);
        logging::LogRegistry::db()->trace("[PgAuxTables::exec] Starting transaction: {}", ctx);
        pqxx::work txn(conn_->get());

        try {
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
            } else {
                auto result = func(txn);
                txn.commit();
                return result;
            }
        } catch (...) {
            logging::LogRegistry::db()->error("[PgAuxTables::exec] Exception in transaction context '{}', rolling back", ctx);
            throw;
        }
    }
};

} // namespace fk::database
