#pragma once

#include <string>

namespace fk::database {

// Per-file derived tables, named deterministically from scope and entry ID.
class AuxTables {
public:
    virtual ~AuxTables() = default;

    [[nodiscard]] virtual bool tableExists(const std::string& name) = 0;

    // No-op if the table is already gone.
    virtual void dropTable(const std::string& name) = 0;

    // Tables to drop at shutdown (scratch tables created for a single request).
    virtual void flagForCleanup(const std::string& name) = 0;
    virtual void dropFlagged() = 0;

    virtual void close() = 0;
};

} // namespace fk::database
