#pragma once

#include "manifest/Scope.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fk::store {
class KeyedFileStore;
class StoreGate;
}

namespace fk::database {
class AuxTables;
}

namespace fk::watch {

class Watcher;

/**
 * Keeps the manifests of one watched root in step with create, delete and
 * move events. Every handler is one locked reload-mutate-save round trip
 * through the StoreGate; paths outside every scope are ignored.
 */
class EventHandlers {
public:
    EventHandlers(std::string name,
                  std::shared_ptr<store::StoreGate> gate,
                  std::shared_ptr<database::AuxTables> tables,
                  manifest::ScopeResolver resolver);

    void onCreated(const std::filesystem::path& path) const;
    void onDeleted(const std::filesystem::path& path) const;

    // Same scope: the entry keeps its ID. Across scopes (or in or out of the
    // watched tree): delete from the source scope, create in the destination.
    void onMoved(const std::filesystem::path& src, const std::filesystem::path& dest) const;

    static void attach(Watcher& watcher, const std::shared_ptr<const EventHandlers>& handlers);

private:
    std::string name_;
    std::shared_ptr<store::StoreGate> gate_;
    std::shared_ptr<database::AuxTables> tables_;
    manifest::ScopeResolver resolver_;

    bool insert(store::KeyedFileStore& store, const manifest::Scope& scope, const std::filesystem::path& path) const;
    bool remove(store::KeyedFileStore& store, const manifest::Scope& scope, const std::filesystem::path& path) const;
    bool rename(store::KeyedFileStore& store, const manifest::Scope& scope,
                const std::filesystem::path& src, const std::filesystem::path& dest) const;
};

} // namespace fk::watch
