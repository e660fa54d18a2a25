#include "watch/EventHandlers.hpp"
#include "watch/Watcher.hpp"
#include "manifest/IdAllocator.hpp"
#include "store/StoreGate.hpp"
#include "database/AuxTables.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

using namespace fk::watch;
using namespace fk::manifest;
using namespace fk::store;
using namespace fk::logging;

namespace fs = std::filesystem;

namespace {

Manifest::iterator findByPath(Manifest& manifest, const fs::path& path) {
    return std::ranges::find_if(manifest, [&](const auto& item) { return item.second.full_path == path; });
}

}

EventHandlers::EventHandlers(std::string name,
                             std::shared_ptr<StoreGate> gate,
                             std::shared_ptr<database::AuxTables> tables,
                             ScopeResolver resolver)
    : name_(std::move(name)), gate_(std::move(gate)), tables_(std::move(tables)), resolver_(std::move(resolver)) {
    if (!gate_ || !tables_ || !resolver_) throw std::invalid_argument("EventHandlers requires a gate, tables and a resolver");
}

void EventHandlers::onCreated(const fs::path& path) const {
    gate_->update(name_ + "::onCreated", [&](KeyedFileStore& store) {
        const auto scope = resolver_(store, path);
        if (!scope) {
            LogRegistry::manifest()->debug("[{}] Ignoring created file outside every scope: {}", name_, path.string());
            return false;
        }
        return insert(store, *scope, path);
    });
}

void EventHandlers::onDeleted(const fs::path& path) const {
    gate_->update(name_ + "::onDeleted", [&](KeyedFileStore& store) {
        const auto scope = resolver_(store, path);
        if (!scope) {
            LogRegistry::manifest()->debug("[{}] Ignoring deleted file outside every scope: {}", name_, path.string());
            return false;
        }
        return remove(store, *scope, path);
    });
}

void EventHandlers::onMoved(const fs::path& src, const fs::path& dest) const {
    gate_->update(name_ + "::onMoved", [&](KeyedFileStore& store) {
        const auto srcScope = resolver_(store, src);
        const auto destScope = resolver_(store, dest);

        if (srcScope && destScope && *srcScope == *destScope) return rename(store, *srcScope, src, dest);

        bool changed = false;
        if (srcScope) changed = remove(store, *srcScope, src) || changed;
        if (destScope) changed = insert(store, *destScope, dest) || changed;
        if (!srcScope && !destScope)
            LogRegistry::manifest()->debug("[{}] Ignoring move outside every scope: {} -> {}", name_, src.string(), dest.string());
        return changed;
    });
}

void EventHandlers::attach(Watcher& watcher, const std::shared_ptr<const EventHandlers>& handlers) {
    watcher.subscribe(Event::Type::Created, [handlers](const Event& e) { handlers->onCreated(e.src); });
    watcher.subscribe(Event::Type::Deleted, [handlers](const Event& e) { handlers->onDeleted(e.src); });
    watcher.subscribe(Event::Type::Moved, [handlers](const Event& e) { handlers->onMoved(e.src, e.dest); });
}

bool EventHandlers::insert(KeyedFileStore& store, const Scope& scope, const fs::path& path) const {
    auto manifest = scope.read(store);
    if (findByPath(manifest, path) != manifest.end()) {
        LogRegistry::manifest()->debug("[{}] {} already tracked in {}", name_, path.string(), scope.key);
        return false;
    }

    const auto id = nextId(manifest);
    manifest.emplace(id, Entry(path, scope.root));
    scope.write(store, manifest);

    LogRegistry::manifest()->info("[{}] New file in {}: assigning id {} --> {}", name_, scope.key, id, path.string());
    return true;
}

bool EventHandlers::remove(KeyedFileStore& store, const Scope& scope, const fs::path& path) const {
    auto manifest = scope.read(store);
    const auto it = findByPath(manifest, path);
    if (it == manifest.end()) return false;

    const auto id = it->first;
    manifest.erase(it);
    scope.write(store, manifest);
    LogRegistry::manifest()->info("[{}] Deleted file from {}: {} --> {}", name_, scope.key, id, path.string());

    const auto table = scope.tableName(id);
    if (tables_->tableExists(table)) tables_->dropTable(table);
    return true;
}

bool EventHandlers::rename(KeyedFileStore& store, const Scope& scope, const fs::path& src, const fs::path& dest) const {
    auto manifest = scope.read(store);
    const auto it = findByPath(manifest, src);
    if (it == manifest.end()) {
        LogRegistry::manifest()->debug("[{}] Moved file {} was not tracked in {}, adding it", name_, src.string(), scope.key);
        return insert(store, scope, dest);
    }

    const auto id = it->first;
    it->second = Entry(dest, scope.root);

    // Renamed over a tracked file: that entry is gone.
    std::optional<std::string> replaced;
    for (auto other = manifest.begin(); other != manifest.end(); ++other) {
        if (other->first == id || other->second.full_path != dest) continue;
        replaced = other->first;
        manifest.erase(other);
        break;
    }
    scope.write(store, manifest);
    LogRegistry::manifest()->info("[{}] Moving file {} in {} ({} --> {})", name_, id, scope.key, src.string(), dest.string());

    if (replaced) {
        const auto table = scope.tableName(*replaced);
        if (tables_->tableExists(table)) tables_->dropTable(table);
    }
    return true;
}
