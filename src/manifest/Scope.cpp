#include "manifest/Scope.hpp"
#include "store/KeyedFileStore.hpp"
#include "util/fsPath.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace fk::manifest;
using namespace fk::store;
using namespace fk::logging;

std::string fk::manifest::processKey(const unsigned int processId) { return fmt::format("process-{}", processId); }

Scope Scope::dropbox(const fs::path& root) {
    return {DROPBOX_KEY, std::nullopt, fs::absolute(root).lexically_normal()};
}

Scope Scope::forProcess(const unsigned int processId, const fs::path& output) {
    return {processKey(processId), processId, fs::absolute(output).lexically_normal()};
}

std::string Scope::tableName(const std::string& id) const {
    if (process) return fmt::format("data_{}_{}", *process, id);
    return fmt::format("data_dropbox_{}", id);
}

Manifest Scope::read(const KeyedFileStore& store) const {
    if (!store.contains(key)) return {};
    const auto& value = store.at(key);
    if (!process) return value.get<Manifest>();
    if (!value.contains("files")) return {};
    return value.at("files").get<Manifest>();
}

void Scope::write(KeyedFileStore& store, const Manifest& manifest) const {
    if (!process) store.set(key, manifest);
    else store.at(key)["files"] = manifest;
}

std::vector<Scope> fk::manifest::processScopes(const KeyedFileStore& store) {
    std::vector<Scope> scopes;
    if (!store.contains(PROCESS_ID_KEY)) return scopes;

    const auto last = store.at(PROCESS_ID_KEY).get<long long>();
    if (last < 0 || last >= std::numeric_limits<unsigned int>::max())
        throw std::out_of_range(fmt::format("Stored {} is out of range: {}", PROCESS_ID_KEY, last));

    for (unsigned int i = 0; i <= static_cast<unsigned int>(last); ++i) {
        const auto key = processKey(i);
        if (!store.contains(key)) continue;

        const auto& record = store.at(key);
        if (!record.is_object() || !record.contains("output")) {
            LogRegistry::manifest()->warn("[Scope] Record {} has no output directory, skipping", key);
            continue;
        }
        scopes.push_back(Scope::forProcess(i, record.at("output").get<std::string>()));
    }
    return scopes;
}

std::optional<Scope> fk::manifest::resolveProcess(const KeyedFileStore& store, const fs::path& path) {
    std::optional<Scope> best;
    for (auto& scope : processScopes(store)) {
        if (!util::isUnder(path, scope.root)) continue;
        if (!best || util::depth(scope.root) > util::depth(best->root)) best = std::move(scope);
    }
    return best;
}

ScopeResolver fk::manifest::dropboxResolver(const fs::path& root) {
    return [scope = Scope::dropbox(root)](const KeyedFileStore&, const fs::path& path) -> std::optional<Scope> {
        if (util::isUnder(path, scope.root)) return scope;
        return std::nullopt;
    };
}

ScopeResolver fk::manifest::processResolver() {
    return [](const KeyedFileStore& store, const fs::path& path) { return resolveProcess(store, path); };
}
