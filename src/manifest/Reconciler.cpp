#include "manifest/Reconciler.hpp"
#include "manifest/IdAllocator.hpp"
#include "logging/LogRegistry.hpp"

#include <set>
#include <utility>

using namespace fk::manifest;
using namespace fk::logging;

Reconciler::Reconciler(core::DirectoryWalker walker) : walker_(std::move(walker)) {}

Delta Reconciler::reconcile(Manifest& manifest, const std::filesystem::path& root) const {
    Delta delta;
    const auto base = std::filesystem::absolute(root).lexically_normal();
    const auto current = walker_.scan(base);

    std::set<std::filesystem::path> recorded;
    for (auto it = manifest.begin(); it != manifest.end();) {
        if (!current.contains(it->second.full_path)) {
            LogRegistry::manifest()->info("[Reconciler] Deleting file {} from manifest --> {}", it->first, it->second.full_path.string());
            delta.removed.push_back(it->first);
            it = manifest.erase(it);
            continue;
        }
        recorded.insert(it->second.full_path);
        ++it;
    }

    for (const auto& file : current) {
        if (recorded.contains(file)) continue;
        auto id = nextId(manifest);
        LogRegistry::manifest()->info("[Reconciler] Assigning file: {} --> {}", id, file.string());
        manifest.emplace(id, Entry(file, base));
        delta.added.push_back(std::move(id));
    }

    return delta;
}
