#pragma once

#include "core/DirectoryWalker.hpp"
#include "manifest/Entry.hpp"

#include <string>
#include <vector>

namespace fk::manifest {

struct Delta {
    std::vector<std::string> removed;   // IDs whose file is gone
    std::vector<std::string> added;     // IDs assigned to new files

    [[nodiscard]] bool empty() const { return removed.empty() && added.empty(); }
};

/**
 * Full-tree diff of a manifest against its root: entries whose file no longer
 * exists are dropped, and every untracked file gets the lowest free ID.
 */
class Reconciler {
public:
    explicit Reconciler(core::DirectoryWalker walker = core::DirectoryWalker{});

    Delta reconcile(Manifest& manifest, const std::filesystem::path& root) const;

private:
    core::DirectoryWalker walker_;
};

} // namespace fk::manifest
