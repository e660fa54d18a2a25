#pragma once

#include <filesystem>
#include <functional>
#include <set>
#include <vector>

namespace fs = std::filesystem;

namespace fk::core {

    // Recursive walk that never throws: a directory that cannot be opened or
    // read (typically removed mid-walk) is logged and skipped.
    class DirectoryWalker {
    public:
        std::vector<fs::path> walk(const fs::path& root,
                                   std::function<bool(const fs::directory_entry&)> filter = nullptr) const;

        // Absolute paths of every regular file under root.
        std::set<fs::path> scan(const fs::path& root) const;
    };

} // namespace fk::core
