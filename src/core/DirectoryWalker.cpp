#include "core/DirectoryWalker.hpp"
#include "logging/LogRegistry.hpp"

#include <system_error>
#include <utility>

using namespace fk::logging;

namespace fk::core {

    std::vector<fs::path> DirectoryWalker::walk(
            const fs::path& root,
            std::function<bool(const fs::directory_entry&)> filter) const
    {
        std::vector<fs::path> entries;

        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            LogRegistry::manifest()->debug("[DirectoryWalker] Not a directory, nothing to walk: {}", root.string());
            return entries;
        }

        constexpr auto opts = fs::directory_options::skip_permission_denied;
        std::vector<fs::path> pending{fs::absolute(root).lexically_normal()};

        while (!pending.empty()) {
            const auto dir = std::move(pending.back());
            pending.pop_back();

            fs::directory_iterator it(dir, opts, ec);
            if (ec) {
                LogRegistry::manifest()->debug("[DirectoryWalker] Skipping {}: {}", dir.string(), ec.message());
                continue;
            }

            for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
                if (ec) break;

                const auto& dir_entry = *it;
                std::error_code entryEc;
                if (dir_entry.is_directory(entryEc) && !dir_entry.is_symlink(entryEc)) pending.push_back(dir_entry.path());

                try {
                    if (filter && !filter(dir_entry)) continue;
                    entries.push_back(dir_entry.path());
                } catch (const fs::filesystem_error& e) {
                    LogRegistry::manifest()->warn("[DirectoryWalker] Error accessing {}: {}", dir_entry.path().string(), e.what());
                }
            }

            if (ec) {
                LogRegistry::manifest()->debug("[DirectoryWalker] Stopped reading {}: {}", dir.string(), ec.message());
                ec.clear();
            }
        }

        return entries;
    }

    std::set<fs::path> DirectoryWalker::scan(const fs::path& root) const {
        const auto files = walk(root, [](const fs::directory_entry& e) {
            std::error_code ec;
            return e.is_regular_file(ec);
        });
        return {files.begin(), files.end()};
    }

} // namespace fk::core
