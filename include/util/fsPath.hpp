#pragma once

#include <filesystem>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

namespace fk::util {

inline fs::path common_path_prefix(const fs::path& a, const fs::path& b) {
    fs::path result;
    auto ait = a.begin();
    auto bit = b.begin();

    while (ait != a.end() && bit != b.end() && *ait == *bit) {
        result /= *ait;
        ++ait;
        ++bit;
    }

    return result;
}

// Component-wise containment: "/data/out10" is not under "/data/out1".
inline bool isUnder(const fs::path& path, const fs::path& root) {
    if (root.empty()) return false;
    const auto normRoot = root.lexically_normal();
    auto rootStr = normRoot.string();
    if (rootStr.size() > 1 && rootStr.back() == fs::path::preferred_separator) rootStr.pop_back();
    return common_path_prefix(path.lexically_normal(), fs::path(rootStr)) == fs::path(rootStr);
}

inline std::size_t depth(const fs::path& path) {
    return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
}

} // namespace fk::util
