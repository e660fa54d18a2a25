#pragma once

#include "manifest/Entry.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fk::store {
class KeyedFileStore;
}

namespace fk::manifest {

inline constexpr auto DROPBOX_KEY = "dropbox";
inline constexpr auto PROCESS_ID_KEY = "processid";

std::string processKey(unsigned int processId);

/**
 * One manifest and the root its entries are relative to: either the dropbox
 * archive (top-level key "dropbox") or the output directory of one process
 * (the "files" member of "process-N").
 */
struct Scope {
    std::string key;
    std::optional<unsigned int> process;
    std::filesystem::path root;

    static Scope dropbox(const std::filesystem::path& root);
    static Scope forProcess(unsigned int processId, const std::filesystem::path& output);

    // Auxiliary table holding derived data for the entry with this ID.
    [[nodiscard]] std::string tableName(const std::string& id) const;

    [[nodiscard]] Manifest read(const store::KeyedFileStore& store) const;
    void write(store::KeyedFileStore& store, const Manifest& manifest) const;

    bool operator==(const Scope& other) const { return key == other.key; }
};

using ScopeResolver = std::function<std::optional<Scope>(const store::KeyedFileStore&, const std::filesystem::path&)>;

// Every process record from 0 to the stored "processid" that has an output directory.
// Throws std::out_of_range if "processid" is negative or does not fit an unsigned int.
std::vector<Scope> processScopes(const store::KeyedFileStore& store);

// The process whose output contains path; the deepest output wins.
std::optional<Scope> resolveProcess(const store::KeyedFileStore& store, const std::filesystem::path& path);

ScopeResolver dropboxResolver(const std::filesystem::path& root);
ScopeResolver processResolver();

} // namespace fk::manifest
