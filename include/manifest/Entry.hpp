#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace fk::manifest {

struct Entry {
    std::filesystem::path full_path;
    std::string display_name;   // full_path relative to the scope root
    std::string description;

    Entry() = default;
    Entry(const std::filesystem::path& file, const std::filesystem::path& root);

    bool operator==(const Entry&) const = default;
};

// ID -> entry, scoped to one root.
using Manifest = std::map<std::string, Entry>;

void to_json(nlohmann::json& j, const Entry& e);
void from_json(const nlohmann::json& j, Entry& e);

} // namespace fk::manifest
