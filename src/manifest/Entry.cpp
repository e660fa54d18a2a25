#include "manifest/Entry.hpp"
#include "manifest/Descriptions.hpp"

#include <nlohmann/json.hpp>

namespace fk::manifest {

Entry::Entry(const std::filesystem::path& file, const std::filesystem::path& root)
    : full_path(file),
      display_name(file.lexically_relative(root).string()),
      description(describe(suffixOf(file))) {}

void to_json(nlohmann::json& j, const Entry& e) {
    j = {
        {"fullname", e.full_path.string()},
        {"display_name", e.display_name},
        {"description", e.description}
    };
}

void from_json(const nlohmann::json& j, Entry& e) {
    e.full_path = j.at("fullname").get<std::string>();
    e.display_name = j.value("display_name", "");
    e.description = j.value("description", "");
}

} // namespace fk::manifest
