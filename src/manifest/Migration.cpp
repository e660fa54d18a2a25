#include "manifest/Migration.hpp"
#include "manifest/Entry.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace fk::logging;

namespace fs = std::filesystem;

namespace fk::manifest::migration {

bool upgradeDropbox(nlohmann::json& dropbox, const fs::path& root) {
    if (!dropbox.is_object()) throw std::runtime_error("Dropbox manifest is not a JSON object");

    bool changed = false;
    for (auto& [id, value] : dropbox.items()) {
        if (!value.is_string()) continue;

        LogRegistry::manifest()->info("[Migration] Updating dropbox entry {} to new format", id);
        fs::path file = value.get<std::string>();
        if (file.is_relative()) file = root / file;
        value = Entry(file.lexically_normal(), root);
        changed = true;
    }
    return changed;
}

bool upgradeProcessFiles(nlohmann::json& record) {
    if (!record.contains("files")) {
        record["files"] = nlohmann::json::object();
        return true;
    }

    auto& files = record["files"];
    if (!files.is_array()) return false;

    const fs::path output = record.at("output").get<std::string>();
    LogRegistry::manifest()->info("[Migration] Updating file manifest of process output {} to new format", output.string());

    Manifest manifest;
    std::size_t id = 0;
    for (const auto& file : files) manifest.emplace(std::to_string(id++), Entry(file.get<std::string>(), output));

    files = manifest;
    return true;
}

} // namespace fk::manifest::migration
