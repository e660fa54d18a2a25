#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace fk::config {

const fs::path& FilesConfig::at(const std::string& key) const {
    const auto it = entries.find(key);
    if (it == entries.end()) throw std::runtime_error("No path configured for files." + key);
    return it->second;
}

std::set<fs::path> FilesConfig::destinations() const {
    std::set<fs::path> out;
    for (const auto& [key, path] : entries)
        if (!key.ends_with("-dir")) out.insert(path);
    return out;
}

fs::path expandPath(const std::string& raw) {
    std::string expanded = raw;
    if (expanded.starts_with("~")) {
        const char* home = std::getenv("HOME");
        if (!home) throw std::runtime_error("Cannot expand '~' in " + raw + ": HOME is not set");
        expanded.replace(0, 1, home);
    }
    return fs::absolute(expanded).lexically_normal();
}

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& section, T& out, const std::string& path) {
    const auto node = root[section];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Invalid '" + section + "' section in " + path + ": expected a map");
}

}

Config loadConfig(const std::string& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path);

    decodeSection(root, "files", cfg.files, path);
    decodeSection(root, "database", cfg.database, path);
    decodeSection(root, "watch", cfg.watch, path);
    decodeSection(root, "logging", cfg.logging, path);

    return cfg;
}

} // namespace fk::config
