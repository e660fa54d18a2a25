#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fk::config;

template<>
struct convert<FilesConfig> {
    static bool decode(const Node& node, FilesConfig& rhs) {
        if (!node.IsMap()) return false;
        for (const auto& it : node) rhs.entries[it.first.as<std::string>()] = expandPath(it.second.as<std::string>());
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("filekeeper");
        rhs.user = node["user"].as<std::string>("filekeeper");
        rhs.password = node["password"].as<std::string>("");
        rhs.maintenance_db = node["maintenance_db"].as<std::string>("postgres");
        return true;
    }
};

template<>
struct convert<WatchConfig> {
    static bool decode(const Node& node, WatchConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.poll_interval_ms = node["poll_interval_ms"].as<unsigned int>(250);
        rhs.move_pair_timeout_ms = node["move_pair_timeout_ms"].as<unsigned int>(500);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.filekeeper = spdlog::level::from_str(node["filekeeper"].as<std::string>("info"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.manifest = spdlog::level::from_str(node["manifest"].as<std::string>("info"));
        rhs.watch = spdlog::level::from_str(node["watch"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_dir"]) rhs.log_dir = expandPath(node["log_dir"].as<std::string>());
        rhs.levels.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.levels.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.levels.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
