#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace fk::config {

struct FilesConfig {
    // Logical key -> absolute path. Keys ending in "-dir" are directories,
    // every other key names a destination file of the data store.
    std::map<std::string, std::filesystem::path> entries = {
        {"processes", "/var/lib/filekeeper/processes.json"},
        {"dropbox", "/var/lib/filekeeper/dropbox.json"},
        {"data-dir", "/var/lib/filekeeper/data"}
    };

    [[nodiscard]] const std::filesystem::path& at(const std::string& key) const;
    [[nodiscard]] std::set<std::filesystem::path> destinations() const;
    [[nodiscard]] const std::filesystem::path& dataDir() const { return at("data-dir"); }
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "filekeeper";
    std::string user = "filekeeper";
    std::string password;
    std::string maintenance_db = "postgres";
};

struct WatchConfig {
    unsigned int poll_interval_ms = 250;
    unsigned int move_pair_timeout_ms = 500;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum filekeeper = spdlog::level::info;   // Startup and shutdown
    spdlog::level::level_enum store      = spdlog::level::warn;   // Destination file I/O
    spdlog::level::level_enum manifest   = spdlog::level::info;   // ID assignment, deletion, migration
    spdlog::level::level_enum watch      = spdlog::level::info;   // Subscriptions and dispatch failures
    spdlog::level::level_enum db         = spdlog::level::warn;   // Auxiliary table drops
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/filekeeper";
    LogLevelsConfig levels;
};

struct Config {
    FilesConfig files;
    DatabaseConfig database;
    WatchConfig watch;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

// Expands a leading "~" and makes the result absolute.
std::filesystem::path expandPath(const std::string& raw);

} // namespace fk::config
