#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace fk::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> filekeeper() { return get("filekeeper"); }
    static std::shared_ptr<spdlog::logger> store()      { return get("store"); }
    static std::shared_ptr<spdlog::logger> manifest()   { return get("manifest"); }
    static std::shared_ptr<spdlog::logger> watch()      { return get("watch"); }
    static std::shared_ptr<spdlog::logger> db()         { return get("db"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr auto LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr std::size_t MAX_LOG_BYTES = 1024 * 1024 * 10;
    static constexpr std::size_t MAX_LOG_FILES = 5;

    static inline bool initialized_ = false;
};

} // namespace fk::logging
