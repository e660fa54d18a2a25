#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <stdexcept>

namespace fk::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    spdlog::info("[LogRegistry] Initializing... LogDir: {}", logDir.string());

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);
    const auto log_file = logDir / "filekeeper.log";

    const auto cnf = config::ConfigRegistry::get().logging;

    const auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file.string(), MAX_LOG_BYTES, MAX_LOG_FILES);
    rotatingSink->set_level(cnf.levels.file_log_level);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{consoleSink, rotatingSink});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("filekeeper", sub_levels.filekeeper);
    makeLogger("store",      sub_levels.store);
    makeLogger("manifest",   sub_levels.manifest);
    makeLogger("watch",      sub_levels.watch);
    makeLogger("db",         sub_levels.db);

    initialized_ = true;
    spdlog::info("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

} // namespace fk::logging
