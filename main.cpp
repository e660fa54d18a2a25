// Services
#include "services/Initializer.hpp"

// Database
#include "database/PgAuxTables.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace fk::config;
using namespace fk::services;
using namespace fk::database;
using namespace fk::logging;

namespace {
constexpr auto DEFAULT_CONFIG_PATH = "/etc/filekeeper/config.yaml";

std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}
}

int main(const int argc, char* argv[]) {
    try {
        const std::filesystem::path configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;
        ConfigRegistry::init(configPath);
        LogRegistry::init(ConfigRegistry::get().logging.log_dir);

        LogRegistry::filekeeper()->info("[*] Starting filekeeper with {}", configPath.string());

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        LogRegistry::filekeeper()->info("[*] Connecting to auxiliary database...");
        auto tables = std::make_shared<PgAuxTables>(ConfigRegistry::get().database);

        Initializer initializer(ConfigRegistry::get(), tables);
        initializer.init();

        LogRegistry::filekeeper()->info("[✓] filekeeper running (boot {})",
                                        initializer.bootId().empty() ? "unknown" : initializer.bootId());

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

        LogRegistry::filekeeper()->info("[!] Shutdown signal received, stopping watchers...");
        initializer.shutdown();

        LogRegistry::filekeeper()->info("[✓] filekeeper shut down cleanly.");
        return 0;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::filekeeper()->critical("[!] Fatal error: {}", e.what());
        else std::cerr << "[!] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
