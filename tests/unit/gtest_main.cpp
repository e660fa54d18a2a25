#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        fk::config::Config config;
        config.logging.log_dir = fs::temp_directory_path() / "filekeeper-tests" / "log";
        config.logging.levels.console_log_level = spdlog::level::warn;

        fk::config::ConfigRegistry::init(config);
        fk::logging::LogRegistry::init(config.logging.log_dir);

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize filekeeper test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
