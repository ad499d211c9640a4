#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        fileops::paths::setLogPathForTesting();
        fileops::config::ConfigRegistry::initDefaults();
        fileops::log::Registry::init();
        fileops::log::Registry::setConsoleLevel(spdlog::level::warn);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize fileops test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
