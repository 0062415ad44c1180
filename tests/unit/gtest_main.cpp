#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "logging/LogRegistry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        px::paths::setLogPathForTesting();
        px::paths::setConfigPathForTesting(fs::temp_directory_path() / "packxfer_test_config_absent.yaml");
        px::config::ConfigRegistry::init();
        px::logging::LogRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize packxfer test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
