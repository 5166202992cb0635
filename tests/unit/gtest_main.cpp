#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "hashmirror/config/ConfigRegistry.hpp"
#include "hashmirror/log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        const auto logDir = fs::temp_directory_path() / "hashmirror_test_logs";
        hm::config::ConfigRegistry::init(hm::config::Config{});
        hm::log::Registry::init(logDir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize hashmirror test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
