#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        mvx::config::ConfigRegistry::initDefaults();
        mvx::logging::LogRegistry::init(spdlog::level::warn);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize mvx test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
