#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        unistore::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        unistore::config::ConfigRegistry::init(cfg);
        unistore::log::Registry::init(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize unistore test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();
    unistore::log::Registry::shutdown();
    return rc;
}
