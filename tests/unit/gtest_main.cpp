#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        mfsync::config::ConfigRegistry::init();
        mfsync::log::Registry::init(mfsync::config::ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize mfsync test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
