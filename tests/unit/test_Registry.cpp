#include <gtest/gtest.h>
#include "log/Registry.hpp"

using namespace mfsync::log;

TEST(LogRegistryTest, VerbosityMapsToConsoleLevel) {
    EXPECT_EQ(Registry::levelForVerbosity(0), spdlog::level::warn);
    EXPECT_EQ(Registry::levelForVerbosity(1), spdlog::level::info);
    EXPECT_EQ(Registry::levelForVerbosity(2), spdlog::level::debug);
    EXPECT_EQ(Registry::levelForVerbosity(3), spdlog::level::trace);
    EXPECT_EQ(Registry::levelForVerbosity(7), spdlog::level::trace);
}

TEST(LogRegistryTest, SubsystemLoggersAreRegistered) {
    EXPECT_EQ(Registry::mfsync()->name(), "mfsync");
    EXPECT_EQ(Registry::sync()->name(), "sync");
    EXPECT_EQ(Registry::store()->name(), "store");
    EXPECT_THROW((void)Registry::get("nope"), std::runtime_error);
}

TEST(LogRegistryTest, SetVerbosityKeepsLoggersUsable) {
    Registry::setVerbosity(3);
    EXPECT_NO_THROW(Registry::sync()->trace("trace line"));
    Registry::setVerbosity(0);
}
