#pragma once

#include "config/Config.hpp"

#include <filesystem>

namespace mfsync::config {

class ConfigRegistry {
public:
    // An empty path keeps the built-in defaults.
    static void init(const std::filesystem::path& path = {});
    static const Config& get();
    static Config& mutableConfig();

    static void resetForTesting();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
};

} // namespace mfsync::config
