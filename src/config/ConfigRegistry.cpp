#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace mfsync::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    if (initialized_) throw std::runtime_error("ConfigRegistry already initialized");
    config_ = path.empty() ? Config{} : loadConfig(path);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

Config& ConfigRegistry::mutableConfig() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::resetForTesting() {
    config_ = Config{};
    initialized_ = false;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace mfsync::config
