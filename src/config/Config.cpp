#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace mfsync::config {

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config " + path.string() + ": " + e.what());
    }

    try {
        if (auto node = root["api"]) YAML::convert<ApiConfig>::decode(node, cfg.api);
        if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
    }

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"api", c.api},
        {"sync", c.sync},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const ApiConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"flush_interval", c.flush_interval ? nlohmann::json(*c.flush_interval) : nlohmann::json(nullptr)},
        {"nocopy", c.nocopy},
        {"syncfrom_file", c.syncfrom_file ? nlohmann::json(*c.syncfrom_file) : nlohmann::json(nullptr)}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"file", c.file ? nlohmann::json(*c.file) : nlohmann::json(nullptr)},
        {"file_level", levelName(c.file_log_level)},
        {"max_file_size_bytes", c.max_file_size_bytes},
        {"max_files", c.max_files},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"mfsync", levelName(c.mfsync)},
        {"sync", levelName(c.sync)},
        {"store", levelName(c.store)}
    };
}

}
