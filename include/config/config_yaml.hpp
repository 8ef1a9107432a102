#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mfsync::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ApiConfig> {
    static Node encode(const ApiConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, ApiConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("127.0.0.1");
        rhs.port = node["port"].as<uint16_t>(5001);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(0);
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        if (rhs.flush_interval) node["flush_interval"] = *rhs.flush_interval;
        node["nocopy"] = rhs.nocopy;
        if (rhs.syncfrom_file) node["syncfrom_file"] = *rhs.syncfrom_file;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["flush_interval"]) rhs.flush_interval = node["flush_interval"].as<std::string>();
        rhs.nocopy = node["nocopy"].as<bool>(false);
        if (node["syncfrom_file"]) rhs.syncfrom_file = node["syncfrom_file"].as<std::string>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mfsync"] = to_std_string(spdlog::level::to_string_view(rhs.mfsync));
        node["sync"]   = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["store"]  = to_std_string(spdlog::level::to_string_view(rhs.store));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mfsync = spdlog::level::from_str(node["mfsync"].as<std::string>("trace"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("trace"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("trace"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        if (rhs.file) node["file"] = *rhs.file;
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["max_file_size_mb"] = rhs.max_file_size_bytes / (1024 * 1024);
        node["max_files"] = rhs.max_files;
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["file"]) rhs.file = node["file"].as<std::string>();
        rhs.file_log_level = spdlog::level::from_str(node["file_level"].as<std::string>("info"));
        rhs.max_file_size_bytes = node["max_file_size_mb"].as<uintmax_t>(10) * 1024 * 1024;
        rhs.max_files = node["max_files"].as<size_t>(5);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
