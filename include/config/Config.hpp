#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace mfsync::config {

struct ApiConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 5001;
    unsigned int timeout_seconds = 0; // 0: no timeout
};

struct SyncConfig {
    std::optional<std::string> flush_interval; // duration string, see util::parseDuration
    bool nocopy = false;
    std::optional<std::string> syncfrom_file;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mfsync = spdlog::level::trace;  // Run phases, stamp file warnings
    spdlog::level::level_enum sync   = spdlog::level::trace;  // Per-entry progress and failures
    spdlog::level::level_enum store  = spdlog::level::trace;  // Daemon requests and HTTP errors
};

struct LoggingConfig {
    std::optional<std::string> file;                         // rotating file sink, off when unset
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    uintmax_t max_file_size_bytes = 10 * 1024 * 1024;        // 10 MiB
    size_t max_files = 5;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    ApiConfig api;
    SyncConfig sync;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const ApiConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace mfsync::config
