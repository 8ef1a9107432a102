#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace mfsync::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. The console starts at warnings until setVerbosity().
    static void init(const config::LoggingConfig& cfg = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> mfsync() { return get("mfsync"); }
    static std::shared_ptr<spdlog::logger> sync()   { return get("sync"); }
    static std::shared_ptr<spdlog::logger> store()  { return get("store"); }

    // 0: warnings and errors, 1: uploaded hashes, 2: directories and symlinks, 3: raw diagnostics
    static void setVerbosity(unsigned int verbosity);
    [[nodiscard]] static spdlog::level::level_enum levelForVerbosity(unsigned int verbosity);

    static void shutdown();

private:
    static constexpr const auto* CONSOLE_FORMAT = "%^%v%$";
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;
};

}
