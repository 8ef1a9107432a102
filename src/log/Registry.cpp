#include "log/Registry.hpp"

#include <filesystem>
#include <vector>

namespace mfsync::log {

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    // console: user-facing progress lines, no decoration
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(levelForVerbosity(0));
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(CONSOLE_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (cfg.file) {
        namespace fs = std::filesystem;
        const fs::path logPath(*cfg.file);
        if (logPath.has_parent_path() && !fs::exists(logPath.parent_path()))
            fs::create_directories(logPath.parent_path());

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), cfg.max_file_size_bytes, cfg.max_files);
        file_sink_->set_level(cfg.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cfg.subsystem_levels;
    makeLogger("mfsync", sub_levels.mfsync);
    makeLogger("sync",   sub_levels.sync);
    makeLogger("store",  sub_levels.store);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

void Registry::setVerbosity(const unsigned int verbosity) {
    if (!initialized_) return;
    console_sink_->set_level(levelForVerbosity(verbosity));
}

spdlog::level::level_enum Registry::levelForVerbosity(const unsigned int verbosity) {
    switch (verbosity) {
    case 0: return spdlog::level::warn;
    case 1: return spdlog::level::info;
    case 2: return spdlog::level::debug;
    default: return spdlog::level::trace;
    }
}

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    for (const auto* name : {"mfsync", "sync", "store"}) spdlog::drop(name);
    console_sink_.reset();
    file_sink_.reset();
    initialized_ = false;
}

}
