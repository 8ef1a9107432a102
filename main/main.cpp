// CLI
#include "cli/Args.hpp"

// Sync
#include "sync/Controller.hpp"
#include "sync/SyncStamp.hpp"
#include "store/HttpStore.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

// Libraries
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#ifndef MFSYNC_VERSION
#define MFSYNC_VERSION "unknown"
#endif

using namespace mfsync;
using namespace mfsync::config;

namespace {
constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_WITH_ERRORS = 1;
constexpr int EXIT_FATAL = -1;
}

int main(const int argc, char** argv) {
    cli::Args args;
    try {
        args = cli::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        fmt::print("Error: {}\n\n{}", e.what(), cli::usage());
        return EXIT_FATAL;
    }

    if (args.help) {
        fmt::print("{}", cli::usage());
        return EXIT_CLEAN;
    }

    if (args.version) {
        fmt::print("mfsync {}\n", MFSYNC_VERSION);
        return EXIT_CLEAN;
    }

    try {
        ConfigRegistry::init(args.config.value_or(""));
        cli::applyOverrides(ConfigRegistry::mutableConfig(), args);
        const auto& cfg = ConfigRegistry::get();

        if (args.print_config) {
            fmt::print("{}\n", nlohmann::json(cfg).dump(2));
            return EXIT_CLEAN;
        }

        log::Registry::init(cfg.logging);

        const auto startedAt = util::nowUnix();
        const auto options = cli::resolveOptions(args, cfg);
        log::Registry::setVerbosity(options.verbosity);

        sync::Controller controller(std::make_shared<store::HttpStore>(cfg.api), options);
        const auto result = controller.run(*args.src, *args.dst);

        auto outcome = result.outcome;
        if (outcome == sync::model::Outcome::Clean && cfg.sync.syncfrom_file) {
            try {
                sync::writeSyncStamp(*cfg.sync.syncfrom_file, startedAt);
            } catch (const std::exception& e) {
                log::Registry::mfsync()->error("Could not write sync timestamp: {}", e.what());
                outcome = sync::model::Outcome::WithErrors;
            }
        }

        if (result.errors > 0)
            log::Registry::mfsync()->warn("{} error(s) occurred, see above", result.errors);

        fmt::print("{}\n", result.root_hash);
        log::Registry::shutdown();
        return outcome == sync::model::Outcome::Clean ? EXIT_CLEAN : EXIT_WITH_ERRORS;
    } catch (const std::exception& e) {
        fmt::print("Error: {}\n", e.what());
        log::Registry::shutdown();
        return EXIT_FATAL;
    }
}
