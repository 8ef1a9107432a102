#pragma once

#include "config/Config.hpp"
#include "sync/model/Options.hpp"

#include <optional>
#include <string>

namespace mfsync::cli {

struct Args {
    std::optional<std::string> src, dst;
    std::optional<std::string> apihost, apiport;
    std::optional<std::string> flush;
    std::optional<std::string> syncfrom, syncfrom_file;
    std::optional<std::string> config;
    bool nocopy = false;
    bool help = false;
    bool version = false;
    bool print_config = false;
    unsigned int verbosity = 0;
};

// Accepts "--key value", "--key=value", "-k value", "-kvalue" and bundled flags ("-vvv", "-lv").
// The last occurrence of an option wins. Throws std::invalid_argument on anything else.
Args parseArgs(int argc, const char* const* argv);

std::string usage();

// Folds explicit command-line values over the ones loaded from the config file.
void applyOverrides(config::Config& cfg, const Args& args);

// Parses every string setting. A --syncfrom value wins over the stamp file.
sync::model::Options resolveOptions(const Args& args, const config::Config& cfg);

}
