#include "cli/Args.hpp"
#include "sync/SyncStamp.hpp"
#include "util/interval.hpp"
#include "util/parse.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>

#include <stdexcept>
#include <string_view>

using namespace mfsync::cli;
using namespace mfsync::util;

namespace {

struct OptionSpec {
    std::string_view longName;
    char shortName;
    std::optional<std::string> Args::* value;
};

constexpr char NO_SHORT = '\0';

const OptionSpec VALUE_OPTIONS[] = {
    {"src",           's',      &Args::src},
    {"dst",           'd',      &Args::dst},
    {"apihost",       'h',      &Args::apihost},
    {"apiport",       'p',      &Args::apiport},
    {"flush",         'f',      &Args::flush},
    {"syncfrom",      NO_SHORT, &Args::syncfrom},
    {"syncfrom-file", NO_SHORT, &Args::syncfrom_file},
    {"config",        'c',      &Args::config},
};

const OptionSpec* findLong(const std::string_view name) {
    for (const auto& o : VALUE_OPTIONS) if (o.longName == name) return &o;
    return nullptr;
}

const OptionSpec* findShort(const char c) {
    for (const auto& o : VALUE_OPTIONS) if (o.shortName != NO_SHORT && o.shortName == c) return &o;
    return nullptr;
}

// Returns false when `name` is not a flag.
bool setFlag(Args& args, const std::string_view name) {
    if (name == "nocopy" || name == "l") args.nocopy = true;
    else if (name == "verbose" || name == "v") ++args.verbosity;
    else if (name == "help") args.help = true;
    else if (name == "version") args.version = true;
    else if (name == "print-config") args.print_config = true;
    else return false;
    return true;
}

}

Args mfsync::cli::parseArgs(const int argc, const char* const* argv) {
    Args args;

    const auto valueAfter = [&](int& i, const std::string& option) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + option);
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string tok = argv[i];

        if (tok.starts_with("--") && tok.size() > 2) {
            const auto eq = tok.find('=');
            const std::string name = tok.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);

            if (const auto* opt = findLong(name)) {
                args.*(opt->value) = eq == std::string::npos ? valueAfter(i, "--" + name) : tok.substr(eq + 1);
                continue;
            }

            if (eq != std::string::npos) throw std::invalid_argument("Option --" + name + " takes no value");
            if (!setFlag(args, name)) throw std::invalid_argument("Unknown option: " + tok);
            continue;
        }

        if (tok.size() > 1 && tok[0] == '-' && tok[1] != '-') {
            for (size_t j = 1; j < tok.size(); ++j) {
                const char c = tok[j];
                if (const auto* opt = findShort(c)) {
                    // the rest of the token is the value, or the next argument when there is none
                    args.*(opt->value) = j + 1 < tok.size() ? tok.substr(j + 1) : valueAfter(i, std::string("-") + c);
                    break;
                }
                if (!setFlag(args, std::string_view(&tok[j], 1)))
                    throw std::invalid_argument(fmt::format("Unknown option: -{}", c));
            }
            continue;
        }

        throw std::invalid_argument("Unexpected argument: " + tok);
    }

    if (!args.help && !args.version && !args.print_config) {
        if (!args.src) throw std::invalid_argument("Missing required option --src");
        if (!args.dst) throw std::invalid_argument("Missing required option --dst");
    }

    return args;
}

std::string mfsync::cli::usage() {
    return
        "Usage: mfsync -s <dir> -d <mfs path> [options]\n"
        "\n"
        "Mirror a local directory into the IPFS mutable filesystem.\n"
        "\n"
        "  -s, --src <dir>             Local directory to sync\n"
        "  -d, --dst <mfs path>        Absolute MFS destination, e.g. /backup\n"
        "  -h, --apihost <host>        Daemon API host (default 127.0.0.1)\n"
        "  -p, --apiport <port>        Daemon API port (default 5001)\n"
        "  -f, --flush <duration>      Flush at most this often during the walk (e.g. 30s, 1h 30m);\n"
        "                              0s leaves flushing to the daemon\n"
        "      --syncfrom <time>       Only re-upload files changed after this time (@unix or ISO 8601)\n"
        "      --syncfrom-file <path>  Read the threshold from this file, write it back after a clean run\n"
        "  -l, --nocopy                Add files by reference (filestore) instead of copying them\n"
        "  -v, --verbose               More output; repeat for more\n"
        "  -c, --config <yaml>         Configuration file\n"
        "      --print-config          Print the effective configuration as JSON and exit\n"
        "      --help                  Show this help\n"
        "      --version               Show the version\n";
}

void mfsync::cli::applyOverrides(config::Config& cfg, const Args& args) {
    if (args.apihost) cfg.api.host = *args.apihost;
    if (args.apiport) cfg.api.port = parsePort(*args.apiport);
    if (args.flush) cfg.sync.flush_interval = *args.flush;
    if (args.nocopy) cfg.sync.nocopy = true;
    if (args.syncfrom_file) cfg.sync.syncfrom_file = *args.syncfrom_file;
}

mfsync::sync::model::Options mfsync::cli::resolveOptions(const Args& args, const config::Config& cfg) {
    sync::model::Options opts;
    opts.verbosity = args.verbosity;
    opts.nocopy = cfg.sync.nocopy;

    if (cfg.sync.flush_interval) opts.flush_interval = parseDuration(*cfg.sync.flush_interval);

    if (args.syncfrom) opts.syncfrom = parseSyncFrom(*args.syncfrom);
    else if (cfg.sync.syncfrom_file) opts.syncfrom = sync::readSyncStamp(*cfg.sync.syncfrom_file);

    return opts;
}
