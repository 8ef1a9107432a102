#pragma once

#include <chrono>
#include <ctime>
#include <optional>

namespace mfsync::sync::model {

struct Options {
    unsigned int verbosity = 0;
    bool nocopy = false;

    // Files whose change-time is at or below this are presumed unchanged. Unset: compare sizes.
    std::optional<std::time_t> syncfrom;

    // Unset: flush only between phases. Zero: leave flushing to the daemon's autoflush.
    std::optional<std::chrono::milliseconds> flush_interval;
};

}
