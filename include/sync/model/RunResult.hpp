#pragma once

#include <cstdint>
#include <string>

namespace mfsync::sync::model {

enum class Outcome { Clean, WithErrors };

struct RunResult {
    std::string root_hash;
    uint64_t errors{};
    Outcome outcome{Outcome::Clean};
};

}
