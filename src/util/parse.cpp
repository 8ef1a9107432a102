#include "util/parse.hpp"

#include <limits>
#include <stdexcept>

namespace mfsync::util {

std::optional<unsigned int> parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) {
            return std::nullopt; // overflow
        }
    }

    return static_cast<unsigned int>(v);
}

uint16_t parsePort(const std::string& s) {
    const auto v = parseUInt(s);
    if (!v || *v == 0 || *v > std::numeric_limits<uint16_t>::max())
        throw std::invalid_argument("Could not parse API port: '" + s + "'");
    return static_cast<uint16_t>(*v);
}

}
