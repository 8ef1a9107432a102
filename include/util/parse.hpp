#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mfsync::util {

std::optional<unsigned int> parseUInt(const std::string& sv);

// Throws std::invalid_argument unless 1..65535.
uint16_t parsePort(const std::string& s);

}
