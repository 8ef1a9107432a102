#pragma once

#include <boost/algorithm/string.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mfsync::util {

inline std::time_t parseTimestampWithFormat(const std::string& s, const char* format) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, format);
    if (ss.fail()) return static_cast<std::time_t>(-1);
    ss >> std::ws;
    if (!ss.eof()) return static_cast<std::time_t>(-1);
    return timegm(&tm); // returns UTC-based time_t
}

// "@1700000000", "2023-11-14T22:13:20Z", "2023-11-14 22:13:20" or "2023-11-14" (UTC)
inline std::time_t parseSyncFrom(const std::string& input) {
    const std::string s = boost::algorithm::trim_copy(input);
    if (s.empty()) throw std::invalid_argument("Empty timestamp");

    if (s.front() == '@') {
        const std::string digits = s.substr(1);
        size_t consumed = 0;
        long long v = 0;
        try { v = std::stoll(digits, &consumed); }
        catch (const std::exception&) { throw std::invalid_argument("Failed to parse timestamp: " + input); }
        if (consumed != digits.size()) throw std::invalid_argument("Failed to parse timestamp: " + input);
        return static_cast<std::time_t>(v);
    }

    for (const auto* format : {"%Y-%m-%dT%H:%M:%SZ", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S", "%Y-%m-%d"})
        if (const auto t = parseTimestampWithFormat(s, format); t != static_cast<std::time_t>(-1)) return t;

    throw std::invalid_argument("Failed to parse timestamp: " + input);
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string toSyncFromString(const std::time_t ts) { return "@" + std::to_string(ts); }

inline std::time_t nowUnix() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

} // namespace mfsync::util
