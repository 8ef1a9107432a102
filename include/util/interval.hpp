#pragma once

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mfsync::util {

// "3 day 04:05:06" or "04:05:06"
inline std::chrono::seconds parseClockInterval(const std::string& s) {
    std::istringstream ss(s);
    long days = 0, hours = 0, minutes = 0, seconds = 0;
    char colon1 = 0, colon2 = 0;

    if (s.find("day") != std::string::npos) {
        ss >> days;
        std::string tmp;
        ss >> tmp; // discard "day"
    }

    ss >> hours >> colon1 >> minutes >> colon2 >> seconds;
    if (ss.fail() || colon1 != ':' || colon2 != ':')
        throw std::invalid_argument("Malformed interval: " + s);

    return std::chrono::seconds(
        days * 86400 +
        hours * 3600 +
        minutes * 60 +
        seconds
    );
}

inline long double unitNanos(const std::string& unit) {
    if (unit == "ns" || unit == "nsec" || unit == "nanos") return 1.0L;
    if (unit == "us" || unit == "usec" || unit == "micros") return 1e3L;
    if (unit == "ms" || unit == "msec" || unit == "millis") return 1e6L;
    if (unit == "s" || unit == "sec" || unit == "secs" || unit == "second" || unit == "seconds") return 1e9L;
    if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes") return 60e9L;
    if (unit == "h" || unit == "hr" || unit == "hrs" || unit == "hour" || unit == "hours") return 3600e9L;
    if (unit == "d" || unit == "day" || unit == "days") return 86400e9L;
    if (unit == "w" || unit == "week" || unit == "weeks") return 7 * 86400e9L;
    throw std::invalid_argument("Unknown duration unit: " + unit);
}

// Accepts "90s", "1h 30m", "2m30s", "250ms" and the clock form above.
inline std::chrono::milliseconds parseDuration(const std::string& input) {
    const std::string s = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(input));
    if (s.empty()) throw std::invalid_argument("Empty duration");

    if (s.find(':') != std::string::npos)
        return std::chrono::duration_cast<std::chrono::milliseconds>(parseClockInterval(s));

    const auto isSpace = [](const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    const auto isDigit = [](const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.'; };
    const auto isAlpha = [](const char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; };

    long double totalNs = 0;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && isSpace(s[i])) ++i;
        if (i == s.size()) break;

        const size_t numStart = i;
        while (i < s.size() && isDigit(s[i])) ++i;
        if (numStart == i) throw std::invalid_argument("Expected a number in duration '" + input + "'");

        size_t consumed = 0;
        const auto number = s.substr(numStart, i - numStart);
        const long double value = std::stold(number, &consumed);
        if (consumed != number.size()) throw std::invalid_argument("Malformed number in duration '" + input + "'");

        while (i < s.size() && isSpace(s[i])) ++i;
        const size_t unitStart = i;
        while (i < s.size() && isAlpha(s[i])) ++i;
        if (unitStart == i) throw std::invalid_argument("Missing unit in duration '" + input + "'");

        totalNs += value * unitNanos(s.substr(unitStart, i - unitStart));
    }

    return std::chrono::milliseconds(std::llround(totalNs / 1e6L));
}

inline std::string intervalToString(const std::chrono::milliseconds& interval) {
    auto total_ms = interval.count();
    if (total_ms < 1000) return std::to_string(total_ms) + "ms";

    auto total_seconds = total_ms / 1000;
    const long days = total_seconds / 86400;
    total_seconds %= 86400;
    const long hours = total_seconds / 3600;
    total_seconds %= 3600;
    const long minutes = total_seconds / 60;
    const long seconds = total_seconds % 60;

    std::ostringstream oss;
    if (days > 0) oss << days << "d";
    if (hours > 0) oss << hours << "h";
    if (minutes > 0) oss << minutes << "m";
    if (seconds > 0 || oss.tellp() == 0) oss << seconds << "s";
    return oss.str();
}

}
