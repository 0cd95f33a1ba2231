#pragma once

#include <chrono>
#include <cctype>
#include <stdexcept>
#include <string>

namespace fk::util {

// Accepts plain seconds ("90") or a single unit suffix: s, m, h, d ("30m", "24h", "7d").
inline std::chrono::seconds parseInterval(const std::string& s) {
    if (s.empty()) throw std::invalid_argument("Empty interval");

    size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(s, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid interval: " + s);
    }
    if (value < 0) throw std::invalid_argument("Negative interval: " + s);

    const std::string unit = s.substr(pos);
    if (unit.empty() || unit == "s") return std::chrono::seconds(value);
    if (unit == "m") return std::chrono::minutes(value);
    if (unit == "h") return std::chrono::hours(value);
    if (unit == "d") return std::chrono::hours(24 * value);
    throw std::invalid_argument("Unknown interval unit '" + unit + "' in: " + s);
}

inline std::string intervalToString(const std::chrono::seconds& interval) {
    const auto total = interval.count();
    if (total != 0 && total % 86400 == 0) return std::to_string(total / 86400) + "d";
    if (total != 0 && total % 3600 == 0) return std::to_string(total / 3600) + "h";
    if (total != 0 && total % 60 == 0) return std::to_string(total / 60) + "m";
    return std::to_string(total) + "s";
}

}
