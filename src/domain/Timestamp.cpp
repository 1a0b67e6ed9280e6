/**
 * @file Timestamp.cpp
 * @brief Implementation of the timestamp helpers.
 */
#include "domain/Timestamp.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace scratchpad::domain {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::time_t FromUtcTime(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

} // namespace

Timestamp Now() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

std::string FormatTimestamp(Timestamp ts) {
    std::time_t tt = std::chrono::system_clock::to_time_t(ts);
    std::tm tm = ToUtcTime(tt);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer);
}

std::optional<Timestamp> ParseTimestamp(const std::string& text) {
    if (text.size() != 20 || text[10] != 'T' || text.back() != 'Z') {
        return std::nullopt;
    }

    std::tm tm = {};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    std::time_t tt = FromUtcTime(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::from_time_t(tt));
}

} // namespace scratchpad::domain
