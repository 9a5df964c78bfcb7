#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace bob::util {

inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso.substr(0, 19)); // "YYYY-MM-DDTHH:MM:SS", drops fraction and zone
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// "2 weeks, 3 days, 1 hour"
inline std::string humanizeDuration(const std::chrono::seconds elapsed) {
    const auto totalHours = std::chrono::duration_cast<std::chrono::hours>(elapsed).count();
    const long long weeks = totalHours / 24 / 7;
    const long long days = (totalHours / 24) % 7;
    const long long hours = totalHours % 24;

    std::string out;
    const auto append = [&out](const long long n, const char* unit) {
        if (n == 0) return;
        if (!out.empty()) out += ", ";
        out += std::to_string(n) + " " + unit + (n > 1 ? "s" : "");
    };

    append(weeks, "week");
    append(days, "day");
    append(hours, "hour");
    return out;
}

}
