// RELIQUARY - Time Utilities Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/util/time.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace reliquary {
namespace util {

Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Timestamp SystemClock::Now() const {
    return GetTime();
}

std::string FormatISO8601(Timestamp t) {
    std::time_t time = static_cast<std::time_t>(t);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);
    
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }
    if (seconds == 0) {
        return "0s";
    }
    
    int64_t days = seconds / SECONDS_PER_DAY;
    seconds %= SECONDS_PER_DAY;
    int64_t hours = seconds / SECONDS_PER_HOUR;
    seconds %= SECONDS_PER_HOUR;
    int64_t minutes = seconds / SECONDS_PER_MINUTE;
    seconds %= SECONDS_PER_MINUTE;
    
    std::ostringstream oss;
    const char* sep = "";
    if (days > 0) { oss << sep << days << "d"; sep = " "; }
    if (hours > 0) { oss << sep << hours << "h"; sep = " "; }
    if (minutes > 0) { oss << sep << minutes << "m"; sep = " "; }
    if (seconds > 0) { oss << sep << seconds << "s"; }
    return oss.str();
}

} // namespace util
} // namespace reliquary
