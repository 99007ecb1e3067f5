#pragma once

#include <chrono>
#include <ctime>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace stratus::util {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline int64_t toMicros(const Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

inline Timestamp fromMicros(const int64_t us) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(us)));
}

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// SigV4 x-amz-date
inline std::string getCurrentTimestamp() {
    const std::time_t now_c = Clock::to_time_t(Clock::now());
    const std::tm tm = *gmtime(&now_c);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

// SigV4 credential scope date
inline std::string getDate() {
    const std::time_t now_c = Clock::to_time_t(Clock::now());
    const std::tm tm = *gmtime(&now_c);
    char buffer[9];
    strftime(buffer, sizeof(buffer), "%Y%m%d", &tm);
    return {buffer};
}

// Local wall-clock stamp used in conflict copy names.
inline std::string compactLocalTimestamp(const std::time_t ts) {
    std::tm tm{};
    localtime_r(&ts, &tm);
    char buffer[15];
    strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &tm);
    return {buffer};
}

} // namespace stratus::util
