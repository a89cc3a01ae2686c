#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace nlm {
using WallTime = std::chrono::system_clock::time_point;

inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

// RFC 3339 in UTC with microsecond precision, e.g. 2024-05-01T12:00:00.123456Z.
std::string format_rfc3339(WallTime t);

// Accepts any number of fractional digits (truncated to microseconds) and
// either "Z" or a numeric "+HH:MM"/"-HH:MM" offset.
bool parse_rfc3339(const std::string& s, WallTime& out);

// Filesystem-safe UTC stamp used in log and session file names.
std::string file_stamp(WallTime t);
}  // namespace nlm
