#include "format.hpp"

#include <cmath>
#include <cstdio>

namespace nlm {
std::string format_duration(Latency d) {
    auto micros = d.count();
    char buf[32];
    if (micros < 1000) {
        std::snprintf(buf, sizeof(buf), "%lldµs", static_cast<long long>(micros));
    } else if (micros < 100000) {
        std::snprintf(buf, sizeof(buf), "%.1fms", static_cast<double>(micros) / 1000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldms", static_cast<long long>(micros / 1000));
    }
    return std::string(buf);
}

std::string format_duration_opt(const std::optional<Latency>& d) {
    return d ? format_duration(*d) : "-";
}

std::string format_elapsed(std::chrono::seconds d) {
    long long secs = d.count();
    char buf[32];
    if (secs < 60) {
        std::snprintf(buf, sizeof(buf), "%llds", secs);
    } else if (secs < 3600) {
        std::snprintf(buf, sizeof(buf), "%lldm %llds", secs / 60, secs % 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldh %lldm", secs / 3600, (secs % 3600) / 60);
    }
    return std::string(buf);
}

std::string format_count(uint64_t n) {
    char buf[32];
    auto compact = [&](double v, const char* unit) {
        if (v >= 10.0)
            std::snprintf(buf, sizeof(buf), "%llu%s",
                          static_cast<unsigned long long>(std::llround(v)), unit);
        else
            std::snprintf(buf, sizeof(buf), "%.1f%s", v, unit);
    };
    if (n >= 1000000) {
        compact(static_cast<double>(n) / 1000000.0, "m");
    } else if (n >= 1000) {
        compact(static_cast<double>(n) / 1000.0, "k");
    } else {
        std::snprintf(buf, sizeof(buf), "%llu", static_cast<unsigned long long>(n));
    }
    return std::string(buf);
}
}  // namespace nlm
