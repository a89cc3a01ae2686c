#pragma once
#include <chrono>
#include <string>
#include <utility>

namespace nlm {
using Latency = std::chrono::microseconds;

// Result of one probe attempt: exactly one of success, timeout or error.
struct ProbeOutcome {
    enum class Kind { Success, Timeout, Error };

    Kind kind{Kind::Timeout};
    Latency latency{0};
    std::string reason;

    static ProbeOutcome success(Latency d) {
        ProbeOutcome o;
        o.kind = Kind::Success;
        o.latency = d;
        return o;
    }
    static ProbeOutcome timeout() {
        return ProbeOutcome{};
    }
    static ProbeOutcome error(std::string why) {
        ProbeOutcome o;
        o.kind = Kind::Error;
        o.reason = std::move(why);
        return o;
    }

    bool ok() const {
        return kind == Kind::Success;
    }
};

inline const char* kind_name(ProbeOutcome::Kind k) {
    switch (k) {
        case ProbeOutcome::Kind::Success: return "success";
        case ProbeOutcome::Kind::Timeout: return "timeout";
        case ProbeOutcome::Kind::Error: return "error";
    }
    return "?";
}

inline double to_ms(Latency d) {
    return static_cast<double>(d.count()) / 1000.0;
}
}  // namespace nlm
