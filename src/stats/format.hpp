#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "probe_outcome.hpp"

namespace nlm {
// 500µs, 1.5ms, 15.0ms, 100ms, 1500ms
std::string format_duration(Latency d);
std::string format_duration_opt(const std::optional<Latency>& d);
// 30s, 1m 30s, 1h 1m
std::string format_elapsed(std::chrono::seconds d);
// 999, 1.5k, 200k, 3.1m
std::string format_count(uint64_t n);
}  // namespace nlm
