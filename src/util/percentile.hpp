#pragma once
#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace nlm {
// Nearest-rank percentile, p in [0, 100]: the element at index
// round(p/100 * (n-1)) of the sorted samples.
template <typename T>
std::optional<T> percentile(std::vector<T> v, double p) {
    if (v.empty()) return std::nullopt;
    std::sort(v.begin(), v.end());
    p = std::clamp(p, 0.0, 100.0);
    auto idx = static_cast<size_t>(std::llround((p / 100.0) * static_cast<double>(v.size() - 1)));
    return v[std::min(idx, v.size() - 1)];
}
}  // namespace nlm
