#include "tdigest.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace nlm {
TDigest::TDigest(size_t max_centroids) : max_size_(std::max<size_t>(max_centroids, 2)) {}

void TDigest::clear() {
    centroids_.clear();
    count_ = 0;
    min_ = 0;
    max_ = 0;
}

double TDigest::k_to_q(double k, double d) {
    double k_div_d = k / d;
    if (k_div_d >= 0.5) {
        double base = 1.0 - k_div_d;
        return 1.0 - 2.0 * base * base;
    }
    return 2.0 * k_div_d * k_div_d;
}

void TDigest::merge_unsorted(std::vector<double> values) {
    if (values.empty()) return;
    std::sort(values.begin(), values.end());

    if (centroids_.empty()) {
        min_ = values.front();
        max_ = values.back();
    } else {
        min_ = std::min(min_, values.front());
        max_ = std::max(max_, values.back());
    }

    std::vector<Centroid> incoming;
    incoming.reserve(values.size());
    for (double v : values) incoming.push_back({v, 1.0});

    std::vector<Centroid> all;
    all.reserve(centroids_.size() + incoming.size());
    std::merge(centroids_.begin(), centroids_.end(), incoming.begin(), incoming.end(),
               std::back_inserter(all),
               [](const Centroid& a, const Centroid& b) { return a.mean < b.mean; });

    double total = count_ + static_cast<double>(values.size());
    double d = static_cast<double>(max_size_);

    std::vector<Centroid> result;
    result.reserve(max_size_ + 1);
    double k = 1;
    double q_limit = k_to_q(k, d) * total;
    k += 1;

    Centroid cur = all.front();
    double so_far = cur.weight;
    for (size_t i = 1; i < all.size(); ++i) {
        const Centroid& c = all[i];
        if (so_far + c.weight <= q_limit) {
            double w = cur.weight + c.weight;
            cur.mean += (c.mean - cur.mean) * (c.weight / w);
            cur.weight = w;
        } else {
            result.push_back(cur);
            q_limit = k_to_q(k, d) * total;
            k += 1;
            cur = c;
        }
        so_far += c.weight;
    }
    result.push_back(cur);

    centroids_ = std::move(result);
    count_ = total;
}

double TDigest::quantile(double q) const {
    if (centroids_.empty()) return 0.0;
    if (q <= 0.0) return min_;
    if (q >= 1.0) return max_;
    if (centroids_.size() == 1) return centroids_.front().mean;

    double index = q * count_;
    const Centroid& first = centroids_.front();
    if (index < first.weight / 2) {
        double t = index / (first.weight / 2);
        return min_ + t * (first.mean - min_);
    }

    double so_far = first.weight / 2;
    for (size_t i = 0; i + 1 < centroids_.size(); ++i) {
        const Centroid& a = centroids_[i];
        const Centroid& b = centroids_[i + 1];
        double dw = (a.weight + b.weight) / 2;
        if (so_far + dw > index) {
            double t = (index - so_far) / dw;
            return a.mean + t * (b.mean - a.mean);
        }
        so_far += dw;
    }

    const Centroid& last = centroids_.back();
    double t = (index - so_far) / (last.weight / 2);
    return std::min(max_, last.mean + t * (max_ - last.mean));
}
}  // namespace nlm
