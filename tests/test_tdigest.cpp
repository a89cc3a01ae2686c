#include <cassert>
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

#include "../src/stats/tdigest.hpp"

int main() {
    using nlm::TDigest;
    TDigest empty;
    assert(empty.empty());
    assert(empty.quantile(0.5) == 0.0);

    TDigest one;
    one.merge_unsorted({42.0});
    assert(one.quantile(0.0) == 42.0);
    assert(one.quantile(0.5) == 42.0);
    assert(one.quantile(1.0) == 42.0);

    // Uniform 1..10000 in batches of ten, as the stats layer feeds it.
    TDigest d(100);
    std::vector<double> values;
    for (int i = 1; i <= 10000; ++i) values.push_back(i);
    std::mt19937 rng(7);
    std::shuffle(values.begin(), values.end(), rng);
    for (size_t i = 0; i < values.size(); i += 10)
        d.merge_unsorted(std::vector<double>(values.begin() + i, values.begin() + i + 10));

    assert(d.count() == 10000);
    assert(d.centroid_count() <= d.max_centroids());
    assert(d.min() == 1.0);
    assert(d.max() == 10000.0);
    assert(std::fabs(d.quantile(0.5) - 5000) < 400);
    assert(std::fabs(d.quantile(0.95) - 9500) < 250);
    assert(std::fabs(d.quantile(0.99) - 9900) < 100);
    assert(d.quantile(0.0) == 1.0);
    assert(d.quantile(1.0) == 10000.0);

    double prev = 0;
    for (int i = 0; i <= 100; ++i) {
        double q = d.quantile(i / 100.0);
        assert(q >= prev);
        prev = q;
    }

    d.clear();
    assert(d.empty());
    assert(d.count() == 0);
    return 0;
}
