#include <cassert>
#include <chrono>
#include <vector>

#include "../src/util/percentile.hpp"

int main() {
    using nlm::percentile;
    std::vector<double> v{50, 10, 40, 20, 30};
    assert(percentile(v, 50) == 30);
    assert(percentile(v, 0) == 10);
    assert(percentile(v, 100) == 50);
    // round(0.95 * 4) = 4
    assert(percentile(v, 95) == 50);
    // round(0.1 * 4) = 0
    assert(percentile(v, 10) == 10);
    assert(percentile(v, 250) == 50);
    assert(!percentile(std::vector<double>{}, 50));

    std::vector<std::chrono::microseconds> one{std::chrono::microseconds(7)};
    assert(percentile(one, 99)->count() == 7);
    return 0;
}
