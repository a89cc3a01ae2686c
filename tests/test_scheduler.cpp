#include <cassert>
#include <chrono>
#include <thread>

#include "../src/core/logger.hpp"
#include "../src/core/scheduler_timerfd.hpp"

using namespace nlm;
using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

namespace {
long long elapsed_ms(Clock::time_point since) {
    return std::chrono::duration_cast<milliseconds>(Clock::now() - since).count();
}
}  // namespace

int main() {
    set_log_level(LogLevel::ERROR);

    IntervalTicker idle;
    assert(!idle.running());
    assert(!idle.wait());

    IntervalTicker ticker;
    assert(ticker.start(100));
    assert(ticker.running());

    // First tick is immediate.
    auto t0 = Clock::now();
    assert(ticker.wait());
    assert(elapsed_ms(t0) < 50);
    assert(ticker.skipped() == 0);

    // An ordinary wait lands on the next boundary.
    t0 = Clock::now();
    assert(ticker.wait());
    long long waited = elapsed_ms(t0);
    assert(waited >= 50 && waited < 200);

    // Oversleep past three boundaries: the missed ones are counted, not
    // replayed, and the next wait still blocks until a fresh boundary.
    std::this_thread::sleep_for(milliseconds(350));
    t0 = Clock::now();
    assert(ticker.wait());
    waited = elapsed_ms(t0);
    assert(waited < 150);
    uint64_t after_first = ticker.skipped();
    assert(after_first >= 2);

    // No burst of catch-up ticks follows.
    t0 = Clock::now();
    assert(ticker.wait());
    assert(elapsed_ms(t0) >= 50);

    std::this_thread::sleep_for(milliseconds(250));
    assert(ticker.wait());
    assert(ticker.skipped() >= after_first + 1);

    // A restarted ticker fires immediately again.
    ticker.stop();
    assert(!ticker.running());
    assert(!ticker.wait());
    assert(ticker.start(100));
    t0 = Clock::now();
    assert(ticker.wait());
    assert(elapsed_ms(t0) < 50);
    return 0;
}
