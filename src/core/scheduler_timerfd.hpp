#pragma once
#include <cstdint>
#include <functional>

#include "fd.hpp"
#include "reactor.hpp"

namespace nlm {
// Periodic callback on a Reactor. Expirations that pile up while the loop is
// busy are folded into one call.
class TimerScheduler {
   public:
    TimerScheduler() = default;
    ~TimerScheduler();
    bool start(Reactor& r, int interval_ms, const std::function<void()>& cb);
    void stop();

   private:
    Reactor* reactor_{nullptr};
    Fd tfd_;
    std::function<void()> cb_;
};

// Blocking periodic ticker for a worker thread. The first wait() returns
// at once; later ones block until the next period boundary. Boundaries that
// passed while the caller was busy are dropped rather than replayed, so an
// overrunning cycle never causes a burst of catch-up ticks.
class IntervalTicker {
   public:
    bool start(int interval_ms);
    bool wait();
    void stop();
    bool running() const {
        return static_cast<bool>(tfd_);
    }
    uint64_t skipped() const {
        return skipped_;
    }

   private:
    Fd tfd_;
    bool started_{false};
    uint64_t skipped_{0};
};
}  // namespace nlm
