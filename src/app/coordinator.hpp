#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../core/event_bus.hpp"
#include "../core/target.hpp"
#include "../core/time_utils.hpp"
#include "../probes/probe_worker.hpp"
#include "../stats/target_stats.hpp"

namespace nlm {
constexpr std::chrono::seconds kSummaryInterval{60};

struct CoordinatorOptions {
    bool log_raw{false};
    // Empty disables summary snapshots.
    std::string summary_path;
    std::chrono::seconds summary_interval{kSummaryInterval};
};

// Single consumer of the probe channel. Owns the per-target statistics and
// forwards raw events and periodic summaries to their sinks. Never blocks.
class Coordinator {
   public:
    using Clock = std::function<WallTime()>;

    Coordinator(std::vector<Target> targets, std::shared_ptr<UpdateChannel> updates,
                EventBus& raw_sink, CoordinatorOptions opts, Clock clock = nullptr);

    // Drains everything queued right now; returns how many updates were
    // applied (dropped ones excluded).
    size_t process_updates();
    void reset_stats();
    // Writes the summary immediately; false when disabled or on error.
    bool write_summary_now();

    const std::vector<Target>& targets() const {
        return targets_;
    }
    std::vector<TargetStats>& stats() {
        return stats_;
    }
    const std::vector<TargetStats>& stats() const {
        return stats_;
    }
    WallTime started() const {
        return started_;
    }
    uint64_t dropped() const {
        return dropped_;
    }
    uint64_t summaries_written() const {
        return summaries_written_;
    }

   private:
    void maybe_write_summary(WallTime now);

    std::vector<Target> targets_;
    std::vector<TargetStats> stats_;
    std::shared_ptr<UpdateChannel> updates_;
    EventBus& raw_sink_;
    CoordinatorOptions opts_;
    Clock clock_;
    WallTime started_;
    WallTime last_summary_;
    uint64_t dropped_{0};
    uint64_t summaries_written_{0};
};
}  // namespace nlm
