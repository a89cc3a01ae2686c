#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "probe_outcome.hpp"
#include "quality.hpp"
#include "tdigest.hpp"

namespace nlm {
using SteadyClock = std::chrono::steady_clock;

// Whole-session latency aggregate. Percentiles come from a t-digest fed in
// batches; queries that need the digest flush the pending batch first, which
// is why they are not const. Only the owning thread may call them.
class AllTimeStats {
   public:
    static constexpr size_t kBufferSize = 10;
    static constexpr size_t kDigestSize = 100;

    AllTimeStats();

    void record(Latency d);
    void compact();

    std::optional<Latency> min() const {
        return min_;
    }
    std::optional<Latency> max() const {
        return max_;
    }
    Latency sum() const {
        return sum_;
    }
    uint64_t count() const {
        return count_;
    }
    size_t pending() const {
        return buffer_.size();
    }
    const TDigest& digest() const {
        return digest_;
    }
    std::optional<Latency> average() const;
    // q in [0, 1].
    std::optional<Latency> percentile(double q);
    std::optional<Latency> p50() {
        return percentile(0.5);
    }
    std::optional<Latency> p95() {
        return percentile(0.95);
    }

   private:
    std::optional<Latency> min_;
    std::optional<Latency> max_;
    Latency sum_{0};
    uint64_t count_{0};
    TDigest digest_;
    std::vector<double> buffer_;  // milliseconds
};

struct LossStats {
    uint64_t lost{0};
    double pct{0.0};
};

struct Histogram {
    std::vector<double> boundaries;  // lower edge of each bucket, ms
    std::vector<uint64_t> counts;
};

// Per-target statistics: an exact window over the last kMaxHistory outcomes
// plus lifetime counters, streaks, jitter and the all-time aggregate.
class TargetStats {
   public:
    static constexpr size_t kMaxHistory = 300;

    TargetStats();

    void record(const ProbeOutcome& outcome);
    // Clears everything, including the all-time digest.
    void reset();

    uint64_t sent() const {
        return sent_;
    }
    uint64_t received() const {
        return received_;
    }
    uint64_t current_streak() const {
        return current_streak_;
    }
    uint64_t longest_streak() const {
        return longest_streak_;
    }
    AllTimeStats& all_time() {
        return all_time_;
    }
    const AllTimeStats& all_time() const {
        return all_time_;
    }
    const std::deque<ProbeOutcome>& history() const {
        return history_;
    }

    SteadyClock::duration elapsed() const;
    std::optional<SteadyClock::duration> time_since_last_loss() const;

    // Mean absolute difference between consecutive successful latencies.
    std::optional<Latency> jitter() const;
    std::optional<double> mos_score() const;
    std::optional<QualityGrade> quality_grade() const;

    double packet_loss() const;
    LossStats window_packet_loss() const;
    LossStats all_time_packet_loss() const;

    std::optional<Histogram> histogram(size_t num_buckets) const;

    // Window metrics over successful entries of the history.
    std::optional<Latency> current() const;
    std::optional<Latency> average() const;
    std::optional<Latency> min() const;
    std::optional<Latency> max() const;
    // p in [0, 100].
    std::optional<Latency> percentile(double p) const;
    std::optional<Latency> p50() const {
        return percentile(50.0);
    }
    std::optional<Latency> p95() const {
        return percentile(95.0);
    }
    std::optional<Latency> p99() const {
        return percentile(99.0);
    }
    size_t window_count() const {
        return history_.size();
    }

    // Microseconds per history entry, 0 for losses.
    std::vector<uint64_t> sparkline_data() const;
    // Newest first.
    std::vector<std::optional<Latency>> recent_latencies(size_t n) const;

   private:
    std::vector<Latency> successful_latencies() const;

    std::deque<ProbeOutcome> history_;
    uint64_t sent_{0};
    uint64_t received_{0};
    AllTimeStats all_time_;
    SteadyClock::time_point started_at_;
    uint64_t current_streak_{0};
    uint64_t longest_streak_{0};
    std::optional<SteadyClock::time_point> last_loss_at_;
    std::optional<Latency> prev_latency_;
    Latency jitter_sum_{0};
    uint64_t jitter_count_{0};
};
}  // namespace nlm
