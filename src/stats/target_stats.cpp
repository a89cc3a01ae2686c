#include "target_stats.hpp"

#include <algorithm>
#include <cmath>

#include "../util/percentile.hpp"

namespace nlm {
AllTimeStats::AllTimeStats() : digest_(kDigestSize) {
    buffer_.reserve(kBufferSize);
}

void AllTimeStats::record(Latency d) {
    min_ = min_ ? std::min(*min_, d) : d;
    max_ = max_ ? std::max(*max_, d) : d;
    sum_ += d;
    ++count_;
    buffer_.push_back(to_ms(d));
    if (buffer_.size() >= kBufferSize) compact();
}

void AllTimeStats::compact() {
    if (buffer_.empty()) return;
    std::vector<double> batch;
    batch.swap(buffer_);
    buffer_.reserve(kBufferSize);
    digest_.merge_unsorted(std::move(batch));
}

std::optional<Latency> AllTimeStats::average() const {
    if (count_ == 0) return std::nullopt;
    return Latency(sum_.count() / static_cast<Latency::rep>(count_));
}

std::optional<Latency> AllTimeStats::percentile(double q) {
    if (count_ == 0) return std::nullopt;
    compact();
    double ms = digest_.quantile(q);
    if (ms <= 0.0) return std::nullopt;
    return Latency(static_cast<Latency::rep>(std::llround(ms * 1000.0)));
}

TargetStats::TargetStats() : started_at_(SteadyClock::now()) {}

void TargetStats::reset() {
    history_.clear();
    sent_ = 0;
    received_ = 0;
    all_time_ = AllTimeStats();
    started_at_ = SteadyClock::now();
    current_streak_ = 0;
    longest_streak_ = 0;
    last_loss_at_.reset();
    prev_latency_.reset();
    jitter_sum_ = Latency(0);
    jitter_count_ = 0;
}

void TargetStats::record(const ProbeOutcome& outcome) {
    ++sent_;
    if (outcome.ok()) {
        Latency d = outcome.latency;
        ++received_;
        all_time_.record(d);

        ++current_streak_;
        longest_streak_ = std::max(longest_streak_, current_streak_);

        if (prev_latency_) {
            jitter_sum_ += d > *prev_latency_ ? d - *prev_latency_ : *prev_latency_ - d;
            ++jitter_count_;
        }
        prev_latency_ = d;
    } else {
        current_streak_ = 0;
        last_loss_at_ = SteadyClock::now();
        // A loss breaks the consecutive pair used for jitter.
        prev_latency_.reset();
    }

    if (history_.size() >= kMaxHistory) history_.pop_front();
    history_.push_back(outcome);
}

SteadyClock::duration TargetStats::elapsed() const {
    return SteadyClock::now() - started_at_;
}

std::optional<SteadyClock::duration> TargetStats::time_since_last_loss() const {
    if (!last_loss_at_) return std::nullopt;
    return SteadyClock::now() - *last_loss_at_;
}

std::optional<Latency> TargetStats::jitter() const {
    if (jitter_count_ == 0) return std::nullopt;
    return Latency(jitter_sum_.count() / static_cast<Latency::rep>(jitter_count_));
}

std::optional<double> TargetStats::mos_score() const {
    if (all_time_.count() == 0) return std::nullopt;
    double avg_ms = to_ms(all_time_.sum()) / static_cast<double>(all_time_.count());
    double jitter_ms = jitter_count_ == 0
                           ? 0.0
                           : to_ms(jitter_sum_) / static_cast<double>(jitter_count_);
    return nlm::mos_score(avg_ms, jitter_ms, packet_loss());
}

std::optional<QualityGrade> TargetStats::quality_grade() const {
    auto mos = mos_score();
    if (!mos) return std::nullopt;
    return grade_for_mos(*mos);
}

double TargetStats::packet_loss() const {
    if (sent_ == 0) return 0.0;
    return static_cast<double>(sent_ - received_) / static_cast<double>(sent_) * 100.0;
}

LossStats TargetStats::window_packet_loss() const {
    LossStats out;
    if (history_.empty()) return out;
    auto ok = std::count_if(history_.begin(), history_.end(),
                            [](const ProbeOutcome& o) { return o.ok(); });
    out.lost = history_.size() - static_cast<uint64_t>(ok);
    out.pct = static_cast<double>(out.lost) / static_cast<double>(history_.size()) * 100.0;
    return out;
}

LossStats TargetStats::all_time_packet_loss() const {
    return {sent_ - received_, packet_loss()};
}

std::optional<Histogram> TargetStats::histogram(size_t num_buckets) const {
    if (num_buckets == 0) return std::nullopt;
    std::vector<double> ms;
    for (const auto& o : history_)
        if (o.ok()) ms.push_back(to_ms(o.latency));
    if (ms.empty()) return std::nullopt;

    auto mm = std::minmax_element(ms.begin(), ms.end());
    double lo = *mm.first;
    double hi = *mm.second;

    Histogram h;
    if (std::fabs(hi - lo) < 0.001) {
        h.boundaries.push_back(lo);
        h.counts.push_back(ms.size());
        return h;
    }

    double width = (hi - lo) / static_cast<double>(num_buckets);
    h.counts.assign(num_buckets, 0);
    for (size_t i = 0; i < num_buckets; ++i) h.boundaries.push_back(lo + width * i);
    for (double v : ms) {
        auto bucket = static_cast<size_t>(std::floor((v - lo) / width));
        h.counts[std::min(bucket, num_buckets - 1)] += 1;
    }
    return h;
}

std::vector<Latency> TargetStats::successful_latencies() const {
    std::vector<Latency> out;
    out.reserve(history_.size());
    for (const auto& o : history_)
        if (o.ok()) out.push_back(o.latency);
    return out;
}

std::optional<Latency> TargetStats::current() const {
    if (history_.empty() || !history_.back().ok()) return std::nullopt;
    return history_.back().latency;
}

std::optional<Latency> TargetStats::average() const {
    auto v = successful_latencies();
    if (v.empty()) return std::nullopt;
    Latency sum(0);
    for (auto d : v) sum += d;
    return Latency(sum.count() / static_cast<Latency::rep>(v.size()));
}

std::optional<Latency> TargetStats::min() const {
    auto v = successful_latencies();
    if (v.empty()) return std::nullopt;
    return *std::min_element(v.begin(), v.end());
}

std::optional<Latency> TargetStats::max() const {
    auto v = successful_latencies();
    if (v.empty()) return std::nullopt;
    return *std::max_element(v.begin(), v.end());
}

std::optional<Latency> TargetStats::percentile(double p) const {
    return nlm::percentile(successful_latencies(), p);
}

std::vector<uint64_t> TargetStats::sparkline_data() const {
    std::vector<uint64_t> out;
    out.reserve(history_.size());
    for (const auto& o : history_)
        out.push_back(o.ok() ? static_cast<uint64_t>(o.latency.count()) : 0);
    return out;
}

std::vector<std::optional<Latency>> TargetStats::recent_latencies(size_t n) const {
    std::vector<std::optional<Latency>> out;
    for (auto it = history_.rbegin(); it != history_.rend() && out.size() < n; ++it) {
        if (it->ok())
            out.emplace_back(it->latency);
        else
            out.emplace_back(std::nullopt);
    }
    return out;
}
}  // namespace nlm
