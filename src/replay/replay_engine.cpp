#include "replay_engine.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

#include "../core/config.hpp"
#include "../core/logger.hpp"

namespace nlm {
double clamp_speed(double speed) {
    if (!std::isfinite(speed)) return 1.0;
    return std::min(kMaxSpeed, std::max(kMinSpeed, speed));
}

ReplayEngine::ReplayEngine(double speed) : speed_(clamp_speed(speed)) {}

bool ReplayEngine::load(const std::string& path, std::string& err, size_t max_events) {
    std::vector<PersistedEvent> events;
    if (!load_events(path, events, err, max_events)) return false;
    if (!set_events(std::move(events), err)) {
        err = path + ": " + err;
        return false;
    }
    log(LogLevel::INFO, "replay: loaded " + std::to_string(events_.size()) + " events from " +
                            path);
    return true;
}

bool ReplayEngine::set_events(std::vector<PersistedEvent> events, std::string& err) {
    if (events.empty()) {
        err = "log contains no events";
        return false;
    }
    events_ = std::move(events);
    cursor_ = 0;
    paused_ = false;
    finished_ = false;
    anchored_ = false;
    return true;
}

WallTime ReplayEngine::virtual_time(Instant now) const {
    auto wall_us = std::chrono::duration_cast<std::chrono::microseconds>(now - anchor_wall_);
    auto scaled = static_cast<int64_t>(std::llround(static_cast<double>(wall_us.count()) * speed_));
    return anchor_recorded_ + std::chrono::microseconds(scaled);
}

void ReplayEngine::anchor_at_cursor(Instant now) {
    if (events_.empty()) return;
    size_t idx = std::min(cursor_, events_.size() - 1);
    anchor_wall_ = now;
    anchor_recorded_ = events_[idx].timestamp;
    anchored_ = true;
}

std::vector<PersistedEvent> ReplayEngine::poll(Instant now) {
    std::vector<PersistedEvent> out;
    if (events_.empty() || paused_ || finished_) return out;
    if (!anchored_) anchor_at_cursor(now);

    WallTime vt = virtual_time(now);
    while (cursor_ < events_.size() && events_[cursor_].timestamp <= vt) {
        out.push_back(events_[cursor_]);
        ++cursor_;
    }
    if (cursor_ >= events_.size()) {
        finished_ = true;
        log(LogLevel::INFO, "replay: finished");
    }
    return out;
}

void ReplayEngine::toggle_pause(Instant now) {
    paused_ = !paused_;
    if (!paused_) anchor_at_cursor(now);
}

void ReplayEngine::skip_forward(size_t n, Instant now) {
    if (events_.empty()) return;
    size_t last = events_.size() - 1;
    cursor_ = n > last - std::min(cursor_, last) ? last : cursor_ + n;
    anchor_at_cursor(now);
}

void ReplayEngine::skip_backward(size_t n, Instant now) {
    if (events_.empty()) return;
    size_t last = events_.size() - 1;
    size_t from = std::min(cursor_, last);
    cursor_ = n > from ? 0 : from - n;
    finished_ = false;
    anchor_at_cursor(now);
}

void ReplayEngine::set_speed(double speed, Instant now) {
    speed = clamp_speed(speed);
    if (anchored_ && !paused_ && !finished_) {
        WallTime vt = virtual_time(now);
        anchor_wall_ = now;
        anchor_recorded_ = vt;
    }
    speed_ = speed;
}

void ReplayEngine::speed_up(Instant now) {
    set_speed(speed_ * 2.0, now);
}

void ReplayEngine::slow_down(Instant now) {
    set_speed(speed_ / 2.0, now);
}

double ReplayEngine::progress_pct() const {
    if (events_.empty()) return 0.0;
    return static_cast<double>(cursor_) / static_cast<double>(events_.size()) * 100.0;
}

std::optional<WallTime> ReplayEngine::current_timestamp() const {
    if (events_.empty()) return std::nullopt;
    return events_[std::min(cursor_, events_.size() - 1)].timestamp;
}

std::chrono::microseconds ReplayEngine::duration() const {
    if (events_.size() < 2) return std::chrono::microseconds(0);
    return std::chrono::duration_cast<std::chrono::microseconds>(events_.back().timestamp -
                                                                 events_.front().timestamp);
}

void build_replay_targets(const std::vector<PersistedEvent>& events, std::vector<Target>& targets,
                          std::vector<TargetStats>& stats) {
    targets.clear();
    stats.clear();
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& ev : events) {
        if (!seen.insert({ev.target_name, ev.target_addr}).second) continue;
        IpAddress addr;
        if (!IpAddress::parse(ev.target_addr, addr)) {
            log(LogLevel::DEBUG, "replay: skipping unparsable address '" + ev.target_addr + "'");
            continue;
        }
        targets.push_back(Target{ev.target_name, addr});
    }
    stats.resize(targets.size());
}

bool apply_event(const PersistedEvent& ev, const std::vector<Target>& targets,
                 std::vector<TargetStats>& stats) {
    IpAddress parsed;
    std::string key = IpAddress::parse(ev.target_addr, parsed) ? parsed.to_string() : ev.target_addr;
    for (size_t i = 0; i < targets.size() && i < stats.size(); ++i) {
        if (targets[i].addr_string() != key) continue;
        if (ev.latency_us)
            stats[i].record(ProbeOutcome::success(Latency(static_cast<int64_t>(*ev.latency_us))));
        else
            stats[i].record(ProbeOutcome::timeout());
        return true;
    }
    return false;
}
}  // namespace nlm
