#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../core/event_bus.hpp"
#include "../core/store_jsonl.hpp"
#include "../core/target.hpp"
#include "../stats/target_stats.hpp"

namespace nlm {
// Plays a recorded event log back against a virtual clock:
//   virtual = anchor_recorded + (now - anchor_wall) * speed
// The anchor is taken on the first poll and retaken on every control action,
// so pausing, seeking and speed changes never skip or repeat an event.
class ReplayEngine {
   public:
    using Instant = SteadyClock::time_point;

    explicit ReplayEngine(double speed = 1.0);

    bool load(const std::string& path, std::string& err, size_t max_events = kMaxReplayEvents);
    // Events must be in chronological order. An empty list is rejected.
    bool set_events(std::vector<PersistedEvent> events, std::string& err);

    // Events whose recorded time has been reached, in log order.
    std::vector<PersistedEvent> poll(Instant now);
    std::vector<PersistedEvent> poll() {
        return poll(SteadyClock::now());
    }

    void toggle_pause(Instant now);
    void toggle_pause() {
        toggle_pause(SteadyClock::now());
    }
    void skip_forward(size_t n, Instant now);
    void skip_forward(size_t n) {
        skip_forward(n, SteadyClock::now());
    }
    void skip_backward(size_t n, Instant now);
    void skip_backward(size_t n) {
        skip_backward(n, SteadyClock::now());
    }
    void speed_up(Instant now);
    void speed_up() {
        speed_up(SteadyClock::now());
    }
    void slow_down(Instant now);
    void slow_down() {
        slow_down(SteadyClock::now());
    }

    const std::vector<PersistedEvent>& events() const {
        return events_;
    }
    size_t total_events() const {
        return events_.size();
    }
    size_t cursor() const {
        return cursor_;
    }
    double progress_pct() const;
    std::optional<WallTime> current_timestamp() const;
    std::chrono::microseconds duration() const;
    double speed() const {
        return speed_;
    }
    bool paused() const {
        return paused_;
    }
    bool finished() const {
        return finished_;
    }

   private:
    WallTime virtual_time(Instant now) const;
    void anchor_at_cursor(Instant now);
    void set_speed(double speed, Instant now);

    std::vector<PersistedEvent> events_;
    size_t cursor_{0};
    double speed_{1.0};
    bool paused_{false};
    bool finished_{false};
    bool anchored_{false};
    Instant anchor_wall_{};
    WallTime anchor_recorded_{};
};

double clamp_speed(double speed);

// One target (and fresh stats) per distinct (name, address) pair, in the
// order first seen. Events whose address does not parse are skipped.
void build_replay_targets(const std::vector<PersistedEvent>& events, std::vector<Target>& targets,
                          std::vector<TargetStats>& stats);

// Records the event against the first target with the same address. Two
// names sharing one address therefore merge into the first of them.
bool apply_event(const PersistedEvent& ev, const std::vector<Target>& targets,
                 std::vector<TargetStats>& stats);
}  // namespace nlm
