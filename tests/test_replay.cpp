#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include "../src/core/logger.hpp"
#include "../src/core/store_jsonl.hpp"
#include "../src/replay/replay_engine.hpp"

using namespace nlm;
using std::chrono::milliseconds;

namespace {
WallTime base_time() {
    WallTime t;
    parse_rfc3339("2024-05-01T12:00:00Z", t);
    return t;
}

// One event per recorded second, alternating two targets.
std::vector<PersistedEvent> make_log(int n) {
    std::vector<PersistedEvent> out;
    for (int i = 0; i < n; ++i) {
        PersistedEvent ev;
        ev.timestamp = base_time() + std::chrono::seconds(i);
        ev.target_idx = static_cast<uint64_t>(i % 2);
        ev.target_name = i % 2 ? "Google" : "Cloudflare";
        ev.target_addr = i % 2 ? "8.8.8.8" : "1.1.1.1";
        if (i % 5 != 4) ev.latency_us = 10000 + static_cast<uint64_t>(i);
        out.push_back(ev);
    }
    return out;
}

int test_realtime_playback() {
    ReplayEngine engine(1.0);
    std::string err;
    if (!engine.set_events(make_log(10), err)) return 1;
    auto t0 = SteadyClock::now();

    // The first poll anchors on the first event, which is due at once.
    auto got = engine.poll(t0);
    if (got.size() != 1 || engine.cursor() != 1) return 2;

    size_t seen = 1;
    WallTime last = got.back().timestamp;
    for (int ms = 100; ms <= 12000; ms += 100) {
        auto now = t0 + milliseconds(ms);
        auto batch = engine.poll(now);
        WallTime virt = base_time() + milliseconds(ms);
        for (const auto& ev : batch) {
            if (ev.timestamp > virt) return 3;
            if (ev.timestamp < last) return 4;
            last = ev.timestamp;
        }
        seen += batch.size();
        if (engine.cursor() != seen) return 5;
    }
    if (seen != 10 || !engine.finished()) return 6;
    if (!engine.poll(t0 + milliseconds(20000)).empty()) return 7;
    return 0;
}

int test_pause_resume() {
    ReplayEngine engine(1.0);
    std::string err;
    engine.set_events(make_log(10), err);
    auto t0 = SteadyClock::now();
    engine.poll(t0);
    engine.poll(t0 + milliseconds(2500));  // events 0..2
    if (engine.cursor() != 3) return 1;

    engine.toggle_pause(t0 + milliseconds(2500));
    if (!engine.paused()) return 2;
    if (!engine.poll(t0 + milliseconds(60000)).empty()) return 3;

    // Resuming anchors at the event under the cursor: it is due at once,
    // nothing is skipped and nothing is repeated.
    engine.toggle_pause(t0 + milliseconds(60000));
    auto batch = engine.poll(t0 + milliseconds(60000));
    if (batch.size() != 1 || batch[0].timestamp != base_time() + std::chrono::seconds(3)) return 4;
    batch = engine.poll(t0 + milliseconds(61000));
    if (batch.size() != 1 || batch[0].timestamp != base_time() + std::chrono::seconds(4)) return 5;
    return 0;
}

int test_seek() {
    ReplayEngine engine(1.0);
    std::string err;
    engine.set_events(make_log(300), err);
    auto t0 = SteadyClock::now();
    engine.poll(t0);
    engine.skip_forward(100, t0);
    if (engine.cursor() != 101) return 1;
    auto batch = engine.poll(t0);
    if (batch.size() != 1 || batch[0].timestamp != base_time() + std::chrono::seconds(101))
        return 2;

    engine.skip_backward(1000, t0);
    if (engine.cursor() != 0) return 3;
    engine.skip_forward(100000, t0);
    if (engine.cursor() != 299) return 4;
    batch = engine.poll(t0);
    if (batch.size() != 1 || !engine.finished()) return 5;

    // Backward seeks revive a finished replay.
    engine.skip_backward(5, t0);
    if (engine.finished() || engine.cursor() != 294) return 6;
    if (engine.poll(t0).size() != 1) return 7;
    return 0;
}

int test_speed() {
    ReplayEngine clamped_hi(1000.0);
    ReplayEngine clamped_lo(0.0001);
    if (clamped_hi.speed() != 100.0 || clamped_lo.speed() != 0.1) return 1;

    ReplayEngine engine(1.0);
    std::string err;
    engine.set_events(make_log(100), err);
    auto t0 = SteadyClock::now();
    engine.poll(t0);
    engine.poll(t0 + milliseconds(2000));  // virtual +2 s
    if (engine.cursor() != 3) return 2;

    // Re-anchoring at the current virtual time keeps the mapping continuous.
    engine.speed_up(t0 + milliseconds(2000));
    if (engine.speed() != 2.0) return 3;
    engine.poll(t0 + milliseconds(3000));  // virtual +4 s
    if (engine.cursor() != 5) return 4;

    engine.slow_down(t0 + milliseconds(3000));
    engine.slow_down(t0 + milliseconds(3000));
    if (engine.speed() != 0.5) return 5;
    engine.poll(t0 + milliseconds(5000));  // virtual +5 s
    if (engine.cursor() != 6) return 6;

    for (int i = 0; i < 20; ++i) engine.speed_up(t0 + milliseconds(5000));
    if (engine.speed() != 100.0) return 7;
    for (int i = 0; i < 20; ++i) engine.slow_down(t0 + milliseconds(5000));
    if (engine.speed() != 0.1) return 8;
    return 0;
}

int test_accessors() {
    ReplayEngine engine;
    std::string err;
    if (engine.set_events({}, err)) return 1;
    if (engine.progress_pct() != 0.0 || engine.current_timestamp()) return 2;
    engine.set_events(make_log(4), err);
    if (engine.total_events() != 4) return 3;
    if (engine.duration() != std::chrono::seconds(3)) return 4;
    if (*engine.current_timestamp() != base_time()) return 5;
    engine.poll(SteadyClock::now());
    if (engine.progress_pct() != 25.0) return 6;
    return 0;
}

int test_targets_and_apply() {
    auto events = make_log(10);
    PersistedEvent odd = events[0];
    odd.target_name = "bogus";
    odd.target_addr = "not-an-ip";
    events.push_back(odd);
    PersistedEvent alias = events[0];
    alias.target_name = "Cloudflare-alt";
    events.push_back(alias);

    std::vector<Target> targets;
    std::vector<TargetStats> stats;
    build_replay_targets(events, targets, stats);
    if (targets.size() != 3 || stats.size() != 3) return 1;
    if (targets[0].name != "Cloudflare" || targets[1].name != "Google") return 2;
    if (targets[2].name != "Cloudflare-alt") return 3;

    for (const auto& ev : events) apply_event(ev, targets, stats);
    // Same address merges into the first target.
    if (stats[0].sent() != 6 || stats[2].sent() != 0) return 4;
    if (stats[1].sent() != 5) return 5;
    // Events 4 and 9 carry no latency and count as timeouts.
    if (stats[0].received() != 5 || stats[1].received() != 4) return 6;
    if (apply_event(odd, targets, stats)) return 7;
    return 0;
}

int test_load_file() {
    std::string path = "/tmp/nlm_test_replay_" + std::to_string(::getpid()) + ".jsonl.gz";
    {
        JsonlStore store(path);
        for (const auto& ev : make_log(30)) store.on_event(ev);
    }
    ReplayEngine engine;
    std::string err;
    if (!engine.load(path, err, 20)) return 1;
    if (engine.total_events() != 20) return 2;

    {
        JsonlStore empty(path);
    }
    if (engine.load(path, err)) return 3;
    if (err.find("no events") == std::string::npos) return 4;
    std::remove(path.c_str());
    return 0;
}
}  // namespace

int main() {
    set_log_level(LogLevel::ERROR);
    if (int rc = test_realtime_playback()) return 10 + rc;
    if (int rc = test_pause_resume()) return 20 + rc;
    if (int rc = test_seek()) return 30 + rc;
    if (int rc = test_speed()) return 40 + rc;
    if (int rc = test_accessors()) return 50 + rc;
    if (int rc = test_targets_and_apply()) return 60 + rc;
    if (int rc = test_load_file()) return 70 + rc;
    return 0;
}
