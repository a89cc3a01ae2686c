#include "coordinator.hpp"

#include "../core/logger.hpp"
#include "../report/summary_writer.hpp"

namespace nlm {
Coordinator::Coordinator(std::vector<Target> targets, std::shared_ptr<UpdateChannel> updates,
                         EventBus& raw_sink, CoordinatorOptions opts, Clock clock)
    : targets_(std::move(targets)),
      stats_(targets_.size()),
      updates_(std::move(updates)),
      raw_sink_(raw_sink),
      opts_(std::move(opts)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {
    started_ = clock_();
    last_summary_ = started_;
}

size_t Coordinator::process_updates() {
    size_t applied = 0;
    WallTime now = clock_();
    ProbeUpdate u;
    while (updates_->try_recv(u)) {
        if (u.target_idx >= targets_.size()) {
            ++dropped_;
            log(LogLevel::WARN, "dropping update for unknown target index " +
                                    std::to_string(u.target_idx));
            continue;
        }
        if (opts_.log_raw) {
            const Target& t = targets_[u.target_idx];
            PersistedEvent ev;
            ev.timestamp = now;
            ev.target_idx = u.target_idx;
            ev.target_name = t.name;
            ev.target_addr = t.addr_string();
            if (u.outcome.ok()) ev.latency_us = static_cast<uint64_t>(u.outcome.latency.count());
            raw_sink_.emit(ev);
        }
        stats_[u.target_idx].record(u.outcome);
        ++applied;
    }
    maybe_write_summary(now);
    return applied;
}

void Coordinator::reset_stats() {
    for (auto& s : stats_) s.reset();
    log(LogLevel::INFO, "statistics reset");
}

bool Coordinator::write_summary_now() {
    if (opts_.summary_path.empty()) return false;
    WallTime now = clock_();
    last_summary_ = now;
    std::string err;
    if (!write_summary(opts_.summary_path, targets_, stats_, started_, now, err)) return false;
    ++summaries_written_;
    return true;
}

void Coordinator::maybe_write_summary(WallTime now) {
    if (opts_.summary_path.empty()) return;
    if (now - last_summary_ < opts_.summary_interval) return;
    last_summary_ = now;
    std::string err;
    if (write_summary(opts_.summary_path, targets_, stats_, started_, now, err))
        ++summaries_written_;
}
}  // namespace nlm
