#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "time_utils.hpp"

namespace nlm {
// One probe outcome as written to the raw log and read back for replay.
// latency_us is empty for timeouts and errors.
struct PersistedEvent {
    WallTime timestamp{};
    uint64_t target_idx{};
    std::string target_name;
    std::string target_addr;
    std::optional<uint64_t> latency_us;
};

class EventSink {
   public:
    virtual ~EventSink() = default;
    virtual void on_event(const PersistedEvent& ev) = 0;
};

class EventBus {
   public:
    void add_sink(EventSink* sink) {
        sinks_.push_back(sink);
    }
    bool empty() const {
        return sinks_.empty();
    }
    void emit(const PersistedEvent& ev) {
        for (auto* s : sinks_) s->on_event(ev);
    }

   private:
    std::vector<EventSink*> sinks_;
};
}  // namespace nlm
