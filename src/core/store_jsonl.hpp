#pragma once
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "event_bus.hpp"

namespace nlm {
constexpr size_t kMaxReplayEvents = 1000000;
// Upper bound on a recorded round trip (one hour); larger values are corrupt.
constexpr uint64_t kMaxLatencyUs = 3600ULL * 1000000ULL;

std::string encode_event(const PersistedEvent& ev);
bool decode_event(const std::string& line, PersistedEvent& ev, std::string& err);

// gzip-compressed JSON Lines writer for raw probe events. The file is
// created with owner-only permissions and truncated if it exists.
class JsonlStore : public EventSink {
   public:
    static constexpr uint64_t kFlushEvery = 50;

    explicit JsonlStore(const std::string& path);
    ~JsonlStore() override;
    JsonlStore(const JsonlStore&) = delete;
    JsonlStore& operator=(const JsonlStore&) = delete;

    bool ok() const {
        return gz_ != nullptr;
    }
    const std::string& path() const {
        return path_;
    }
    uint64_t written() const {
        return written_;
    }
    void on_event(const PersistedEvent& ev) override;
    bool flush();
    // Writes the gzip trailer and closes the file. Safe to call twice.
    bool finish();

   private:
    std::string path_;
    gzFile gz_{nullptr};
    uint64_t written_{0};
    bool write_line(const std::string& line);
};

// Reads a whole event log. Any malformed line or a damaged/truncated gzip
// stream fails the load; logs longer than max_events are cut at the cap.
bool load_events(const std::string& path, std::vector<PersistedEvent>& out, std::string& err,
                 size_t max_events = kMaxReplayEvents);
}  // namespace nlm
