#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "../core/channel.hpp"
#include "../core/target.hpp"
#include "probe_client.hpp"

namespace nlm {
struct ProbeUpdate {
    size_t target_idx{0};
    ProbeOutcome outcome;
};

using UpdateChannel = Channel<ProbeUpdate>;

struct WorkerOptions {
    std::chrono::milliseconds interval{1000};
    std::chrono::milliseconds timeout{4000};
    std::chrono::milliseconds create_backoff{1000};
    uint32_t rebuild_after{3};
    size_t payload_size{56};
    uint16_t first_seq{0};
};

// Errors that point at the local socket or routing rather than the remote
// host; enough of them in a row and the session is rebuilt.
bool is_network_error(const std::string& reason);

// Probes one target from its own thread, one attempt per tick, and reports
// every attempt on the shared channel. The thread ends when the channel is
// closed; join() may then wait up to one interval plus one probe timeout.
class ProbeWorker {
   public:
    ProbeWorker(size_t target_idx, Target target, WorkerOptions opts,
                std::shared_ptr<UpdateChannel> out, ClientFactory factory);
    ~ProbeWorker();
    ProbeWorker(const ProbeWorker&) = delete;
    ProbeWorker& operator=(const ProbeWorker&) = delete;

    bool start(std::string& err);
    void join();

   private:
    void run();
    bool emit(ProbeOutcome outcome);
    bool back_off(const std::string& reason);

    size_t target_idx_;
    Target target_;
    WorkerOptions opts_;
    std::shared_ptr<UpdateChannel> out_;
    ClientFactory factory_;
    std::thread thread_;
};
}  // namespace nlm
