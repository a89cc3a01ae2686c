#include "probe_worker.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <utility>
#include <vector>

#include "../core/logger.hpp"
#include "../core/scheduler_timerfd.hpp"

namespace nlm {
namespace {
uint16_t make_ident() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    return static_cast<uint16_t>(rng());
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

bool is_network_error(const std::string& reason) {
    static const char* const kPatterns[] = {
        "network is unreachable", "no route to host",    "network unreachable", "host unreachable",
        "invalid argument",       "bad file descriptor", "socket",
    };
    std::string r = lower(reason);
    for (const char* p : kPatterns)
        if (r.find(p) != std::string::npos) return true;
    return false;
}

ProbeWorker::ProbeWorker(size_t target_idx, Target target, WorkerOptions opts,
                         std::shared_ptr<UpdateChannel> out, ClientFactory factory)
    : target_idx_(target_idx),
      target_(std::move(target)),
      opts_(opts),
      out_(std::move(out)),
      factory_(std::move(factory)) {}

ProbeWorker::~ProbeWorker() {
    join();
}

bool ProbeWorker::start(std::string& err) {
    if (thread_.joinable()) {
        err = "worker already running";
        return false;
    }
    if (!out_ || !factory_) {
        err = "worker has no channel or client factory";
        return false;
    }
    thread_ = std::thread([this] { run(); });
    return true;
}

void ProbeWorker::join() {
    if (thread_.joinable()) thread_.join();
}

bool ProbeWorker::emit(ProbeOutcome outcome) {
    return out_->send(ProbeUpdate{target_idx_, std::move(outcome)});
}

// Reports a local failure and sleeps before the next attempt. Returns false
// once the channel is closed.
bool ProbeWorker::back_off(const std::string& reason) {
    if (!emit(ProbeOutcome::error(reason))) return false;
    std::this_thread::sleep_for(opts_.create_backoff);
    return true;
}

void ProbeWorker::run() {
    std::vector<uint8_t> payload(opts_.payload_size);
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i & 0xFF);

    IntervalTicker ticker;
    std::unique_ptr<ProbeClient> client;
    uint16_t seq = opts_.first_seq;
    uint32_t consecutive_errors = 0;

    while (true) {
        if (!ticker.running() && !ticker.start(static_cast<int>(opts_.interval.count()))) {
            log(LogLevel::WARN, "worker " + target_.name + ": cannot start ticker");
            if (!back_off("socket: interval timer unavailable")) break;
            continue;
        }
        if (!ticker.wait()) {
            log(LogLevel::WARN, "worker " + target_.name + ": ticker failed, restarting it");
            ticker.stop();
            if (!back_off("socket: interval timer failed")) break;
            continue;
        }
        if (!client) {
            std::string err;
            client = factory_(target_.addr, err);
            if (!client) {
                log(LogLevel::WARN, "worker " + target_.name + ": client error: " + err);
                if (!back_off("client error: " + err)) break;
                continue;
            }
            log(LogLevel::DEBUG, "worker " + target_.name + ": session ready");
            consecutive_errors = 0;
        }

        ProbeOutcome outcome = client->ping(target_.addr, make_ident(), seq, payload, opts_.timeout);
        seq = static_cast<uint16_t>(seq + 1);

        if (outcome.kind == ProbeOutcome::Kind::Error) {
            ++consecutive_errors;
            if (consecutive_errors >= opts_.rebuild_after && is_network_error(outcome.reason)) {
                log(LogLevel::WARN, "worker " + target_.name + ": rebuilding session after " +
                                        std::to_string(consecutive_errors) +
                                        " errors: " + outcome.reason);
                client.reset();
                consecutive_errors = 0;
            }
        } else {
            consecutive_errors = 0;
        }

        if (!emit(std::move(outcome))) break;
    }
    log(LogLevel::DEBUG, "worker " + target_.name + ": channel closed, exiting");
}
}  // namespace nlm
