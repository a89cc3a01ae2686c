#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../src/core/logger.hpp"
#include "../src/probes/probe_worker.hpp"

using namespace nlm;
using std::chrono::milliseconds;

namespace {
struct Script {
    std::atomic<int> creates{0};
    std::atomic<int> create_failures_left{0};
    std::atomic<int> pings{0};
    // Outcome returned by every ping.
    ProbeOutcome outcome = ProbeOutcome::success(std::chrono::microseconds(1500));
    std::vector<uint16_t> seqs;
    std::vector<uint16_t> idents;
};

class FakeClient : public ProbeClient {
   public:
    explicit FakeClient(Script& s) : s_(s) {}
    ProbeOutcome ping(const IpAddress&, uint16_t ident, uint16_t seq,
                      const std::vector<uint8_t>& payload, milliseconds) override {
        assert(payload.size() == 56);
        s_.seqs.push_back(seq);
        s_.idents.push_back(ident);
        ++s_.pings;
        return s_.outcome;
    }

   private:
    Script& s_;
};

ClientFactory fake_factory(Script& s) {
    return [&s](const IpAddress&, std::string& err) -> std::unique_ptr<ProbeClient> {
        ++s.creates;
        if (s.create_failures_left > 0) {
            --s.create_failures_left;
            err = "socket: Operation not permitted";
            return nullptr;
        }
        return std::unique_ptr<ProbeClient>(new FakeClient(s));
    };
}

Target test_target() {
    Target t;
    t.name = "local";
    IpAddress::parse("127.0.0.1", t.addr);
    return t;
}

WorkerOptions fast_options() {
    WorkerOptions o;
    o.interval = milliseconds(10);
    o.timeout = milliseconds(50);
    o.create_backoff = milliseconds(5);
    return o;
}

// Collects `n` updates or gives up after a generous deadline.
std::vector<ProbeUpdate> collect(UpdateChannel& ch, size_t n) {
    std::vector<ProbeUpdate> out;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    ProbeUpdate u;
    while (out.size() < n && std::chrono::steady_clock::now() < deadline)
        if (ch.recv_for(u, milliseconds(100))) out.push_back(u);
    return out;
}

int test_success_stream() {
    Script s;
    auto ch = std::make_shared<UpdateChannel>();
    ProbeWorker w(3, test_target(), fast_options(), ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) return 1;
    if (w.start(err)) return 2;
    auto got = collect(*ch, 5);
    ch->close();
    w.join();
    if (got.size() != 5) return 3;
    for (const auto& u : got)
        if (u.target_idx != 3 || !u.outcome.ok()) return 4;
    if (s.creates != 1) return 5;
    // Sequence numbers count up from zero.
    for (size_t i = 0; i < s.seqs.size(); ++i)
        if (s.seqs[i] != i) return 6;
    return 0;
}

int test_creation_failure_retries() {
    Script s;
    s.create_failures_left = 2;
    auto ch = std::make_shared<UpdateChannel>();
    ProbeWorker w(0, test_target(), fast_options(), ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) return 1;
    auto got = collect(*ch, 4);
    ch->close();
    w.join();
    if (got.size() != 4) return 2;
    for (int i = 0; i < 2; ++i) {
        if (got[i].outcome.kind != ProbeOutcome::Kind::Error) return 3;
        if (got[i].outcome.reason.rfind("client error: ", 0) != 0) return 4;
    }
    if (!got[2].outcome.ok() || !got[3].outcome.ok()) return 5;
    if (s.creates != 3) return 6;
    return 0;
}

int test_rebuild_after_network_errors() {
    Script s;
    s.outcome = ProbeOutcome::error("Network is unreachable");
    auto ch = std::make_shared<UpdateChannel>();
    ProbeWorker w(0, test_target(), fast_options(), ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) return 1;
    auto got = collect(*ch, 7);
    ch->close();
    w.join();
    if (got.size() != 7) return 2;
    // Errors 3 and 6 each discard the session.
    if (s.creates < 3) return 3;
    return 0;
}

int test_timeouts_keep_session() {
    Script s;
    s.outcome = ProbeOutcome::timeout();
    auto ch = std::make_shared<UpdateChannel>();
    ProbeWorker w(0, test_target(), fast_options(), ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) return 1;
    auto got = collect(*ch, 6);
    ch->close();
    w.join();
    if (got.size() != 6) return 2;
    if (s.creates != 1) return 3;
    for (const auto& u : got)
        if (u.outcome.kind != ProbeOutcome::Kind::Timeout) return 4;
    return 0;
}

int test_remote_errors_keep_session() {
    Script s;
    s.outcome = ProbeOutcome::error("reply checksum mismatch");
    auto ch = std::make_shared<UpdateChannel>();
    ProbeWorker w(0, test_target(), fast_options(), ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) return 1;
    auto got = collect(*ch, 6);
    ch->close();
    w.join();
    if (got.size() != 6 || s.creates != 1) return 2;
    return 0;
}

int test_closed_channel_stops_worker() {
    Script s;
    auto ch = std::make_shared<UpdateChannel>();
    ch->close();
    ProbeWorker w(0, test_target(), fast_options(), ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) return 1;
    auto start = std::chrono::steady_clock::now();
    w.join();
    if (std::chrono::steady_clock::now() - start > std::chrono::seconds(2)) return 2;
    if (s.pings != 1) return 3;
    return 0;
}

int test_sequence_wraps() {
    Script s;
    auto ch = std::make_shared<UpdateChannel>();
    WorkerOptions o = fast_options();
    o.first_seq = 65534;
    ProbeWorker w(0, test_target(), o, ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) return 1;
    auto got = collect(*ch, 4);
    ch->close();
    w.join();
    if (got.size() != 4 || s.seqs.size() < 4) return 2;
    if (s.seqs[0] != 65534 || s.seqs[1] != 65535) return 3;
    if (s.seqs[2] != 0 || s.seqs[3] != 1) return 4;
    return 0;
}

int test_identifier_changes_per_attempt() {
    Script s;
    auto ch = std::make_shared<UpdateChannel>();
    ProbeWorker w(0, test_target(), fast_options(), ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) return 1;
    auto got = collect(*ch, 20);
    ch->close();
    w.join();
    if (got.size() != 20 || s.idents.size() < 20) return 2;
    size_t repeats = 0;
    for (size_t i = 1; i < s.idents.size(); ++i)
        if (s.idents[i] == s.idents[i - 1]) ++repeats;
    // 16 random bits per attempt; a couple of collisions is already unlikely.
    if (repeats > 2) return 3;
    return 0;
}

// With the descriptor table full the ticker cannot be created. The worker
// reports that as an error and keeps retrying until descriptors free up.
int test_timer_failure_is_retried() {
    rlimit saved{};
    if (::getrlimit(RLIMIT_NOFILE, &saved) != 0) return 1;
    rlimit low = saved;
    low.rlim_cur = 64;
    if (saved.rlim_max != RLIM_INFINITY && saved.rlim_max < low.rlim_cur)
        low.rlim_cur = saved.rlim_max;
    if (::setrlimit(RLIMIT_NOFILE, &low) != 0) return 2;

    std::vector<int> hogs;
    while (true) {
        int fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (fd < 0) break;
        hogs.push_back(fd);
    }
    int open_errno = errno;
    auto release = [&] {
        for (int fd : hogs) ::close(fd);
        hogs.clear();
        ::setrlimit(RLIMIT_NOFILE, &saved);
    };
    if (open_errno != EMFILE) {
        release();
        return 3;
    }

    Script s;
    auto ch = std::make_shared<UpdateChannel>();
    ProbeWorker w(5, test_target(), fast_options(), ch, fake_factory(s));
    std::string err;
    if (!w.start(err)) {
        release();
        return 4;
    }
    auto failed = collect(*ch, 2);
    release();
    bool recovered = false;
    for (int i = 0; i < 200 && !recovered; ++i) {
        auto more = collect(*ch, 1);
        if (more.empty()) break;
        recovered = more[0].outcome.ok();
    }
    ch->close();
    w.join();

    if (failed.size() != 2) return 5;
    for (const auto& u : failed) {
        if (u.target_idx != 5 || u.outcome.kind != ProbeOutcome::Kind::Error) return 6;
        if (u.outcome.reason.rfind("socket: interval timer", 0) != 0) return 7;
    }
    if (!recovered) return 8;
    return 0;
}

int test_classification() {
    if (!is_network_error("Network is unreachable")) return 1;
    if (!is_network_error("sendto: No route to host")) return 2;
    if (!is_network_error("Destination host unreachable")) return 3;
    if (!is_network_error("INVALID ARGUMENT")) return 4;
    if (!is_network_error("Bad file descriptor")) return 5;
    if (!is_network_error("socket: Operation not permitted")) return 6;
    if (is_network_error("reply checksum mismatch")) return 7;
    if (is_network_error("")) return 8;
    return 0;
}
}  // namespace

int main() {
    set_log_level(LogLevel::ERROR);
    if (int rc = test_classification()) return 10 + rc;
    if (int rc = test_success_stream()) return 20 + rc;
    if (int rc = test_creation_failure_retries()) return 30 + rc;
    if (int rc = test_rebuild_after_network_errors()) return 40 + rc;
    if (int rc = test_timeouts_keep_session()) return 50 + rc;
    if (int rc = test_remote_errors_keep_session()) return 60 + rc;
    if (int rc = test_closed_channel_stops_worker()) return 70 + rc;
    if (int rc = test_sequence_wraps()) return 80 + rc;
    if (int rc = test_identifier_changes_per_attempt()) return 90 + rc;
    if (int rc = test_timer_failure_is_retried()) return 100 + rc;
    return 0;
}
