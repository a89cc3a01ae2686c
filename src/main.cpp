#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>

#include "app/coordinator.hpp"
#include "app/data_dir.hpp"
#include "core/config.hpp"
#include "core/event_bus.hpp"
#include "core/logger.hpp"
#include "core/reactor.hpp"
#include "core/scheduler_timerfd.hpp"
#include "core/store_jsonl.hpp"
#include "core/time_utils.hpp"
#include "probes/icmp_probe.hpp"
#include "probes/probe_worker.hpp"
#include "replay/replay_engine.hpp"
#include "report/summary_writer.hpp"
#include "stats/format.hpp"

using namespace nlm;

namespace {
constexpr int kTickMs = 100;
constexpr int kViewEveryTicks = 10;
constexpr size_t kReplaySkip = 100;

void print_usage() {
    std::cerr << "Usage: nlm [run] [options]\n"
              << "       nlm replay <log.jsonl.gz> [--speed <x>]\n"
              << "       nlm list-logs | list-sessions | doctor\n"
              << "  -t, --target <host>     probe this host (repeatable)\n"
              << "  -i, --interval <ms>     probe interval (default 1000, min 10)\n"
              << "      --no-defaults       skip the built-in public resolvers\n"
              << "  -l, --log-raw           record every probe to <data-dir>/logs\n"
              << "  -s, --summary           write a session summary to <data-dir>/sessions\n"
              << "      --speed <x>         replay speed, 0.1 to 100\n"
              << "      --data-dir <dir>    default $HOME/.nlm\n"
              << "      --log-level <lvl>   debug|info|warn|error (env NLM_LOG_LEVEL)\n"
              << "      --log-file <path>   write diagnostics here instead of stderr\n"
              << "Controls (type a letter and Enter): q quit, r reset stats;\n"
              << "  replay also: p pause, + faster, - slower, f/b skip 100 events\n";
}

void print_permission_help() {
    std::cerr << "ICMP is not permitted for this process. Either:\n"
              << "  sudo setcap cap_net_raw+ep $(command -v nlm)\n"
              << "  sudo sysctl -w net.ipv4.ping_group_range=\"0 2147483647\"\n"
              << "  or run as root.\n";
}

int cmd_doctor() {
    std::cout << "Doctor checks:\n";
    std::string how;
    if (icmp_permitted(how)) {
        std::cout << " - ICMP: available (" << how << ")\n";
    } else {
        std::cout << " - ICMP: unavailable (" << how << ")\n";
        std::cout << " - For CAP_NET_RAW: try setcap cap_net_raw+ep ./nlm\n";
        std::cout << " - Or widen net.ipv4.ping_group_range to include gid " << ::getegid()
                  << "\n";
    }
    for (int family : {AF_INET, AF_INET6}) {
        const char* label = family == AF_INET ? "ICMP" : "ICMPv6";
        std::string err;
        auto client = IcmpClient::create(family, err);
        if (client)
            std::cout << " - " << label << " socket: " << (client->raw() ? "raw" : "datagram")
                      << "\n";
        else
            std::cout << " - " << label << " socket: " << err << "\n";
    }
    std::ifstream range("/proc/sys/net/ipv4/ping_group_range");
    std::string line;
    if (std::getline(range, line)) std::cout << " - ping_group_range: " << line << "\n";
    return 0;
}

int cmd_list(const std::vector<DataFile>& files, const char* what) {
    if (files.empty()) {
        std::cout << "No " << what << " found.\n";
        return 0;
    }
    for (const auto& f : files)
        std::cout << f.name << "  " << format_count(f.size) << "B  " << f.path << "\n";
    return 0;
}

std::string view_line(const Target& t, TargetStats& s) {
    char buf[256];
    auto mos = s.mos_score();
    auto grade = s.quality_grade();
    char mos_text[16] = "-";
    if (mos) std::snprintf(mos_text, sizeof(mos_text), "%.2f", *mos);
    std::snprintf(buf, sizeof(buf),
                  "%-12.12s %-16.16s cur %-8s avg %-8s p95 %-8s loss %5.1f%% jit %-8s mos %-5s %s",
                  t.name.c_str(), t.addr_string().c_str(), format_duration_opt(s.current()).c_str(),
                  format_duration_opt(s.average()).c_str(), format_duration_opt(s.p95()).c_str(),
                  s.packet_loss(), format_duration_opt(s.jitter()).c_str(), mos_text,
                  grade ? grade_letter(*grade) : "-");
    return buf;
}

// Blocks the termination signals for every thread and hands them to the
// reactor through a signalfd. Must run before any worker starts.
int make_signal_fd() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) return -1;
    return ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
}

// Operator commands arrive as lines on stdin; each character is a command.
class CommandReader {
   public:
    bool attach(Reactor& r, const std::function<void(char)>& on_cmd) {
        on_cmd_ = on_cmd;
        eof_ = !r.add_fd(STDIN_FILENO, EPOLLIN, [this, &r](uint32_t) {
            char buf[256];
            ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) {
                r.del_fd(STDIN_FILENO);
                eof_ = true;
                return;
            }
            for (ssize_t i = 0; i < n; ++i)
                if (buf[i] != '\n' && buf[i] != '\r' && buf[i] != ' ') on_cmd_(buf[i]);
        });
        return !eof_;
    }
    bool eof() const {
        return eof_;
    }

   private:
    std::function<void(char)> on_cmd_;
    bool eof_{false};
};

bool resolve_targets(const RunConfig& cfg, std::vector<Target>& out) {
    if (cfg.use_defaults) out = default_targets();
    for (const auto& host : cfg.targets) {
        Target t;
        std::string err;
        if (!resolve_target(host, t, err)) {
            log(LogLevel::ERROR, "target '" + host + "': " + err);
            return false;
        }
        out.push_back(t);
    }
    return !out.empty();
}

int cmd_run(const RunConfig& cfg) {
    std::string how;
    if (!icmp_permitted(how)) {
        log(LogLevel::ERROR, "ICMP not permitted: " + how);
        print_permission_help();
        return 1;
    }
    std::vector<Target> targets;
    if (!resolve_targets(cfg, targets)) {
        std::cerr << "No usable targets.\n";
        return 1;
    }
    WallTime started = std::chrono::system_clock::now();
    std::string err;
    if ((cfg.log_raw || cfg.summary) && !ensure_data_dirs(cfg.data_dir, err)) {
        std::cerr << "Cannot create data directory: " << err << "\n";
        return 1;
    }

    EventBus bus;
    std::unique_ptr<JsonlStore> store;
    if (cfg.log_raw) {
        store = std::make_unique<JsonlStore>(log_path_for(cfg.data_dir, started));
        if (store->ok())
            bus.add_sink(store.get());
        else
            std::cerr << "Raw logging disabled: cannot open " << store->path() << "\n";
    }

    CoordinatorOptions copts;
    copts.log_raw = cfg.log_raw && !bus.empty();
    if (cfg.summary) copts.summary_path = session_path_for(cfg.data_dir, started);

    Fd sig_fd(make_signal_fd());
    if (!sig_fd) log(LogLevel::WARN, "signalfd unavailable; use 'q' to quit");

    auto channel = std::make_shared<UpdateChannel>();
    Coordinator coord(targets, channel, bus, copts);

    WorkerOptions wopts;
    wopts.interval = std::chrono::milliseconds(cfg.interval_ms);
    std::vector<std::unique_ptr<ProbeWorker>> workers;
    for (size_t i = 0; i < targets.size(); ++i) {
        auto w =
            std::make_unique<ProbeWorker>(i, targets[i], wopts, channel, icmp_client_factory());
        if (!w->start(err)) {
            log(LogLevel::ERROR, "worker " + targets[i].name + ": " + err);
            continue;
        }
        workers.push_back(std::move(w));
    }
    log(LogLevel::INFO, "probing " + std::to_string(targets.size()) + " targets every " +
                            std::to_string(cfg.interval_ms) + " ms");

    Reactor reactor;
    if (!reactor.ok()) {
        channel->close();
        return 1;
    }
    bool running = true;
    if (sig_fd) {
        reactor.add_fd(sig_fd.get(), EPOLLIN, [&](uint32_t) {
            signalfd_siginfo si{};
            while (::read(sig_fd.get(), &si, sizeof(si)) == sizeof(si)) running = false;
        });
    }
    CommandReader commands;
    commands.attach(reactor, [&](char c) {
        if (c == 'q')
            running = false;
        else if (c == 'r')
            coord.reset_stats();
    });

    int ticks = 0;
    TimerScheduler ui;
    ui.start(reactor, kTickMs, [&]() {
        coord.process_updates();
        if (++ticks % kViewEveryTicks != 0) return;
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() - started);
        std::cout << "--- " << format_elapsed(elapsed) << " ---\n";
        for (size_t i = 0; i < coord.targets().size(); ++i)
            std::cout << view_line(coord.targets()[i], coord.stats()[i]) << "\n";
        std::cout.flush();
    });

    while (running) {
        if (reactor.loop_once(200) < 0) break;
    }
    ui.stop();

    channel->close();
    for (auto& w : workers) w->join();
    coord.process_updates();

    if (cfg.summary) {
        if (coord.write_summary_now())
            std::cout << "Session summary: " << copts.summary_path << "\n";
        else
            std::cerr << "Failed to write session summary\n";
    }
    if (store) {
        bool ok = store->finish();
        std::cout << "Raw log: " << store->path() << " (" << store->written() << " events)"
                  << (ok ? "" : " [write errors]") << "\n";
    }
    return 0;
}

int cmd_replay(const RunConfig& cfg) {
    ReplayEngine engine(cfg.speed);
    std::string err;
    if (!engine.load(cfg.replay_path, err)) {
        std::cerr << "Cannot replay: " << err << "\n";
        return 1;
    }
    std::vector<Target> targets;
    std::vector<TargetStats> stats;
    build_replay_targets(engine.events(), targets, stats);
    if (targets.empty()) {
        std::cerr << "Cannot replay: no valid targets in log\n";
        return 1;
    }

    Fd sig_fd(make_signal_fd());
    Reactor reactor;
    if (!reactor.ok()) return 1;
    bool running = true;
    if (sig_fd) {
        reactor.add_fd(sig_fd.get(), EPOLLIN, [&](uint32_t) {
            signalfd_siginfo si{};
            while (::read(sig_fd.get(), &si, sizeof(si)) == sizeof(si)) running = false;
        });
    }
    CommandReader commands;
    commands.attach(reactor, [&](char c) {
        switch (c) {
            case 'q': running = false; break;
            case 'p': engine.toggle_pause(); break;
            case '+': engine.speed_up(); break;
            case '-': engine.slow_down(); break;
            case 'f': engine.skip_forward(kReplaySkip); break;
            case 'b': engine.skip_backward(kReplaySkip); break;
            case 'r':
                for (auto& s : stats) s.reset();
                break;
            default: break;
        }
    });

    int ticks = 0;
    bool announced_end = false;
    TimerScheduler ui;
    ui.start(reactor, kTickMs, [&]() {
        for (const auto& ev : engine.poll()) apply_event(ev, targets, stats);
        bool show = ++ticks % kViewEveryTicks == 0;
        if (engine.finished() && !announced_end) show = true;
        if (!show) return;
        auto at = engine.current_timestamp();
        char head[160];
        std::snprintf(head, sizeof(head), "--- replay %5.1f%% %zu/%zu %.1fx %s %s ---",
                      engine.progress_pct(), engine.cursor(), engine.total_events(),
                      engine.speed(),
                      engine.finished() ? "finished" : (engine.paused() ? "paused" : "playing"),
                      at ? format_rfc3339(*at).c_str() : "-");
        std::cout << head << "\n";
        for (size_t i = 0; i < targets.size(); ++i)
            std::cout << view_line(targets[i], stats[i]) << "\n";
        std::cout.flush();
        if (engine.finished()) announced_end = true;
    });

    while (running) {
        if (reactor.loop_once(200) < 0) break;
        // Nothing more can change once the log is done and nobody can type.
        if (engine.finished() && announced_end && commands.eof()) break;
    }
    ui.stop();
    return 0;
}
}  // namespace

int main(int argc, char** argv) {
    RunConfig cfg;
    std::string err;
    if (!parse_args(argc, argv, cfg, err) || !validate(cfg, err)) {
        std::cerr << "nlm: " << err << "\n";
        print_usage();
        return 1;
    }
    set_log_level(cfg.log_level);
    if (!cfg.log_file.empty() && !set_log_file(cfg.log_file)) {
        std::cerr << "nlm: cannot open log file " << cfg.log_file << ": " << std::strerror(errno)
                  << "\n";
        return 1;
    }

    switch (cfg.mode) {
        case Mode::Help: print_usage(); return 0;
        case Mode::Doctor: return cmd_doctor();
        case Mode::ListLogs: return cmd_list(list_logs(cfg.data_dir), "logs");
        case Mode::ListSessions: return cmd_list(list_sessions(cfg.data_dir), "sessions");
        case Mode::Replay: return cmd_replay(cfg);
        case Mode::Run: return cmd_run(cfg);
    }
    return 1;
}
