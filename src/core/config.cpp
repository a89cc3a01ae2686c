#include "config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace nlm {
namespace {
bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || v < 0 || v > 86400000L) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}
}  // namespace

std::string default_data_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return "./.nlm";
    return std::string(home) + "/.nlm";
}

bool parse_args(int argc, char** argv, RunConfig& cfg, std::string& err) {
    if (const char* env = std::getenv("NLM_LOG_LEVEL")) {
        LogLevel lvl;
        if (parse_log_level(env, lvl)) cfg.log_level = lvl;
    }

    int i = 1;
    if (i < argc) {
        std::string cmd = argv[i];
        if (cmd == "run") {
            cfg.mode = Mode::Run;
            ++i;
        } else if (cmd == "replay") {
            cfg.mode = Mode::Replay;
            ++i;
            if (i >= argc || argv[i][0] == '-') {
                err = "replay requires a log path";
                return false;
            }
            cfg.replay_path = argv[i++];
        } else if (cmd == "list-logs") {
            cfg.mode = Mode::ListLogs;
            ++i;
        } else if (cmd == "list-sessions") {
            cfg.mode = Mode::ListSessions;
            ++i;
        } else if (cmd == "doctor") {
            cfg.mode = Mode::Doctor;
            ++i;
        } else if (cmd == "help") {
            cfg.mode = Mode::Help;
            ++i;
        }
    }

    for (; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                err = a + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;
        if (a == "-h" || a == "--help") {
            cfg.mode = Mode::Help;
        } else if (a == "-t" || a == "--target") {
            if (!value(v)) return false;
            cfg.targets.push_back(v);
        } else if (a == "-i" || a == "--interval") {
            if (!value(v)) return false;
            if (!parse_int(v, cfg.interval_ms)) {
                err = "invalid interval '" + v + "'";
                return false;
            }
        } else if (a == "--no-defaults") {
            cfg.use_defaults = false;
        } else if (a == "-l" || a == "--log-raw") {
            cfg.log_raw = true;
        } else if (a == "-s" || a == "--summary") {
            cfg.summary = true;
        } else if (a == "--speed") {
            if (!value(v)) return false;
            if (!parse_double(v, cfg.speed)) {
                err = "invalid speed '" + v + "'";
                return false;
            }
        } else if (a == "--data-dir") {
            if (!value(cfg.data_dir)) return false;
        } else if (a == "--log-file") {
            if (!value(cfg.log_file)) return false;
        } else if (a == "--log-level") {
            if (!value(v)) return false;
            if (!parse_log_level(v, cfg.log_level)) {
                err = "invalid log level '" + v + "'";
                return false;
            }
        } else {
            err = "unknown argument '" + a + "'";
            return false;
        }
    }
    if (cfg.data_dir.empty()) cfg.data_dir = default_data_dir();
    return true;
}

bool validate(const RunConfig& cfg, std::string& err) {
    if (cfg.mode == Mode::Run) {
        if (cfg.interval_ms < kMinIntervalMs) {
            err = "interval must be at least " + std::to_string(kMinIntervalMs) + " ms";
            return false;
        }
        if (!cfg.use_defaults && cfg.targets.empty()) {
            err = "no targets: pass --target or drop --no-defaults";
            return false;
        }
    }
    if (cfg.mode == Mode::Replay && !(cfg.speed > 0.0)) {
        err = "speed must be positive";
        return false;
    }
    return true;
}
}  // namespace nlm
