#pragma once
#include <string>
#include <vector>

#include "logger.hpp"

namespace nlm {
constexpr int kDefaultIntervalMs = 1000;
constexpr int kMinIntervalMs = 10;
constexpr double kMinSpeed = 0.1;
constexpr double kMaxSpeed = 100.0;

enum class Mode { Run, Replay, ListLogs, ListSessions, Doctor, Help };

struct RunConfig {
    Mode mode{Mode::Run};
    std::vector<std::string> targets;  // as given, resolved at startup
    int interval_ms{kDefaultIntervalMs};
    bool use_defaults{true};
    bool log_raw{false};
    bool summary{false};
    std::string replay_path;
    double speed{1.0};
    std::string data_dir;  // empty: default_data_dir()
    LogLevel log_level{LogLevel::INFO};
    std::string log_file;
};

// $HOME/.nlm, or ./.nlm when HOME is unset.
std::string default_data_dir();

// Parses argv (argv[0] skipped). The NLM_LOG_LEVEL environment variable
// seeds the log level; --log-level overrides it.
bool parse_args(int argc, char** argv, RunConfig& cfg, std::string& err);

// Range checks that parse_args cannot do per flag.
bool validate(const RunConfig& cfg, std::string& err);
}  // namespace nlm
