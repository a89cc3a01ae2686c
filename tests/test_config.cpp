#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>

#include "../src/core/config.hpp"

using namespace nlm;

namespace {
bool parse(std::vector<std::string> args, RunConfig& cfg, std::string& err) {
    args.insert(args.begin(), "nlm");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    cfg = RunConfig{};
    return parse_args(static_cast<int>(argv.size()), argv.data(), cfg, err);
}
}  // namespace

int main() {
    ::unsetenv("NLM_LOG_LEVEL");
    ::setenv("HOME", "/home/tester", 1);
    RunConfig cfg;
    std::string err;

    assert(parse({}, cfg, err));
    assert(cfg.mode == Mode::Run);
    assert(cfg.interval_ms == 1000 && cfg.use_defaults && !cfg.log_raw && !cfg.summary);
    assert(cfg.data_dir == "/home/tester/.nlm");
    assert(validate(cfg, err));

    assert(parse({"run", "-t", "example.com", "--target", "10.0.0.1", "-i", "250", "-l", "-s",
                  "--no-defaults", "--data-dir", "/tmp/x", "--log-level", "debug"},
                 cfg, err));
    assert(cfg.targets.size() == 2 && cfg.targets[1] == "10.0.0.1");
    assert(cfg.interval_ms == 250 && cfg.log_raw && cfg.summary && !cfg.use_defaults);
    assert(cfg.data_dir == "/tmp/x");
    assert(cfg.log_level == LogLevel::DEBUG);
    assert(validate(cfg, err));

    assert(parse({"replay", "/tmp/a.jsonl.gz", "--speed", "4"}, cfg, err));
    assert(cfg.mode == Mode::Replay && cfg.replay_path == "/tmp/a.jsonl.gz" && cfg.speed == 4.0);
    assert(!parse({"replay"}, cfg, err));

    assert(parse({"list-logs"}, cfg, err) && cfg.mode == Mode::ListLogs);
    assert(parse({"list-sessions"}, cfg, err) && cfg.mode == Mode::ListSessions);
    assert(parse({"doctor"}, cfg, err) && cfg.mode == Mode::Doctor);
    assert(parse({"--help"}, cfg, err) && cfg.mode == Mode::Help);

    assert(!parse({"-i", "abc"}, cfg, err));
    assert(!parse({"-i"}, cfg, err));
    assert(!parse({"--bogus"}, cfg, err));
    assert(!parse({"--log-level", "loud"}, cfg, err));

    assert(parse({"-i", "5"}, cfg, err));
    assert(!validate(cfg, err));
    assert(parse({"--no-defaults"}, cfg, err));
    assert(!validate(cfg, err));

    ::setenv("NLM_LOG_LEVEL", "warn", 1);
    assert(parse({}, cfg, err) && cfg.log_level == LogLevel::WARN);
    assert(parse({"--log-level", "error"}, cfg, err) && cfg.log_level == LogLevel::ERROR);

    ::unsetenv("HOME");
    assert(default_data_dir() == "./.nlm");
    return 0;
}
