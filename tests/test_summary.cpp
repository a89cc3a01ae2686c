#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include "../src/core/logger.hpp"
#include "../src/report/summary_writer.hpp"

using namespace nlm;

namespace {
std::string read_gz(const std::string& path) {
    std::string out;
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) return out;
    char buf[4096];
    int n;
    while ((n = gzread(gz, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
    gzclose(gz);
    return out;
}

bool has(const std::string& doc, const std::string& needle) {
    return doc.find(needle) != std::string::npos;
}
}  // namespace

int main() {
    set_log_level(LogLevel::ERROR);
    std::vector<Target> targets(2);
    targets[0].name = "Cloud \"one\"";
    IpAddress::parse("1.1.1.1", targets[0].addr);
    targets[1].name = "silent";
    IpAddress::parse("192.0.2.1", targets[1].addr);

    std::vector<TargetStats> stats(2);
    for (int i = 0; i < 8; ++i) stats[0].record(ProbeOutcome::success(std::chrono::milliseconds(10)));
    stats[0].record(ProbeOutcome::timeout());
    stats[0].record(ProbeOutcome::timeout());
    stats[1].record(ProbeOutcome::timeout());

    WallTime started, ended;
    parse_rfc3339("2024-05-01T12:00:00Z", started);
    parse_rfc3339("2024-05-01T12:01:30.5Z", ended);

    std::string doc = render_summary(targets, stats, started, ended);
    assert(has(doc, "\"started\": \"2024-05-01T12:00:00.000000Z\""));
    assert(has(doc, "\"ended\": \"2024-05-01T12:01:30.500000Z\""));
    assert(has(doc, "\"duration_secs\": 90,"));
    assert(has(doc, "\"name\": \"Cloud \\\"one\\\"\""));
    assert(has(doc, "\"sent\": 10,"));
    assert(has(doc, "\"received\": 8,"));
    assert(has(doc, "\"loss_pct\": 20.0,"));
    assert(has(doc, "\"min\": 10.0,"));
    assert(has(doc, "\"avg\": 10.0,"));
    assert(has(doc, "\"p50\": 10.0,"));
    assert(has(doc, "\"max\": 10.0\n"));
    assert(has(doc, "\"jitter_ms\": 0.0,"));
    assert(has(doc, "\"quality_grade\": \""));
    // The silent target has nothing defined but its counters.
    assert(has(doc, "\"addr\": \"192.0.2.1\""));
    assert(has(doc, "\"loss_pct\": 100.0,"));
    assert(has(doc, "\"min\": null,"));
    assert(has(doc, "\"jitter_ms\": null,"));
    assert(has(doc, "\"mos\": null,"));
    assert(has(doc, "\"quality_grade\": null\n"));

    std::string empty = render_summary({}, stats, started, ended);
    assert(has(empty, "\"targets\": []"));

    std::string path = "/tmp/nlm_test_summary_" + std::to_string(::getpid()) + ".json.gz";
    std::string err;
    assert(write_summary(path, targets, stats, started, ended, err));
    struct stat st {};
    assert(::stat(path.c_str(), &st) == 0 && (st.st_mode & 0777) == 0600);
    assert(read_gz(path) == doc);
    // A second snapshot replaces the first.
    stats[1].record(ProbeOutcome::success(std::chrono::milliseconds(3)));
    assert(write_summary(path, targets, stats, started, ended, err));
    assert(has(read_gz(path), "\"received\": 1,"));
    std::remove(path.c_str());

    assert(!write_summary("/nonexistent-dir/x.json.gz", targets, stats, started, ended, err));
    assert(!err.empty());
    return 0;
}
