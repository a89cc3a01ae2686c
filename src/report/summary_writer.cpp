#include "summary_writer.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

#include "../core/logger.hpp"
#include "../util/json_line.hpp"

namespace nlm {
namespace {
std::string ms_or_null(const std::optional<Latency>& d) {
    return d ? json_double(to_ms(*d)) : "null";
}

std::string num_or_null(const std::optional<double>& v) {
    return v ? json_double(*v) : "null";
}
}  // namespace

std::string render_summary(const std::vector<Target>& targets, std::vector<TargetStats>& stats,
                           WallTime started, WallTime ended) {
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(ended - started).count();
    if (duration < 0) duration = 0;

    std::ostringstream out;
    out << "{\n";
    out << "  \"started\": \"" << format_rfc3339(started) << "\",\n";
    out << "  \"ended\": \"" << format_rfc3339(ended) << "\",\n";
    out << "  \"duration_secs\": " << duration << ",\n";
    out << "  \"targets\": [";
    size_t n = std::min(targets.size(), stats.size());
    for (size_t i = 0; i < n; ++i) {
        const Target& t = targets[i];
        TargetStats& s = stats[i];
        AllTimeStats& all = s.all_time();
        auto jitter = s.jitter();
        auto grade = s.quality_grade();

        out << (i == 0 ? "\n" : ",\n");
        out << "    {\n";
        out << "      \"name\": \"" << json_escape(t.name) << "\",\n";
        out << "      \"addr\": \"" << json_escape(t.addr_string()) << "\",\n";
        out << "      \"sent\": " << s.sent() << ",\n";
        out << "      \"received\": " << s.received() << ",\n";
        out << "      \"loss_pct\": " << json_double(s.packet_loss()) << ",\n";
        out << "      \"latency_ms\": {\n";
        out << "        \"min\": " << ms_or_null(all.min()) << ",\n";
        out << "        \"avg\": " << ms_or_null(all.average()) << ",\n";
        out << "        \"p50\": " << ms_or_null(all.p50()) << ",\n";
        out << "        \"p95\": " << ms_or_null(all.p95()) << ",\n";
        out << "        \"max\": " << ms_or_null(all.max()) << "\n";
        out << "      },\n";
        out << "      \"jitter_ms\": " << ms_or_null(jitter) << ",\n";
        out << "      \"mos\": " << num_or_null(s.mos_score()) << ",\n";
        out << "      \"quality_grade\": "
            << (grade ? std::string("\"") + grade_letter(*grade) + "\"" : std::string("null"))
            << "\n";
        out << "    }";
    }
    out << (n == 0 ? "]\n" : "\n  ]\n");
    out << "}\n";
    return out.str();
}

bool write_summary(const std::string& path, const std::vector<Target>& targets,
                   std::vector<TargetStats>& stats, WallTime started, WallTime ended,
                   std::string& err) {
    std::string doc = render_summary(targets, stats, started, ended);

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        err = path + ": " + std::strerror(errno);
        log(LogLevel::ERROR, "summary: " + err);
        return false;
    }
    gzFile gz = ::gzdopen(fd, "wb");
    if (!gz) {
        ::close(fd);
        err = path + ": cannot start gzip stream";
        log(LogLevel::ERROR, "summary: " + err);
        return false;
    }
    int wrote = ::gzwrite(gz, doc.data(), static_cast<unsigned>(doc.size()));
    int closed = ::gzclose(gz);
    if (wrote != static_cast<int>(doc.size()) || closed != Z_OK) {
        err = path + ": gzip write failed";
        log(LogLevel::ERROR, "summary: " + err);
        return false;
    }
    log(LogLevel::DEBUG, "summary written to " + path);
    return true;
}
}  // namespace nlm
