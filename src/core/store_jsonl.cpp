#include "store_jsonl.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "../util/json_line.hpp"
#include "logger.hpp"

namespace nlm {
namespace {
bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 20) return false;
    for (char c : text)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    errno = 0;
    unsigned long long v = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

bool require_string(const JsonFields& f, const char* key, std::string& out, std::string& err) {
    auto it = f.find(key);
    if (it == f.end() || it->second.kind != JsonScalar::Kind::String) {
        err = std::string("missing or non-string field '") + key + "'";
        return false;
    }
    out = it->second.text;
    return true;
}

// One logical line; the last line may lack a newline. eof is set once the
// stream is exhausted.
bool read_line(gzFile gz, std::string& line, bool& eof, std::string& err) {
    line.clear();
    char buf[4096];
    while (true) {
        if (!::gzgets(gz, buf, sizeof(buf))) {
            int errnum = Z_OK;
            const char* msg = ::gzerror(gz, &errnum);
            if (errnum != Z_OK && errnum != Z_STREAM_END) {
                err = std::string("compressed stream error: ") + (msg ? msg : "unknown");
                return false;
            }
            eof = true;
            return true;
        }
        line += buf;
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
    }
}

bool blank(const std::string& s) {
    for (char c : s)
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    return true;
}
}  // namespace

std::string encode_event(const PersistedEvent& ev) {
    std::string out = "{";
    out += "\"timestamp\":\"" + format_rfc3339(ev.timestamp) + "\",";
    out += "\"target_idx\":" + std::to_string(ev.target_idx) + ",";
    out += "\"target_name\":\"" + json_escape(ev.target_name) + "\",";
    out += "\"target_addr\":\"" + json_escape(ev.target_addr) + "\",";
    out += "\"latency_us\":";
    out += ev.latency_us ? std::to_string(*ev.latency_us) : "null";
    out += "}";
    return out;
}

bool decode_event(const std::string& line, PersistedEvent& ev, std::string& err) {
    JsonFields f;
    if (!parse_flat_object(line, f, err)) return false;

    std::string ts;
    if (!require_string(f, "timestamp", ts, err)) return false;
    if (!parse_rfc3339(ts, ev.timestamp)) {
        err = "invalid timestamp '" + ts + "'";
        return false;
    }
    auto idx = f.find("target_idx");
    if (idx == f.end() || idx->second.kind != JsonScalar::Kind::Number ||
        !parse_u64(idx->second.text, ev.target_idx)) {
        err = "missing or invalid field 'target_idx'";
        return false;
    }
    if (!require_string(f, "target_name", ev.target_name, err)) return false;
    if (!require_string(f, "target_addr", ev.target_addr, err)) return false;

    ev.latency_us.reset();
    auto lat = f.find("latency_us");
    if (lat != f.end() && lat->second.kind != JsonScalar::Kind::Null) {
        uint64_t us = 0;
        if (lat->second.kind != JsonScalar::Kind::Number || !parse_u64(lat->second.text, us) ||
            us > kMaxLatencyUs) {
            err = "invalid field 'latency_us'";
            return false;
        }
        ev.latency_us = us;
    }
    return true;
}

JsonlStore::JsonlStore(const std::string& path) : path_(path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        log(LogLevel::ERROR,
            "JsonlStore failed to open output file: " + path + ": " + std::strerror(errno));
        return;
    }
    gz_ = ::gzdopen(fd, "wb");
    if (!gz_) {
        ::close(fd);
        log(LogLevel::ERROR, "JsonlStore failed to start gzip stream: " + path);
    }
}

JsonlStore::~JsonlStore() {
    finish();
}

bool JsonlStore::write_line(const std::string& line) {
    if (!gz_) return false;
    std::string buf = line + "\n";
    int n = ::gzwrite(gz_, buf.data(), static_cast<unsigned>(buf.size()));
    if (n <= 0 || static_cast<size_t>(n) != buf.size()) {
        int errnum = Z_OK;
        const char* msg = ::gzerror(gz_, &errnum);
        log(LogLevel::ERROR, "JsonlStore write failed: " + std::string(msg ? msg : "unknown"));
        return false;
    }
    return true;
}

void JsonlStore::on_event(const PersistedEvent& ev) {
    if (!write_line(encode_event(ev))) return;
    ++written_;
    if (written_ % kFlushEvery == 0) flush();
}

bool JsonlStore::flush() {
    if (!gz_) return false;
    if (::gzflush(gz_, Z_SYNC_FLUSH) != Z_OK) {
        log(LogLevel::ERROR, "JsonlStore flush failed: " + path_);
        return false;
    }
    return true;
}

bool JsonlStore::finish() {
    if (!gz_) return true;
    int rc = ::gzclose(gz_);
    gz_ = nullptr;
    if (rc != Z_OK) {
        log(LogLevel::ERROR, "JsonlStore close failed: " + path_);
        return false;
    }
    return true;
}

bool load_events(const std::string& path, std::vector<PersistedEvent>& out, std::string& err,
                 size_t max_events) {
    out.clear();
    gzFile gz = ::gzopen(path.c_str(), "rb");
    if (!gz) {
        err = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }
    std::string line;
    size_t line_no = 0;
    bool eof = false;
    bool ok = true;
    while (!eof) {
        std::string read_err;
        if (!read_line(gz, line, eof, read_err)) {
            err = path + ": " + read_err + " after line " + std::to_string(line_no);
            ok = false;
            break;
        }
        if (eof && line.empty()) break;
        ++line_no;
        if (blank(line)) continue;
        if (out.size() >= max_events) {
            log(LogLevel::WARN, "log truncated at " + std::to_string(max_events) +
                                    " events to bound memory: " + path);
            break;
        }
        PersistedEvent ev;
        std::string parse_err;
        if (!decode_event(line, ev, parse_err)) {
            err = path + ":" + std::to_string(line_no) + ": " + parse_err;
            ok = false;
            break;
        }
        out.push_back(std::move(ev));
    }
    ::gzclose(gz);
    if (!ok) out.clear();
    return ok;
}
}  // namespace nlm
