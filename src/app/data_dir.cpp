#include "data_dir.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "../core/logger.hpp"

namespace fs = std::filesystem;

namespace nlm {
namespace {
struct Entry {
    DataFile file;
    fs::file_time_type mtime;
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

bool ensure_data_dirs(const std::string& data_dir, std::string& err) {
    for (const char* sub : {"logs", "sessions"}) {
        std::error_code ec;
        fs::path p = fs::path(data_dir) / sub;
        fs::create_directories(p, ec);
        if (ec) {
            err = p.string() + ": " + ec.message();
            log(LogLevel::ERROR, "data dir: " + err);
            return false;
        }
    }
    return true;
}

std::string log_path_for(const std::string& data_dir, WallTime started) {
    return (fs::path(data_dir) / "logs" / (file_stamp(started) + ".jsonl.gz")).string();
}

std::string session_path_for(const std::string& data_dir, WallTime started) {
    return (fs::path(data_dir) / "sessions" / (file_stamp(started) + ".json.gz")).string();
}

std::vector<DataFile> list_data_files(const std::string& dir, const std::string& suffix) {
    std::vector<Entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return {};
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& de = *it;
        std::error_code fec;
        if (!de.is_regular_file(fec)) continue;
        std::string name = de.path().filename().string();
        if (!ends_with(name, suffix)) continue;
        Entry e;
        e.file.path = de.path().string();
        e.file.name = name;
        e.file.size = static_cast<uint64_t>(de.file_size(fec));
        e.mtime = de.last_write_time(fec);
        entries.push_back(std::move(e));
    }
    // Names are UTC stamps, so name order breaks mtime ties chronologically.
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.mtime != b.mtime) return a.mtime > b.mtime;
        return a.file.name > b.file.name;
    });
    std::vector<DataFile> out;
    out.reserve(entries.size());
    for (auto& e : entries) out.push_back(std::move(e.file));
    return out;
}

std::vector<DataFile> list_logs(const std::string& data_dir) {
    return list_data_files((fs::path(data_dir) / "logs").string(), ".jsonl.gz");
}

std::vector<DataFile> list_sessions(const std::string& data_dir) {
    return list_data_files((fs::path(data_dir) / "sessions").string(), ".json.gz");
}
}  // namespace nlm
