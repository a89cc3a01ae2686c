#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace nlm {
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

inline bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug" || s == "DEBUG") {
        out = LogLevel::DEBUG;
    } else if (s == "info" || s == "INFO") {
        out = LogLevel::INFO;
    } else if (s == "warn" || s == "WARN") {
        out = LogLevel::WARN;
    } else if (s == "error" || s == "ERROR") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

namespace detail {
struct LogState {
    std::mutex mu;
    LogLevel min_level{LogLevel::INFO};
    std::FILE* file{nullptr};
    ~LogState() {
        if (file) std::fclose(file);
    }
};

inline LogState& log_state() {
    static LogState state;
    return state;
}
}  // namespace detail

inline void set_log_level(LogLevel lvl) {
    auto& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mu);
    st.min_level = lvl;
}

// Redirects log output to `path` (append). An empty path restores stderr.
inline bool set_log_file(const std::string& path) {
    auto& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mu);
    if (st.file) {
        std::fclose(st.file);
        st.file = nullptr;
    }
    if (path.empty()) return true;
    st.file = std::fopen(path.c_str(), "a");
    return st.file != nullptr;
}

inline void log(LogLevel lvl, const std::string& msg) {
    auto& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mu);
    if (lvl < st.min_level) return;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    char buf[32];
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    std::FILE* out = st.file ? st.file : stderr;
    std::fprintf(out, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
    if (st.file) std::fflush(st.file);
}
}  // namespace nlm
