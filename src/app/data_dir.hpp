#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "../core/time_utils.hpp"

namespace nlm {
struct DataFile {
    std::string path;
    std::string name;
    uint64_t size{0};
};

// <data_dir>/logs and <data_dir>/sessions, created on demand.
bool ensure_data_dirs(const std::string& data_dir, std::string& err);
std::string log_path_for(const std::string& data_dir, WallTime started);
std::string session_path_for(const std::string& data_dir, WallTime started);

// Regular files in `dir` ending with `suffix`, most recent first. A missing
// directory is an empty listing.
std::vector<DataFile> list_data_files(const std::string& dir, const std::string& suffix);
std::vector<DataFile> list_logs(const std::string& data_dir);
std::vector<DataFile> list_sessions(const std::string& data_dir);
}  // namespace nlm
