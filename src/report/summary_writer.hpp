#pragma once
#include <string>
#include <vector>

#include "../core/target.hpp"
#include "../core/time_utils.hpp"
#include "../stats/target_stats.hpp"

namespace nlm {
// Renders the session summary document. Undefined metrics become null.
// Stats are taken non-const because the all-time percentiles flush the
// pending digest batch.
std::string render_summary(const std::vector<Target>& targets, std::vector<TargetStats>& stats,
                           WallTime started, WallTime ended);

// Writes the summary gzip-compressed to `path` (mode 0600), replacing any
// previous snapshot.
bool write_summary(const std::string& path, const std::vector<Target>& targets,
                   std::vector<TargetStats>& stats, WallTime started, WallTime ended,
                   std::string& err);
}  // namespace nlm
