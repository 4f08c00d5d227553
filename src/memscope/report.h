#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "records.h"

namespace memscope::report {

using tracking_api::MemorySnapshot;
using tracking_api::ProfileSession;

// "1023 B", "1.50 KB", "2.00 MB", ...
std::string
formatBytes(size_t bytes);

std::string
formatDuration(std::chrono::milliseconds duration);

// Console report: session header, statistics table, active-at-exit analysis
// and the `top_allocations` largest active allocations.
void
printSummary(const ProfileSession& session, std::ostream& out, size_t top_allocations = 10);

void
printLiveStats(const MemorySnapshot& snapshot, std::ostream& out);

std::string
renderMarkdown(const ProfileSession& session);

}  // namespace memscope::report
