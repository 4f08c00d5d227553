#pragma once

#include "records.h"

namespace memscope::api {

using namespace tracking_api;

/**
 * Summarize the allocations still active in a snapshot.
 *
 * Anything live at the end of profiling is counted as a leak candidate. The
 * object may well still be in legitimate use, so callers should present the
 * result as "active at end of profiling" rather than as proven leaks.
 */
LeakSummary
analyzeLeaks(const MemorySnapshot& snapshot);

}  // namespace memscope::api
