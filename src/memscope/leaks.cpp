#include "leaks.h"

#include <functional>
#include <map>

namespace memscope::api {

LeakSummary
analyzeLeaks(const MemorySnapshot& snapshot)
{
    LeakSummary summary;
    summary.total_leaked_bytes = snapshot.current_usage;
    summary.leak_count = snapshot.active_allocations.size();

    std::map<size_t, size_t, std::greater<size_t>> count_by_size;
    for (const auto& it : snapshot.active_allocations) {
        const size_t size = it.second.size;
        count_by_size[size] += 1;
        if (!summary.largest_leak || size > *summary.largest_leak) {
            summary.largest_leak = size;
        }
    }

    summary.leaks_by_size.assign(count_by_size.begin(), count_by_size.end());
    return summary;
}

}  // namespace memscope::api
