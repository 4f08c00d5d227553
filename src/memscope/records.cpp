#include "records.h"

namespace memscope::tracking_api {

const char MAGIC[9] = "memscope";

bool
AllocationRecord::operator==(const AllocationRecord& rhs) const
{
    return size == rhs.size && timestamp == rhs.timestamp && call_stack == rhs.call_stack
           && thread_id == rhs.thread_id;
}

bool
MemorySnapshot::operator==(const MemorySnapshot& rhs) const
{
    return total_allocated == rhs.total_allocated && total_freed == rhs.total_freed
           && current_usage == rhs.current_usage && peak_usage == rhs.peak_usage
           && allocation_count == rhs.allocation_count && free_count == rhs.free_count
           && active_allocations == rhs.active_allocations;
}

MemorySnapshot
MemoryReading::toSnapshot() const
{
    MemorySnapshot snapshot;
    snapshot.total_allocated = total_allocated;
    snapshot.total_freed = total_freed;
    snapshot.current_usage = current_usage;
    snapshot.peak_usage = peak_usage;
    return snapshot;
}

bool
LeakSummary::operator==(const LeakSummary& rhs) const
{
    return total_leaked_bytes == rhs.total_leaked_bytes && leak_count == rhs.leak_count
           && largest_leak == rhs.largest_leak && leaks_by_size == rhs.leaks_by_size;
}

const char*
stopReasonName(StopReason reason)
{
    switch (reason) {
        case StopReason::PROCESS_ENDED:
            return "ProcessEnded";
        case StopReason::TIMEOUT_EXCEEDED:
            return "TimeoutExceeded";
        case StopReason::USER_CANCELLED:
            return "UserCancelled";
    }
    return "Unknown";
}

}  // namespace memscope::tracking_api
