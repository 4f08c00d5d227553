#include "snapshot.h"

#include <algorithm>

#include "logging.h"

namespace memscope::api {

bool
StatsTracker::acceptsUpdates(const char* operation) const
{
    if (d_finished) {
        LOG(DEBUG) << "Ignoring " << operation << " on a finished tracker";
        return false;
    }
    return true;
}

void
StatsTracker::updatePeak() noexcept
{
    d_peak_usage = std::max(d_peak_usage, d_current.current_usage);
    d_current.peak_usage = d_peak_usage;
}

void
StatsTracker::replaceSnapshot(MemorySnapshot snapshot)
{
    if (!acceptsUpdates("replaceSnapshot")) {
        return;
    }
    // The source's own peak is ignored. The session peak is the highest
    // current usage observed so far.
    d_current = std::move(snapshot);
    updatePeak();
}

void
StatsTracker::addAllocation(address_t address, AllocationRecord record)
{
    if (!acceptsUpdates("addAllocation")) {
        return;
    }
    d_current.total_allocated += record.size;
    d_current.current_usage += record.size;
    d_current.allocation_count += 1;
    d_current.active_allocations[address] = std::move(record);
    updatePeak();
}

std::optional<AllocationRecord>
StatsTracker::removeAllocation(address_t address)
{
    if (!acceptsUpdates("removeAllocation")) {
        return std::nullopt;
    }

    auto it = d_current.active_allocations.find(address);
    if (it == d_current.active_allocations.end()) {
        // Late or duplicate free.
        return std::nullopt;
    }

    AllocationRecord record = std::move(it->second);
    d_current.active_allocations.erase(it);

    d_current.total_freed += record.size;
    d_current.free_count += 1;
    if (record.size > d_current.current_usage) {
        d_current.current_usage = 0;
    } else {
        d_current.current_usage -= record.size;
    }
    return record;
}

MemorySnapshot
StatsTracker::snapshot() const
{
    return d_current;
}

MemorySnapshot
StatsTracker::finalSnapshot()
{
    MemorySnapshot result = std::move(d_current);
    result.peak_usage = d_peak_usage;
    d_current = MemorySnapshot{};
    d_finished = true;
    return result;
}

const AllocationRecord*
StatsTracker::allocationInfo(address_t address) const
{
    auto it = d_current.active_allocations.find(address);
    if (it == d_current.active_allocations.end()) {
        return nullptr;
    }
    return &it->second;
}

ledger_entries_t
StatsTracker::queryByMinSize(size_t min_size) const
{
    ledger_entries_t result;
    for (const auto& [address, record] : d_current.active_allocations) {
        if (record.size >= min_size) {
            result.emplace_back(address, record);
        }
    }
    return result;
}

ledger_entries_t
StatsTracker::queryByMinAge(std::chrono::nanoseconds min_age, wall_clock_t::time_point now) const
{
    ledger_entries_t result;
    for (const auto& [address, record] : d_current.active_allocations) {
        if (now - record.timestamp >= min_age) {
            result.emplace_back(address, record);
        }
    }
    return result;
}

void
StatsTracker::clear()
{
    d_current = MemorySnapshot{};
    d_peak_usage = 0;
    d_finished = false;
}

}  // namespace memscope::api
