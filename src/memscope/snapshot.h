#pragma once

#include <chrono>
#include <optional>
#include <utility>
#include <vector>

#include "records.h"

namespace memscope::api {

using namespace tracking_api;

using ledger_entries_t = std::vector<std::pair<address_t, AllocationRecord>>;

/**
 * Running aggregate of one profiling session.
 *
 * The tracker owns a single MemorySnapshot and is fed from one of two
 * sources: coarse-grained readings of the target process (replaceSnapshot)
 * or explicit allocate/free events (addAllocation/removeAllocation). The
 * peak is kept separately so that it never decreases across either path.
 *
 * The tracker does no locking. Producers on several threads must go
 * through tracking_api::AllocationTracker.
 */
class StatsTracker
{
  public:
    StatsTracker() = default;

    void replaceSnapshot(MemorySnapshot snapshot);
    void addAllocation(address_t address, AllocationRecord record);
    std::optional<AllocationRecord> removeAllocation(address_t address);

    MemorySnapshot snapshot() const;
    MemorySnapshot finalSnapshot();

    const AllocationRecord* allocationInfo(address_t address) const;
    ledger_entries_t queryByMinSize(size_t min_size) const;
    ledger_entries_t
    queryByMinAge(std::chrono::nanoseconds min_age, wall_clock_t::time_point now) const;

    void clear();

    bool isFinished() const noexcept
    {
        return d_finished;
    }

    size_t peakUsage() const noexcept
    {
        return d_peak_usage;
    }

  private:
    StatsTracker(const StatsTracker&) = delete;
    StatsTracker& operator=(const StatsTracker&) = delete;

    bool acceptsUpdates(const char* operation) const;
    void updatePeak() noexcept;

    MemorySnapshot d_current{};
    size_t d_peak_usage{0};
    bool d_finished{false};
};

}  // namespace memscope::api
