#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace memscope::tracking_api {

extern const char MAGIC[9];  // Value assigned in records.cpp
const int CURRENT_RECORD_VERSION = 1;

using thread_id_t = unsigned long;
using address_t = uintptr_t;
using wall_clock_t = std::chrono::system_clock;
using monotonic_clock_t = std::chrono::steady_clock;

struct AllocationRecord
{
    size_t size{0};
    wall_clock_t::time_point timestamp{};
    std::vector<std::string> call_stack{};
    thread_id_t thread_id{0};

    bool operator==(const AllocationRecord& rhs) const;
};

using ledger_t = std::unordered_map<address_t, AllocationRecord>;

struct MemorySnapshot
{
    size_t total_allocated{0};
    size_t total_freed{0};
    size_t current_usage{0};
    size_t peak_usage{0};
    uint64_t allocation_count{0};
    uint64_t free_count{0};
    ledger_t active_allocations{};

    bool operator==(const MemorySnapshot& rhs) const;
};

// The counters a ProcessInspector can read from the outside in one go.
struct MemoryReading
{
    size_t current_usage{0};
    size_t peak_usage{0};
    size_t total_allocated{0};
    size_t total_freed{0};

    MemorySnapshot toSnapshot() const;
};

struct LeakSummary
{
    size_t total_leaked_bytes{0};
    size_t leak_count{0};
    std::optional<size_t> largest_leak{};
    // (size, count) pairs, largest size first.
    std::vector<std::pair<size_t, size_t>> leaks_by_size{};

    bool operator==(const LeakSummary& rhs) const;
};

enum class StopReason : unsigned char {
    PROCESS_ENDED,
    TIMEOUT_EXCEEDED,
    USER_CANCELLED,
};

const char*
stopReasonName(StopReason reason);

struct ProfileSession
{
    pid_t process_id{-1};
    std::string command;
    wall_clock_t::time_point start_time{};
    wall_clock_t::time_point end_time{};
    std::chrono::milliseconds duration{0};
    MemorySnapshot final_snapshot{};
    LeakSummary leak_summary{};

    StopReason stop_reason{StopReason::PROCESS_ENDED};
    std::optional<int> exit_status{};
    size_t samples_taken{0};
    size_t samples_skipped{0};
    std::chrono::milliseconds interval{0};
    std::chrono::milliseconds max_duration{0};
};

}  // namespace memscope::tracking_api
