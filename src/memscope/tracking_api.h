#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "events.h"
#include "leaks.h"
#include "process.h"
#include "records.h"
#include "snapshot.h"

namespace memscope::tracking_api {

struct RecursionGuard
{
    RecursionGuard()
    : wasLocked(isActive)
    {
        isActive = true;
    }

    ~RecursionGuard()
    {
        isActive = wasLocked;
    }

    const bool wasLocked;
    static thread_local bool isActive;
};

class NativeTrace
{
  public:
    // Symbolized frames of the calling thread, innermost first, skipping the
    // first `skip` frames above the caller.
    static std::vector<std::string> capture(size_t skip, size_t max_frames);
};

/**
 * Entry point for instrumented allocation producers.
 *
 * Allocation hooks may fire on any thread, so every update of the underlying
 * StatsTracker is serialized through one mutex. Calls made while a record is
 * being built on the same thread (the bookkeeping itself allocates) are
 * ignored through the RecursionGuard.
 */
class AllocationTracker
{
  public:
    explicit AllocationTracker(api::StatsTracker& tracker, bool native_traces = true, size_t max_frames = 16);

    AllocationTracker(AllocationTracker& other) = delete;
    AllocationTracker(AllocationTracker&& other) = delete;
    void operator=(const AllocationTracker&) = delete;
    void operator=(AllocationTracker&&) = delete;

    void trackAllocation(const void* ptr, size_t size);
    std::optional<AllocationRecord> trackDeallocation(const void* ptr);

    bool isActive() const;
    void activate();
    void deactivate();

    MemorySnapshot snapshot() const;

  private:
    api::StatsTracker& d_tracker;
    mutable std::mutex d_mutex;
    std::atomic<bool> d_active{true};
    const bool d_native_traces;
    const size_t d_max_frames;
};

enum class SchedulerState : unsigned char {
    RUNNING,
    STOPPING,
    STOPPED,
};

using live_callback_t = std::function<void(const MemorySnapshot&)>;

// Upper bound for both the sampling interval and the session duration.
constexpr std::chrono::hours MAX_SAMPLING_DURATION{24 * 365};

// How long a terminated child is given to be reaped before its exit status
// is given up on.
constexpr std::chrono::milliseconds CHILD_EXIT_GRACE{2000};

struct SamplingOptions
{
    std::chrono::milliseconds interval{1000};
    std::chrono::milliseconds max_duration{60000};
    live_callback_t live_callback{};
};

struct SamplingResult
{
    StopReason stop_reason{StopReason::PROCESS_ENDED};
    wall_clock_t::time_point start_time{};
    wall_clock_t::time_point end_time{};
    std::chrono::milliseconds duration{0};
    MemorySnapshot final_snapshot{};
    LeakSummary leak_summary{};
    std::optional<int> exit_status{};
    size_t samples_taken{0};
    size_t samples_skipped{0};
};

/**
 * Drives one profiling session to completion.
 *
 * A single loop waits on an EventChannel until either an event arrives
 * (child exit, cancellation) or the next tick or the session deadline is
 * due. Ticks read the target through the ProcessInspector and feed the
 * StatsTracker. Failed reads skip the tick. Missed ticks are dropped, never
 * replayed. Cancellation and process exit stop the loop as soon as they are
 * observed, whether or not a tick is pending.
 *
 * Without a child process (attach mode) liveness is polled every tick.
 */
class SamplingScheduler
{
  public:
    SamplingScheduler(
            process::ProcessInspector& inspector,
            api::StatsTracker& tracker,
            events::CancellationSource& cancellation,
            SamplingOptions options);

    SamplingScheduler(SamplingScheduler& other) = delete;
    SamplingScheduler(SamplingScheduler&& other) = delete;
    void operator=(const SamplingScheduler&) = delete;
    void operator=(SamplingScheduler&&) = delete;

    void setChildProcess(process::ChildProcess* child);

    SamplingResult run();

    SchedulerState state() const
    {
        return d_state;
    }

  private:
    process::ProcessInspector& d_inspector;
    api::StatsTracker& d_tracker;
    events::CancellationSource& d_cancellation;
    const SamplingOptions d_options;
    process::ChildProcess* d_child{nullptr};

    std::shared_ptr<events::EventChannel> d_channel;
    std::atomic<SchedulerState> d_state{SchedulerState::RUNNING};
    std::optional<StopReason> d_stop_reason;
    std::optional<int> d_exit_status;
    size_t d_samples_taken{0};
    size_t d_samples_skipped{0};

    void takeSample();
    void handleEvent(const events::Event& event);
    void beginStopping(StopReason reason);
    void collectExitStatus();
};

}  // namespace memscope::tracking_api
