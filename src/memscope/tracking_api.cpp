#include "tracking_api.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

#define UNW_LOCAL_ONLY
#include <libunwind.h>

#include "exceptions.h"
#include "logging.h"

using namespace memscope::exception;

namespace memscope::tracking_api {

thread_local bool RecursionGuard::isActive = false;

static inline thread_id_t
generate_next_tid()
{
    static std::atomic<thread_id_t> s_tid_counter = 0;
    return ++s_tid_counter;
}

thread_local thread_id_t t_tid = generate_next_tid();

static inline thread_id_t
thread_id()
{
    return t_tid;
}

static monotonic_clock_t::time_point
saturatingAdd(monotonic_clock_t::time_point base, std::chrono::milliseconds offset)
{
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
            monotonic_clock_t::time_point::max() - base);
    if (offset >= headroom) {
        return monotonic_clock_t::time_point::max();
    }
    return base + offset;
}

std::vector<std::string>
NativeTrace::capture(size_t skip, size_t max_frames)
{
    std::vector<std::string> frames;

    unw_context_t context;
    unw_cursor_t cursor;
    if (unw_getcontext(&context) != 0 || unw_init_local(&cursor, &context) != 0) {
        return frames;
    }

    // The cursor starts at this very frame.
    ++skip;
    char name[256];
    do {
        if (skip > 0) {
            --skip;
            continue;
        }

        unw_word_t ip = 0;
        unw_get_reg(&cursor, UNW_REG_IP, &ip);

        unw_word_t offset = 0;
        char frame[sizeof(name) + 64];
        int rc = unw_get_proc_name(&cursor, name, sizeof(name), &offset);
        if (rc == 0 || rc == -UNW_ENOMEM) {
            snprintf(frame, sizeof(frame), "%s+0x%lx", name, static_cast<unsigned long>(offset));
        } else {
            snprintf(frame, sizeof(frame), "0x%lx", static_cast<unsigned long>(ip));
        }
        frames.emplace_back(frame);
    } while (frames.size() < max_frames && unw_step(&cursor) > 0);
    return frames;
}

AllocationTracker::AllocationTracker(api::StatsTracker& tracker, bool native_traces, size_t max_frames)
: d_tracker(tracker)
, d_native_traces(native_traces)
, d_max_frames(max_frames)
{
}

void
AllocationTracker::trackAllocation(const void* ptr, size_t size)
{
    if (RecursionGuard::isActive || !isActive()) {
        return;
    }
    RecursionGuard guard;

    AllocationRecord record;
    record.size = size;
    record.timestamp = wall_clock_t::now();
    record.thread_id = thread_id();
    if (d_native_traces) {
        // Skip this frame so the stack starts at the producer.
        record.call_stack = NativeTrace::capture(1, d_max_frames);
    }

    std::lock_guard<std::mutex> lock(d_mutex);
    d_tracker.addAllocation(reinterpret_cast<address_t>(ptr), std::move(record));
}

std::optional<AllocationRecord>
AllocationTracker::trackDeallocation(const void* ptr)
{
    if (RecursionGuard::isActive || !isActive()) {
        return std::nullopt;
    }
    RecursionGuard guard;

    std::lock_guard<std::mutex> lock(d_mutex);
    return d_tracker.removeAllocation(reinterpret_cast<address_t>(ptr));
}

bool
AllocationTracker::isActive() const
{
    return d_active.load();
}

void
AllocationTracker::activate()
{
    d_active = true;
}

void
AllocationTracker::deactivate()
{
    d_active = false;
}

MemorySnapshot
AllocationTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(d_mutex);
    return d_tracker.snapshot();
}

SamplingScheduler::SamplingScheduler(
        process::ProcessInspector& inspector,
        api::StatsTracker& tracker,
        events::CancellationSource& cancellation,
        SamplingOptions options)
: d_inspector(inspector)
, d_tracker(tracker)
, d_cancellation(cancellation)
, d_options(std::move(options))
{
    if (d_options.interval.count() <= 0) {
        throw std::invalid_argument("Sampling interval must be positive");
    }
    if (d_options.max_duration.count() <= 0) {
        throw std::invalid_argument("Maximum duration must be positive");
    }
    if (d_options.interval > MAX_SAMPLING_DURATION) {
        throw std::invalid_argument("Sampling interval is too large");
    }
    if (d_options.max_duration > MAX_SAMPLING_DURATION) {
        throw std::invalid_argument("Maximum duration is too large");
    }
}

void
SamplingScheduler::setChildProcess(process::ChildProcess* child)
{
    d_child = child;
}

void
SamplingScheduler::takeSample()
{
    MemoryReading reading;
    try {
        reading = d_inspector.snapshot();
    } catch (const SampleReadError& e) {
        ++d_samples_skipped;
        LOG(DEBUG) << "Skipping sample: " << e.what();
        return;
    }

    ++d_samples_taken;
    d_tracker.replaceSnapshot(reading.toSnapshot());
    if (d_options.live_callback) {
        d_options.live_callback(d_tracker.snapshot());
    }
}

void
SamplingScheduler::handleEvent(const events::Event& event)
{
    switch (event.type) {
        case events::EventType::PROCESS_EXITED: {
            LOG(INFO) << "Target process has terminated";
            d_exit_status = event.exit_status;
            beginStopping(StopReason::PROCESS_ENDED);
        } break;
        case events::EventType::CANCELLED: {
            LOG(INFO) << "Profiling cancelled, generating report...";
            beginStopping(StopReason::USER_CANCELLED);
        } break;
    }
}

void
SamplingScheduler::beginStopping(StopReason reason)
{
    if (d_child && reason != StopReason::PROCESS_ENDED) {
        d_child->terminate();
    }
    d_stop_reason = reason;
    d_state = SchedulerState::STOPPING;
}

void
SamplingScheduler::collectExitStatus()
{
    // The exit watcher posts once the killed child has been reaped.
    const auto grace_deadline = monotonic_clock_t::now() + CHILD_EXIT_GRACE;
    while (!d_exit_status) {
        std::optional<events::Event> event = d_channel->waitUntil(grace_deadline);
        if (!event) {
            break;
        }
        if (event->type == events::EventType::PROCESS_EXITED) {
            d_exit_status = event->exit_status;
        }
    }
    if (!d_exit_status) {
        d_exit_status = d_child->exitStatus();
    }
    if (!d_exit_status) {
        LOG(WARNING) << "Process " << d_child->pid() << " was not reaped, exit status unknown";
    }
}

SamplingResult
SamplingScheduler::run()
{
    if (d_state != SchedulerState::RUNNING || d_channel) {
        throw std::logic_error("A SamplingScheduler can only run once");
    }

    SamplingResult result;
    result.start_time = wall_clock_t::now();
    const auto start = monotonic_clock_t::now();
    const auto deadline = saturatingAdd(start, d_options.max_duration);
    auto next_tick = start;

    d_channel = std::make_shared<events::EventChannel>();
    d_cancellation.subscribe(d_channel);
    if (d_child) {
        d_child->watchExit(d_channel);
    }

    while (d_state == SchedulerState::RUNNING) {
        std::optional<events::Event> event = d_channel->waitUntil(std::min(next_tick, deadline));
        if (event) {
            handleEvent(*event);
            continue;
        }

        auto now = monotonic_clock_t::now();
        if (now >= next_tick) {
            takeSample();
            now = monotonic_clock_t::now();
            // Drop whatever ticks were missed instead of bursting to catch up.
            next_tick = saturatingAdd(next_tick, d_options.interval);
            if (next_tick <= now) {
                next_tick = saturatingAdd(now, d_options.interval);
            }

            if (now >= deadline) {
                LOG(WARNING) << "Maximum duration reached, stopping profiling";
                beginStopping(StopReason::TIMEOUT_EXCEEDED);
            } else if (!d_child && !d_inspector.isAlive()) {
                LOG(INFO) << "Target process has terminated";
                beginStopping(StopReason::PROCESS_ENDED);
            }
        } else if (now >= deadline) {
            LOG(WARNING) << "Maximum duration reached, stopping profiling";
            beginStopping(StopReason::TIMEOUT_EXCEEDED);
        }
    }

    d_cancellation.unsubscribe();
    if (d_child && !d_exit_status) {
        collectExitStatus();
    }

    result.end_time = wall_clock_t::now();
    result.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(monotonic_clock_t::now() - start);
    result.stop_reason = d_stop_reason.value_or(StopReason::PROCESS_ENDED);
    result.exit_status = d_exit_status;
    result.samples_taken = d_samples_taken;
    result.samples_skipped = d_samples_skipped;
    result.final_snapshot = d_tracker.finalSnapshot();
    result.leak_summary = api::analyzeLeaks(result.final_snapshot);

    d_state = SchedulerState::STOPPED;
    return result;
}

}  // namespace memscope::tracking_api
