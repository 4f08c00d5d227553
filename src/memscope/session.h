#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "events.h"
#include "process.h"
#include "records.h"
#include "snapshot.h"
#include "tracking_api.h"

namespace memscope::api {

using tracking_api::ProfileSession;
using tracking_api::SamplingOptions;

struct SessionOptions
{
    std::optional<pid_t> pid{};
    std::vector<std::string> command{};
    std::string output_file{"memory_profile.json"};
    std::optional<std::string> markdown_file{};
    std::chrono::milliseconds interval{1000};
    std::chrono::milliseconds max_duration{60000};
    bool live{false};
    bool compress{false};
    size_t top_allocations{10};

    // Throws std::invalid_argument describing the first problem found.
    void validate() const;

    SamplingOptions samplingOptions() const;
};

/**
 * Runs one profiling session from target resolution to an assembled
 * ProfileSession.
 *
 * Fatal conditions (the target cannot be attached to or started) are raised
 * before any sampling happens. Once sampling has started every session ends
 * with a result, whatever stopped it.
 */
class SessionOrchestrator
{
  public:
    explicit SessionOrchestrator(events::CancellationSource& cancellation);

    SessionOrchestrator(SessionOrchestrator& other) = delete;
    SessionOrchestrator(SessionOrchestrator&& other) = delete;
    void operator=(const SessionOrchestrator&) = delete;
    void operator=(SessionOrchestrator&&) = delete;

    ProfileSession run(const SessionOptions& options, SamplingOptions sampling);

    ProfileSession profileExisting(pid_t pid, SamplingOptions options);
    ProfileSession profileNew(const std::vector<std::string>& argv, SamplingOptions options);

    ProfileSession
    profile(process::ProcessInspector& inspector,
            process::ChildProcess* child,
            std::string command,
            SamplingOptions options);

    const StatsTracker& tracker() const
    {
        return d_tracker;
    }

  private:
    events::CancellationSource& d_cancellation;
    StatsTracker d_tracker;
};

// Convert a command-line value in seconds. Positive values below a
// millisecond round up to one. Throws std::invalid_argument for values that
// are not finite or exceed MAX_SAMPLING_DURATION.
std::chrono::milliseconds
durationFromSeconds(double seconds);

// Persist the JSON record and, if requested, the Markdown report. Throws
// exception::OutputWriteFailure; no partial file is left behind.
void
writeOutputs(const ProfileSession& session, const SessionOptions& options);

}  // namespace memscope::api
