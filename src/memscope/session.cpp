#include "session.h"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <unistd.h>

#include "exceptions.h"
#include "logging.h"
#include "record_writer.h"
#include "report.h"
#include "sink.h"

namespace memscope::api {

using namespace memscope::exception;

namespace {  // unnamed

std::string
joinCommand(const std::vector<std::string>& argv)
{
    std::string command;
    for (const auto& arg : argv) {
        if (!command.empty()) {
            command += ' ';
        }
        command += arg;
    }
    return command;
}

[[noreturn]] void
failOutput(const std::string& file_name, const std::string& reason)
{
    ::unlink(file_name.c_str());
    throw OutputWriteFailure{"Failed to write " + file_name + ": " + reason};
}

void
writeRecord(const ProfileSession& session, const std::string& file_name, bool compress)
{
    std::unique_ptr<io::Sink> sink;
    try {
        sink = std::make_unique<io::FileSink>(file_name, true, compress);
    } catch (const IoError& e) {
        throw OutputWriteFailure{e.what()};
    }

    bool written = true;
    int error = 0;
    {
        tracking_api::JsonRecordWriter writer(std::move(sink));
        if (!writer.writeSession(session) || !writer.finish()) {
            written = false;
            error = errno;
        }
    }
    if (!written) {
        failOutput(file_name, ::strerror(error));
    }
    LOG(INFO) << "Memory profile written to " << file_name;
}

void
writeMarkdown(const ProfileSession& session, const std::string& file_name)
{
    std::unique_ptr<io::FileSink> sink;
    try {
        sink = std::make_unique<io::FileSink>(file_name, true, false);
    } catch (const IoError& e) {
        throw OutputWriteFailure{e.what()};
    }

    const std::string document = report::renderMarkdown(session);
    bool written = sink->writeAll(document.data(), document.size());
    int error = written ? 0 : errno;
    if (!sink->close() && written) {
        written = false;
        error = errno;
    }
    sink.reset();
    if (!written) {
        failOutput(file_name, ::strerror(error));
    }
    LOG(INFO) << "Markdown report written to " << file_name;
}

}  // unnamed namespace

void
SessionOptions::validate() const
{
    if (pid && !command.empty()) {
        throw std::invalid_argument("A process id and a command are mutually exclusive");
    }
    if (!pid && command.empty()) {
        throw std::invalid_argument("Either a process id or a command is required");
    }
    if (pid && *pid <= 0) {
        throw std::invalid_argument("The process id must be a positive integer");
    }
    if (interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("The sampling interval must be greater than zero");
    }
    if (max_duration <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("The maximum duration must be greater than zero");
    }
    if (interval > tracking_api::MAX_SAMPLING_DURATION) {
        throw std::invalid_argument("The sampling interval cannot exceed one year");
    }
    if (max_duration > tracking_api::MAX_SAMPLING_DURATION) {
        throw std::invalid_argument("The maximum duration cannot exceed one year");
    }
    if (output_file.empty()) {
        throw std::invalid_argument("The output file name cannot be empty");
    }
}

SamplingOptions
SessionOptions::samplingOptions() const
{
    SamplingOptions options;
    options.interval = interval;
    options.max_duration = max_duration;
    return options;
}

SessionOrchestrator::SessionOrchestrator(events::CancellationSource& cancellation)
: d_cancellation(cancellation)
{
}

ProfileSession
SessionOrchestrator::run(const SessionOptions& options, SamplingOptions sampling)
{
    options.validate();
    if (options.pid) {
        return profileExisting(*options.pid, std::move(sampling));
    }
    return profileNew(options.command, std::move(sampling));
}

ProfileSession
SessionOrchestrator::profileExisting(pid_t pid, SamplingOptions options)
{
    auto inspector = process::ProcfsInspector::attach(pid);

    std::string command;
    try {
        command = inspector->commandLine();
    } catch (const SampleReadError& e) {
        LOG(WARNING) << "Could not read the command line of process " << pid << ": " << e.what();
        command = "[pid " + std::to_string(pid) + "]";
    }

    LOG(INFO) << "Attached to process " << pid << " (" << command << ")";
    return profile(*inspector, nullptr, std::move(command), std::move(options));
}

ProfileSession
SessionOrchestrator::profileNew(const std::vector<std::string>& argv, SamplingOptions options)
{
    auto child = process::spawnProcess(argv);
    process::ProcfsInspector inspector(child->pid());
    return profile(inspector, child.get(), joinCommand(argv), std::move(options));
}

ProfileSession
SessionOrchestrator::profile(
        process::ProcessInspector& inspector,
        process::ChildProcess* child,
        std::string command,
        SamplingOptions options)
{
    d_tracker.clear();

    ProfileSession session;
    session.process_id = inspector.pid();
    session.command = std::move(command);
    session.interval = options.interval;
    session.max_duration = options.max_duration;

    tracking_api::SamplingScheduler scheduler(inspector, d_tracker, d_cancellation, std::move(options));
    scheduler.setChildProcess(child);
    tracking_api::SamplingResult result = scheduler.run();

    session.start_time = result.start_time;
    session.end_time = result.end_time;
    session.duration = result.duration;
    session.final_snapshot = std::move(result.final_snapshot);
    session.leak_summary = std::move(result.leak_summary);
    session.stop_reason = result.stop_reason;
    session.exit_status = result.exit_status;
    session.samples_taken = result.samples_taken;
    session.samples_skipped = result.samples_skipped;

    LOG(INFO) << "Profiling stopped (" << tracking_api::stopReasonName(session.stop_reason)
              << ") after " << session.samples_taken << " samples";
    return session;
}

std::chrono::milliseconds
durationFromSeconds(double seconds)
{
    using seconds_t = std::chrono::duration<double>;
    if (!std::isfinite(seconds)) {
        throw std::invalid_argument("Durations must be finite numbers of seconds");
    }
    if (seconds > seconds_t(tracking_api::MAX_SAMPLING_DURATION).count()) {
        throw std::invalid_argument("Durations cannot exceed one year");
    }
    if (seconds <= 0) {
        return std::chrono::milliseconds::zero();
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(seconds_t(seconds));
    if (millis.count() == 0) {
        millis = std::chrono::milliseconds(1);
    }
    return millis;
}

void
writeOutputs(const ProfileSession& session, const SessionOptions& options)
{
    writeRecord(session, options.output_file, options.compress);
    if (options.markdown_file) {
        writeMarkdown(session, *options.markdown_file);
    }
}

}  // namespace memscope::api
