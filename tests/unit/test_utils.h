#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "events.h"
#include "exceptions.h"
#include "process.h"
#include "records.h"
#include "sink.h"

namespace memscope::test_utils {

using namespace std::chrono_literals;

/**
 * ProcessInspector replaying a scripted list of readings.
 *
 * Each snapshot() call consumes one entry. An empty entry makes that call
 * fail with SampleReadError. Once the script is exhausted the process is
 * reported dead, unless repeatLast() was requested, in which case the last
 * entry is replayed forever and the process stays alive.
 */
class FakeInspector : public process::ProcessInspector
{
  public:
    explicit FakeInspector(std::vector<std::optional<size_t>> readings, pid_t pid = 4242)
    : d_pid(pid)
    , d_readings(std::move(readings))
    {
    }

    void repeatLast(bool repeat)
    {
        d_repeat_last = repeat;
    }

    void setSampleDelay(std::chrono::milliseconds delay)
    {
        d_delay = delay;
    }

    pid_t pid() const override
    {
        return d_pid;
    }

    tracking_api::MemoryReading snapshot() override
    {
        ++d_calls;
        if (d_delay.count() > 0) {
            std::this_thread::sleep_for(d_delay);
        }

        std::optional<size_t> value;
        if (d_next < d_readings.size()) {
            value = d_readings[d_next++];
        } else if (d_repeat_last && !d_readings.empty()) {
            value = d_readings.back();
        } else {
            throw exception::SampleReadError{"No more scripted readings"};
        }
        if (!value) {
            throw exception::SampleReadError{"Scripted read failure"};
        }

        tracking_api::MemoryReading reading;
        reading.current_usage = *value;
        reading.peak_usage = *value;
        reading.total_allocated = *value;
        reading.total_freed = 0;
        return reading;
    }

    bool isAlive() override
    {
        return d_repeat_last || d_next < d_readings.size();
    }

    std::string commandLine() override
    {
        return "fake-target --flag";
    }

    size_t calls() const
    {
        return d_calls;
    }

  private:
    const pid_t d_pid;
    const std::vector<std::optional<size_t>> d_readings;
    size_t d_next{0};
    bool d_repeat_last{false};
    std::chrono::milliseconds d_delay{0};
    std::atomic<size_t> d_calls{0};
};

// ChildProcess whose exit is triggered by the test.
class FakeChild : public process::ChildProcess
{
  public:
    explicit FakeChild(bool exit_on_terminate = true, pid_t pid = 4242)
    : d_pid(pid)
    , d_exit_on_terminate(exit_on_terminate)
    {
    }

    pid_t pid() const override
    {
        return d_pid;
    }

    void terminate() override
    {
        {
            std::lock_guard<std::mutex> lock(d_mutex);
            if (d_terminate_time) {
                return;
            }
            d_terminate_time = tracking_api::wall_clock_t::now();
        }
        if (d_exit_on_terminate) {
            exit(137);
        }
    }

    void watchExit(std::shared_ptr<events::EventChannel> channel) override
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        d_channel = std::move(channel);
    }

    std::optional<int> exitStatus() const override
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        return d_exit_status;
    }

    void exit(int status)
    {
        std::shared_ptr<events::EventChannel> channel;
        {
            std::lock_guard<std::mutex> lock(d_mutex);
            if (d_exit_status) {
                return;
            }
            d_exit_status = status;
            channel = d_channel;
        }
        if (channel) {
            channel->post(events::Event{events::EventType::PROCESS_EXITED, status});
        }
    }

    bool terminated() const
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        return d_terminate_time.has_value();
    }

    std::optional<tracking_api::wall_clock_t::time_point> terminateTime() const
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        return d_terminate_time;
    }

  private:
    const pid_t d_pid;
    const bool d_exit_on_terminate;
    mutable std::mutex d_mutex;
    std::shared_ptr<events::EventChannel> d_channel;
    std::optional<int> d_exit_status;
    std::optional<tracking_api::wall_clock_t::time_point> d_terminate_time;
};

class StringSink : public io::Sink
{
  public:
    explicit StringSink(std::string& out, bool fail = false)
    : d_out(out)
    , d_fail(fail)
    {
    }

    bool writeAll(const char* data, size_t length) override
    {
        if (d_fail) {
            return false;
        }
        d_out.append(data, length);
        return true;
    }

  private:
    std::string& d_out;
    const bool d_fail;
};

class TempDir
{
  public:
    TempDir()
    {
        std::string pattern =
                (std::filesystem::temp_directory_path() / "memscope-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("Could not create temporary directory");
        }
        d_path = pattern;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(d_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::filesystem::path path() const
    {
        return d_path;
    }

    std::string file(const std::string& name) const
    {
        return (d_path / name).string();
    }

  private:
    std::filesystem::path d_path;
};

inline std::string
readFile(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void
writeFile(const std::string& path, const std::string& contents)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline tracking_api::AllocationRecord
makeRecord(size_t size, tracking_api::wall_clock_t::time_point timestamp = {})
{
    tracking_api::AllocationRecord record;
    record.size = size;
    record.timestamp = timestamp;
    record.thread_id = 1;
    return record;
}

}  // namespace memscope::test_utils
