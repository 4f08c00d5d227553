#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "events.h"
#include "records.h"

namespace memscope::process {

using tracking_api::MemoryReading;

/**
 * Point-in-time view of another process's memory.
 *
 * snapshot() and commandLine() throw exception::SampleReadError when the
 * information cannot be read right now. Callers sampling periodically are
 * expected to treat that as transient.
 */
class ProcessInspector
{
  public:
    virtual ~ProcessInspector() = default;
    virtual pid_t pid() const = 0;
    virtual MemoryReading snapshot() = 0;
    virtual bool isAlive() = 0;
    virtual std::string commandLine() = 0;
};

class ProcfsInspector : public ProcessInspector
{
  public:
    // Throws exception::AttachFailure if the process cannot be inspected.
    static std::unique_ptr<ProcfsInspector> attach(pid_t pid);

    explicit ProcfsInspector(pid_t pid, std::string proc_root = "/proc");

    ProcfsInspector(ProcfsInspector& other) = delete;
    ProcfsInspector(ProcfsInspector&& other) = delete;
    void operator=(const ProcfsInspector&) = delete;
    void operator=(ProcfsInspector&&) = delete;

    pid_t pid() const override;
    MemoryReading snapshot() override;
    bool isAlive() override;
    std::string commandLine() override;

  private:
    pid_t d_pid;
    std::string d_proc_dir;
    std::ifstream d_procs_status;

    size_t residentFromStatm() const;
};

/**
 * A process we launched and are responsible for.
 *
 * Its exit is observed as an event: watchExit() posts PROCESS_EXITED to the
 * channel once the process terminates, carrying its exit status (128 plus the
 * signal number for a process killed by a signal).
 */
class ChildProcess
{
  public:
    virtual ~ChildProcess() = default;
    virtual pid_t pid() const = 0;
    virtual void terminate() = 0;
    virtual void watchExit(std::shared_ptr<events::EventChannel> channel) = 0;
    virtual std::optional<int> exitStatus() const = 0;
};

class SpawnedProcess : public ChildProcess
{
  public:
    ~SpawnedProcess() override;

    SpawnedProcess(SpawnedProcess& other) = delete;
    SpawnedProcess(SpawnedProcess&& other) = delete;
    void operator=(const SpawnedProcess&) = delete;
    void operator=(SpawnedProcess&&) = delete;

    pid_t pid() const override;
    void terminate() override;
    void watchExit(std::shared_ptr<events::EventChannel> channel) override;
    std::optional<int> exitStatus() const override;

  private:
    friend std::unique_ptr<SpawnedProcess> spawnProcess(const std::vector<std::string>& argv);
    explicit SpawnedProcess(pid_t pid);

    void waitForExit(const std::shared_ptr<events::EventChannel>& channel);

    const pid_t d_pid;
    mutable std::mutex d_mutex;
    std::optional<int> d_exit_status;
    std::thread d_waiter;
};

// Throws exception::SpawnFailure if the command could not be executed.
std::unique_ptr<SpawnedProcess>
spawnProcess(const std::vector<std::string>& argv);

}  // namespace memscope::process
