#include "process.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iterator>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "exceptions.h"
#include "logging.h"

namespace memscope::process {

using namespace memscope::exception;

namespace {  // unnamed

std::string
readWholeFile(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // unnamed namespace

ProcfsInspector::ProcfsInspector(pid_t pid, std::string proc_root)
: d_pid(pid)
, d_proc_dir(std::move(proc_root) + "/" + std::to_string(pid))
{
}

std::unique_ptr<ProcfsInspector>
ProcfsInspector::attach(pid_t pid)
{
    if (pid <= 0) {
        throw AttachFailure{"Invalid process id " + std::to_string(pid)};
    }
    // EPERM means the process exists but belongs to someone else; its /proc
    // entries may still be readable, so only ESRCH is conclusive here.
    if (::kill(pid, 0) != 0 && errno == ESRCH) {
        throw AttachFailure{"Process " + std::to_string(pid) + " not found"};
    }

    auto inspector = std::make_unique<ProcfsInspector>(pid);
    try {
        inspector->snapshot();
    } catch (const SampleReadError& e) {
        throw AttachFailure{"Cannot inspect process " + std::to_string(pid) + ": " + e.what()};
    }
    if (!inspector->isAlive()) {
        throw AttachFailure{"Process " + std::to_string(pid) + " is not running"};
    }
    return inspector;
}

pid_t
ProcfsInspector::pid() const
{
    return d_pid;
}

size_t
ProcfsInspector::residentFromStatm() const
{
    static long pagesize = sysconf(_SC_PAGE_SIZE);

    std::ifstream statm(d_proc_dir + "/statm");
    size_t size = 0;
    size_t resident = 0;
    if (!(statm >> size >> resident)) {
        throw SampleReadError{"Failed to read RSS value from " + d_proc_dir + "/statm"};
    }
    return resident * pagesize;
}

MemoryReading
ProcfsInspector::snapshot()
{
    if (!d_procs_status.is_open()) {
        d_procs_status.open(d_proc_dir + "/status");
        if (!d_procs_status) {
            throw SampleReadError{
                    "Failed to open " + d_proc_dir + "/status: " + std::string(strerror(errno))};
        }
    }

    std::optional<size_t> vm_peak;
    std::optional<size_t> vm_hwm;
    std::optional<size_t> vm_rss;
    bool read_any = false;
    std::string line;
    while (std::getline(d_procs_status, line)) {
        read_any = true;
        unsigned long kb = 0;
        if (sscanf(line.c_str(), "VmPeak: %lu kB", &kb) == 1) {
            vm_peak = kb * 1024;
        } else if (sscanf(line.c_str(), "VmHWM: %lu kB", &kb) == 1) {
            vm_hwm = kb * 1024;
        } else if (sscanf(line.c_str(), "VmRSS: %lu kB", &kb) == 1) {
            vm_rss = kb * 1024;
        }
    }
    d_procs_status.clear();
    d_procs_status.seekg(0);

    if (!read_any) {
        // Most likely the process is gone. Reopen on the next attempt.
        d_procs_status.close();
        throw SampleReadError{"Failed to read " + d_proc_dir + "/status"};
    }

    size_t rss = vm_rss ? *vm_rss : residentFromStatm();
    if (rss == 0) {
        throw SampleReadError{"No resident memory reported for process " + std::to_string(d_pid)};
    }

    MemoryReading reading;
    reading.current_usage = rss;
    reading.peak_usage = std::max(vm_hwm.value_or(rss), rss);
    reading.total_allocated = std::max(vm_peak.value_or(rss), rss);
    reading.total_freed = reading.total_allocated - rss;
    return reading;
}

bool
ProcfsInspector::isAlive()
{
    std::ifstream stat(d_proc_dir + "/stat");
    std::string line;
    if (!std::getline(stat, line)) {
        return false;
    }

    // The command name may itself contain parentheses: the state follows the
    // last one.
    auto pos = line.rfind(')');
    if (pos == std::string::npos || pos + 2 >= line.size()) {
        return false;
    }
    const char state = line[pos + 2];
    return state != 'Z' && state != 'X' && state != 'x';
}

std::string
ProcfsInspector::commandLine()
{
    std::string cmdline = readWholeFile(d_proc_dir + "/cmdline");
    std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
    while (!cmdline.empty() && cmdline.back() == ' ') {
        cmdline.pop_back();
    }
    if (!cmdline.empty()) {
        return cmdline;
    }

    // Kernel threads and zombies have no arguments, show the name like ps does.
    std::string comm = readWholeFile(d_proc_dir + "/comm");
    while (!comm.empty() && comm.back() == '\n') {
        comm.pop_back();
    }
    if (comm.empty()) {
        throw SampleReadError{"Failed to read command line of process " + std::to_string(d_pid)};
    }
    return "[" + comm + "]";
}

SpawnedProcess::SpawnedProcess(pid_t pid)
: d_pid(pid)
{
}

SpawnedProcess::~SpawnedProcess()
{
    // A child must never outlive the session that launched it.
    terminate();
    if (d_waiter.joinable()) {
        d_waiter.join();
        return;
    }

    std::lock_guard<std::mutex> lock(d_mutex);
    if (!d_exit_status) {
        int status;
        while (::waitpid(d_pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
}

pid_t
SpawnedProcess::pid() const
{
    return d_pid;
}

void
SpawnedProcess::terminate()
{
    std::lock_guard<std::mutex> lock(d_mutex);
    if (d_exit_status) {
        return;
    }
    if (::kill(d_pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG(WARNING) << "Failed to terminate process " << d_pid << ": " << strerror(errno);
        return;
    }
    LOG(INFO) << "Terminated process " << d_pid;
}

void
SpawnedProcess::watchExit(std::shared_ptr<events::EventChannel> channel)
{
    if (d_waiter.joinable()) {
        return;
    }
    d_waiter = std::thread(&SpawnedProcess::waitForExit, this, std::move(channel));
}

void
SpawnedProcess::waitForExit(const std::shared_ptr<events::EventChannel>& channel)
{
    siginfo_t info{};
    int rc;
    do {
        // WNOWAIT leaves the child a zombie until we reap it under the lock
        // below, so terminate() can never signal a recycled pid.
        rc = ::waitid(P_PID, d_pid, &info, WEXITED | WNOWAIT);
    } while (rc != 0 && errno == EINTR);

    int exit_status = -1;
    if (rc != 0) {
        LOG(ERROR) << "Error waiting for process " << d_pid << ": " << strerror(errno);
    } else if (info.si_code == CLD_EXITED) {
        exit_status = info.si_status;
    } else {
        exit_status = 128 + info.si_status;
    }

    {
        std::lock_guard<std::mutex> lock(d_mutex);
        int status;
        while (::waitpid(d_pid, &status, 0) < 0 && errno == EINTR) {
        }
        d_exit_status = exit_status;
    }

    LOG(INFO) << "Process " << d_pid << " exited with status " << exit_status;
    if (channel) {
        channel->post(events::Event{events::EventType::PROCESS_EXITED, exit_status});
    }
}

std::optional<int>
SpawnedProcess::exitStatus() const
{
    std::lock_guard<std::mutex> lock(d_mutex);
    return d_exit_status;
}

std::unique_ptr<SpawnedProcess>
spawnProcess(const std::vector<std::string>& argv)
{
    if (argv.empty()) {
        throw SpawnFailure{"No command given"};
    }

    std::vector<char*> argv_cstr;
    argv_cstr.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        argv_cstr.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_cstr.push_back(nullptr);

    // The child reports a failed exec through this pipe. A successful exec
    // closes it (O_CLOEXEC) and the parent reads EOF.
    int exec_pipe[2];
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        throw SpawnFailure{"Failed to create pipe: " + std::string(strerror(errno))};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        throw SpawnFailure{"Failed to fork: " + std::string(strerror(err))};
    }

    if (pid == 0) {
        // In the child only async-signal-safe calls are allowed until exec,
        // and we leave through _exit() on every failure path.
        ::close(exec_pipe[0]);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        ::execvp(argv_cstr[0], argv_cstr.data());

        int err = errno;
        ssize_t unused = ::write(exec_pipe[1], &err, sizeof(err));
        (void)unused;
        _exit(127);
    }

    ::close(exec_pipe[1]);
    int child_errno = 0;
    ssize_t nread;
    do {
        nread = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (nread < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (nread == sizeof(child_errno)) {
        int status;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw SpawnFailure{"Failed to execute '" + argv[0] + "': " + std::string(strerror(child_errno))};
    }

    LOG(INFO) << "Started process " << pid << ": " << argv[0];
    return std::unique_ptr<SpawnedProcess>(new SpawnedProcess(pid));
}

}  // namespace memscope::process
