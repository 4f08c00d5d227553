#include <atomic>
#include <iostream>
#include <mutex>

#include "logging.h"

namespace memscope {

static std::atomic<int> LOG_THRESHOLD{static_cast<int>(logLevel::WARNING)};

static const char*
prefixFromLogLevel(int level)
{
    if (level >= CRITICAL) return "memscope CRITICAL: ";
    if (level >= ERROR) return "memscope ERROR: ";
    if (level >= WARNING) return "memscope WARNING: ";
    if (level >= INFO) return "memscope INFO: ";
    if (level >= DEBUG) return "memscope DEBUG: ";
    return "memscope TRACE: ";
}

void
setLogThreshold(int threshold)
{
    LOG_THRESHOLD = threshold;
}

logLevel
getLogThreshold()
{
    return static_cast<logLevel>(LOG_THRESHOLD.load());
}

void
logToStderr(const std::string& message, int level)
{
    if (level < LOG_THRESHOLD) {
        return;
    }

    // Watcher threads log too; keep their lines whole.
    static std::mutex s_stderr_mutex;
    std::lock_guard<std::mutex> lock(s_stderr_mutex);
    std::cerr << prefixFromLogLevel(level) << message << std::endl;
}

}  // namespace memscope
