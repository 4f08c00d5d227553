#ifndef _MEMSCOPE_LOGGING_H
#define _MEMSCOPE_LOGGING_H

#include <sstream>
#include <string>

namespace memscope {

enum logLevel {
    NOTSET = 0,
    DEBUG = 10,
    INFO = 20,
    WARNING = 30,
    ERROR = 40,
    CRITICAL = 50,
};

// Writes one "memscope LEVEL: message" line to stderr if the level passes
// the threshold. Safe to call from any thread: a process-wide mutex keeps
// concurrent lines from interleaving.
void
logToStderr(const std::string& message, int level);

// The threshold is a process-wide atomic and may change while threads log.
void
setLogThreshold(int threshold);

logLevel
getLogThreshold();

// Accumulates one message and emits it as a single line on destruction.
// Each LOG object belongs to the thread that created it.
class LOG
{
  public:
    // Constructors
    LOG()
    : msgLevel(INFO){};

    explicit LOG(logLevel type)
    {
        msgLevel = type;
    };

    // Destructors
    ~LOG()
    {
        logToStderr(buffer.str(), msgLevel);
    };

    // Operators
    template<typename T>
    LOG& operator<<(const T& msg)
    {
        if (msgLevel < getLogThreshold()) {
            return *this;
        }
        buffer << msg;
        return *this;
    };

  private:
    // Data members
    std::ostringstream buffer;
    logLevel msgLevel = DEBUG;
};

}  // namespace memscope

#endif  //_MEMSCOPE_LOGGING_H
