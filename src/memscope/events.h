#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <signal.h>

#include "records.h"

namespace memscope::events {

using tracking_api::monotonic_clock_t;

enum class EventType : unsigned char {
    PROCESS_EXITED,
    CANCELLED,
};

struct Event
{
    EventType type;
    int exit_status{0};
};

/**
 * Queue of events that a single consumer waits on.
 *
 * Producers (the child exit watcher, the interrupt watcher, a cancellation
 * source) post from any thread. The consumer blocks in waitUntil() until an
 * event is available or the deadline passes, which lets it race its own
 * timer against everything else with one wait. A deadline in the past
 * returns a pending event, if any, without blocking.
 */
class EventChannel
{
  public:
    void post(Event event);
    std::optional<Event> waitUntil(monotonic_clock_t::time_point deadline);

  private:
    std::mutex d_mutex;
    std::condition_variable d_cv;
    std::deque<Event> d_events;
};

// Single-fire cancellation. Only the first cancel() is delivered.
class CancellationSource
{
  public:
    void cancel();
    bool isCancelled() const;

    // If already cancelled, the event is posted immediately.
    void subscribe(std::shared_ptr<EventChannel> channel);
    void unsubscribe();

  private:
    mutable std::mutex d_mutex;
    bool d_cancelled{false};
    std::weak_ptr<EventChannel> d_channel;
};

/**
 * Turns SIGINT and SIGTERM into a cancellation.
 *
 * start() blocks both signals on the calling thread (threads created after
 * that inherit the mask) and waits for them with sigwait() on a dedicated
 * thread. stop() must be called from the thread that called start().
 */
class InterruptWatcher
{
  public:
    explicit InterruptWatcher(CancellationSource& source);
    ~InterruptWatcher();

    InterruptWatcher(InterruptWatcher& other) = delete;
    InterruptWatcher(InterruptWatcher&& other) = delete;
    void operator=(const InterruptWatcher&) = delete;
    void operator=(InterruptWatcher&&) = delete;

    void start();
    void stop();

  private:
    CancellationSource& d_source;
    std::atomic<bool> d_stop{false};
    std::thread d_thread;
    sigset_t d_previous_mask;

    void watch();
};

}  // namespace memscope::events
