#include "events.h"

#include <cstring>
#include <system_error>

#include <pthread.h>

#include "logging.h"

namespace memscope::events {

namespace {  // unnamed

sigset_t
interruptSignals()
{
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    return signals;
}

}  // unnamed namespace

void
EventChannel::post(Event event)
{
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        d_events.push_back(event);
    }
    d_cv.notify_one();
}

std::optional<Event>
EventChannel::waitUntil(monotonic_clock_t::time_point deadline)
{
    std::unique_lock<std::mutex> lock(d_mutex);
    if (!d_cv.wait_until(lock, deadline, [this]() { return !d_events.empty(); })) {
        return std::nullopt;
    }
    Event event = d_events.front();
    d_events.pop_front();
    return event;
}

void
CancellationSource::cancel()
{
    std::shared_ptr<EventChannel> channel;
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        if (d_cancelled) {
            return;
        }
        d_cancelled = true;
        channel = d_channel.lock();
    }
    if (channel) {
        channel->post(Event{EventType::CANCELLED});
    }
}

bool
CancellationSource::isCancelled() const
{
    std::lock_guard<std::mutex> lock(d_mutex);
    return d_cancelled;
}

void
CancellationSource::subscribe(std::shared_ptr<EventChannel> channel)
{
    bool already_cancelled;
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        d_channel = channel;
        already_cancelled = d_cancelled;
    }
    if (already_cancelled && channel) {
        channel->post(Event{EventType::CANCELLED});
    }
}

void
CancellationSource::unsubscribe()
{
    std::lock_guard<std::mutex> lock(d_mutex);
    d_channel.reset();
}

InterruptWatcher::InterruptWatcher(CancellationSource& source)
: d_source(source)
{
    sigemptyset(&d_previous_mask);
}

InterruptWatcher::~InterruptWatcher()
{
    stop();
}

void
InterruptWatcher::start()
{
    if (d_thread.joinable()) {
        return;
    }

    sigset_t signals = interruptSignals();
    int rc = pthread_sigmask(SIG_BLOCK, &signals, &d_previous_mask);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "Failed to block interrupt signals");
    }

    d_stop = false;
    d_thread = std::thread(&InterruptWatcher::watch, this);
}

void
InterruptWatcher::watch()
{
    const sigset_t signals = interruptSignals();
    while (true) {
        int signal_number = 0;
        if (sigwait(&signals, &signal_number) != 0) {
            continue;
        }
        if (d_stop) {
            return;
        }
        if (d_source.isCancelled()) {
            LOG(WARNING) << "Received " << strsignal(signal_number) << " again, still shutting down";
            continue;
        }
        LOG(INFO) << "Received " << strsignal(signal_number) << ", generating report...";
        d_source.cancel();
    }
}

void
InterruptWatcher::stop()
{
    if (!d_thread.joinable()) {
        return;
    }

    d_stop = true;
    // The signal is blocked everywhere, so it stays pending until the
    // watcher's sigwait() picks it up.
    pthread_kill(d_thread.native_handle(), SIGTERM);
    try {
        d_thread.join();
    } catch (const std::system_error& e) {
        LOG(ERROR) << "Failed to join interrupt watcher: " << e.what();
    }

    int rc = pthread_sigmask(SIG_SETMASK, &d_previous_mask, nullptr);
    if (rc != 0) {
        LOG(WARNING) << "Failed to restore signal mask: " << strerror(rc);
    }
}

}  // namespace memscope::events
