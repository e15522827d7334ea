#pragma once

#include "core/Logger.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace deckmix {

using TimerId = uint32_t;
using TimerTask = std::function<void()>;

/// Cancellable periodic and one-shot timers.
/// cancel() is non-blocking: a callback already running when cancel() is
/// called is allowed to finish. Id 0 is never returned and cancel(0) is a no-op.
class TimerService {
public:
    virtual ~TimerService() = default;

    virtual TimerId schedulePeriodic(double intervalMs, TimerTask task) = 0;
    virtual TimerId scheduleOnce(double delayMs, TimerTask task) = 0;
    virtual void cancel(TimerId id) = 0;
    virtual int pendingCount() const = 0;
};

/// Runs every timer on one worker thread, in due order.
class ThreadTimerService : public TimerService {
public:
    ThreadTimerService();
    ~ThreadTimerService() override;

    ThreadTimerService(const ThreadTimerService&) = delete;
    ThreadTimerService& operator=(const ThreadTimerService&) = delete;

    TimerId schedulePeriodic(double intervalMs, TimerTask task) override;
    TimerId scheduleOnce(double delayMs, TimerTask task) override;
    void cancel(TimerId id) override;
    int pendingCount() const override;

    /// Stop the worker and drop every timer. Joins unless called from a timer callback.
    /// The service must not be destroyed from one of its own callbacks.
    void shutdown();

    bool isWorkerThread() const;

private:
    using SteadyClock = std::chrono::steady_clock;

    struct Entry {
        TimerId id;
        SteadyClock::time_point due;
        SteadyClock::duration interval; // zero for one-shot
        TimerTask task;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Entry> entries_;
    TimerId nextId_ = 1;
    bool running_ = true;
    std::thread worker_;

    TimerId add(double delayMs, double intervalMs, TimerTask task);
    void run();
};

} // namespace deckmix
