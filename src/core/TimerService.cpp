#include "core/TimerService.h"

#include <algorithm>
#include <exception>

namespace deckmix {

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

ThreadTimerService::ThreadTimerService()
{
    worker_ = std::thread([this] { run(); });
    DM_INFO("ThreadTimerService: created, worker thread started");
}

ThreadTimerService::~ThreadTimerService()
{
    shutdown();
    if (worker_.joinable())
    {
        // Only reachable when destroyed from one of its own callbacks
        DM_WARN("ThreadTimerService: destroyed from worker thread, detaching");
        worker_.detach();
    }
    DM_INFO("ThreadTimerService: destroyed");
}

void ThreadTimerService::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        entries_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable() && !isWorkerThread())
    {
        worker_.join();
        DM_DEBUG("ThreadTimerService::shutdown: worker joined");
    }
}

bool ThreadTimerService::isWorkerThread() const
{
    return std::this_thread::get_id() == worker_.get_id();
}

// ═══════════════════════════════════════════════════════════════════
// Scheduling (any thread)
// ═══════════════════════════════════════════════════════════════════

TimerId ThreadTimerService::schedulePeriodic(double intervalMs, TimerTask task)
{
    if (intervalMs <= 0.0 || !task)
    {
        DM_WARN("ThreadTimerService::schedulePeriodic: invalid interval %.1f ms", intervalMs);
        return 0;
    }
    return add(intervalMs, intervalMs, std::move(task));
}

TimerId ThreadTimerService::scheduleOnce(double delayMs, TimerTask task)
{
    if (!task)
    {
        DM_WARN("ThreadTimerService::scheduleOnce: null task");
        return 0;
    }
    return add(std::max(0.0, delayMs), 0.0, std::move(task));
}

TimerId ThreadTimerService::add(double delayMs, double intervalMs, TimerTask task)
{
    auto toDuration = [](double ms) {
        return std::chrono::duration_cast<SteadyClock::duration>(
            std::chrono::duration<double, std::milli>(ms));
    };

    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_)
        {
            DM_DEBUG("ThreadTimerService::add: service shut down, ignoring");
            return 0;
        }
        id = nextId_++;
        if (nextId_ == 0)
            nextId_ = 1;
        entries_.push_back({id, SteadyClock::now() + toDuration(delayMs),
                            toDuration(intervalMs), std::move(task)});
    }
    cv_.notify_all();
    DM_TRACE("ThreadTimerService::add: id=%u delay=%.1f interval=%.1f", id, delayMs, intervalMs);
    return id;
}

void ThreadTimerService::cancel(TimerId id)
{
    if (id == 0)
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it != entries_.end())
    {
        entries_.erase(it);
        DM_TRACE("ThreadTimerService::cancel: id=%u", id);
    }
}

int ThreadTimerService::pendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(entries_.size());
}

// ═══════════════════════════════════════════════════════════════════
// Worker thread
// ═══════════════════════════════════════════════════════════════════

void ThreadTimerService::run()
{
    DM_TRACE("ThreadTimerService: worker running");

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_)
    {
        if (entries_.empty())
        {
            cv_.wait(lock, [this] { return !running_ || !entries_.empty(); });
            continue;
        }

        auto next = std::min_element(entries_.begin(), entries_.end(),
                                     [](const Entry& a, const Entry& b) { return a.due < b.due; });
        auto now = SteadyClock::now();
        if (next->due > now)
        {
            // Woken early by add/cancel/shutdown: re-evaluate
            cv_.wait_until(lock, next->due);
            continue;
        }

        TimerId id = next->id;
        TimerTask task = next->task;
        if (next->interval > SteadyClock::duration::zero())
        {
            next->due += next->interval;
            if (next->due < now)
                next->due = now + next->interval; // fell behind, skip missed slots
        }
        else
        {
            entries_.erase(next);
        }

        lock.unlock();
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            DM_WARN("ThreadTimerService: timer %u threw: %s", id, e.what());
        }
        Logger::drain();
        lock.lock();
    }

    DM_TRACE("ThreadTimerService: worker exiting");
}

} // namespace deckmix
