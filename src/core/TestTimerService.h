#pragma once

#include "core/Clock.h"
#include "core/TimerService.h"

#include <algorithm>
#include <vector>

namespace deckmix {

/// Clock that only moves when told to.
class TestClock : public Clock {
public:
    double nowMs() const override { return now_; }
    void setMs(double ms) { now_ = ms; }
    void advanceMs(double ms) { now_ += ms; }

private:
    double now_ = 0.0;
};

/// Single-threaded TimerService driven by advance(). Timers fire on the
/// caller's thread in due order, with the clock set to each due time.
class TestTimerService : public TimerService {
public:
    explicit TestTimerService(TestClock& clock) : clock_(clock) {}

    TimerId schedulePeriodic(double intervalMs, TimerTask task) override
    {
        if (intervalMs <= 0.0 || !task) return 0;
        return add(intervalMs, intervalMs, std::move(task));
    }

    TimerId scheduleOnce(double delayMs, TimerTask task) override
    {
        if (!task) return 0;
        return add(std::max(0.0, delayMs), 0.0, std::move(task));
    }

    void cancel(TimerId id) override
    {
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                      [id](const Entry& e) { return e.id == id; }),
                       entries_.end());
    }

    int pendingCount() const override { return static_cast<int>(entries_.size()); }

    /// Move the clock forward by `ms`, firing every timer that comes due.
    /// Returns the number of callbacks invoked.
    int advance(double ms)
    {
        double target = clock_.nowMs() + ms;
        int fired = 0;
        while (true)
        {
            auto next = std::min_element(entries_.begin(), entries_.end(),
                [](const Entry& a, const Entry& b) {
                    return a.due != b.due ? a.due < b.due : a.id < b.id;
                });
            if (next == entries_.end() || next->due > target)
                break;

            clock_.setMs(std::max(clock_.nowMs(), next->due));
            TimerTask task = next->task;
            if (next->interval > 0.0)
                next->due += next->interval;
            else
                entries_.erase(next);

            task();
            ++fired;
        }
        clock_.setMs(target);
        return fired;
    }

private:
    struct Entry {
        TimerId id;
        double due;
        double interval;
        TimerTask task;
    };

    TimerId add(double delayMs, double intervalMs, TimerTask task)
    {
        TimerId id = nextId_++;
        entries_.push_back({id, clock_.nowMs() + delayMs, intervalMs, std::move(task)});
        return id;
    }

    TestClock& clock_;
    std::vector<Entry> entries_;
    TimerId nextId_ = 1;
};

} // namespace deckmix
