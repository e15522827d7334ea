#include <catch2/catch_test_macros.hpp>

#include "core/TestTimerService.h"
#include "core/TimerService.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace deckmix;

// ═══════════════════════════════════════════════════════════════════
// Test helper: thread-safe counter
// ═══════════════════════════════════════════════════════════════════

struct FireCounter {
    std::mutex mutex;
    std::condition_variable cv;
    int count = 0;

    void hit()
    {
        std::lock_guard<std::mutex> lock(mutex);
        ++count;
        cv.notify_all();
    }

    bool waitFor(int n, int timeoutMs = 1000)
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                           [&] { return count >= n; });
    }

    int get()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return count;
    }
};

// ═══════════════════════════════════════════════════════════════════
// ThreadTimerService
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("ThreadTimerService returns distinct non-zero ids")
{
    ThreadTimerService timers;
    TimerId a = timers.scheduleOnce(1000, [] {});
    TimerId b = timers.schedulePeriodic(1000, [] {});
    CHECK(a != 0);
    CHECK(b != 0);
    CHECK(a != b);
    CHECK(timers.pendingCount() == 2);
}

TEST_CASE("ThreadTimerService rejects invalid requests")
{
    ThreadTimerService timers;
    CHECK(timers.schedulePeriodic(0, [] {}) == 0);
    CHECK(timers.schedulePeriodic(10, nullptr) == 0);
    CHECK(timers.scheduleOnce(10, nullptr) == 0);
    timers.cancel(0);
    CHECK(timers.pendingCount() == 0);
}

TEST_CASE("One-shot timer fires once on the worker thread")
{
    ThreadTimerService timers;
    FireCounter counter;
    std::atomic<bool> onWorker{false};

    timers.scheduleOnce(5, [&] {
        onWorker = timers.isWorkerThread();
        counter.hit();
    });

    REQUIRE(counter.waitFor(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK(counter.get() == 1);
    CHECK(onWorker.load());
    CHECK(timers.pendingCount() == 0);
}

TEST_CASE("Periodic timer keeps firing until cancelled")
{
    ThreadTimerService timers;
    FireCounter counter;

    TimerId id = timers.schedulePeriodic(5, [&] { counter.hit(); });
    REQUIRE(counter.waitFor(3));

    timers.cancel(id);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    int after = counter.get();
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    CHECK(counter.get() == after);
}

TEST_CASE("Cancelled one-shot never fires")
{
    ThreadTimerService timers;
    FireCounter counter;

    TimerId id = timers.scheduleOnce(30, [&] { counter.hit(); });
    timers.cancel(id);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    CHECK(counter.get() == 0);
}

TEST_CASE("A throwing task does not stop the worker")
{
    ThreadTimerService timers;
    FireCounter counter;

    timers.scheduleOnce(1, [] { throw std::runtime_error("boom"); });
    timers.scheduleOnce(10, [&] { counter.hit(); });
    REQUIRE(counter.waitFor(1));
}

TEST_CASE("A task may cancel and schedule timers")
{
    ThreadTimerService timers;
    FireCounter counter;

    std::atomic<TimerId> periodic{0};
    periodic = timers.schedulePeriodic(5, [&] {
        timers.cancel(periodic.load());
        timers.scheduleOnce(1, [&] { counter.hit(); });
    });
    REQUIRE(counter.waitFor(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK(counter.get() == 1);
}

TEST_CASE("shutdown drops pending timers and refuses new ones")
{
    ThreadTimerService timers;
    FireCounter counter;

    timers.scheduleOnce(20, [&] { counter.hit(); });
    timers.shutdown();
    CHECK(timers.pendingCount() == 0);
    CHECK(timers.scheduleOnce(1, [&] { counter.hit(); }) == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    CHECK(counter.get() == 0);
}

// ═══════════════════════════════════════════════════════════════════
// TestTimerService
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("TestTimerService fires in due order with the clock at each due time")
{
    TestClock clock;
    TestTimerService timers(clock);
    std::vector<std::pair<int, double>> fired;

    timers.scheduleOnce(30, [&] { fired.push_back({1, clock.nowMs()}); });
    timers.scheduleOnce(10, [&] { fired.push_back({2, clock.nowMs()}); });
    timers.schedulePeriodic(20, [&] { fired.push_back({3, clock.nowMs()}); });

    CHECK(timers.advance(45) == 4);
    REQUIRE(fired.size() == 4);
    CHECK(fired[0] == std::make_pair(2, 10.0));
    CHECK(fired[1] == std::make_pair(3, 20.0));
    CHECK(fired[2] == std::make_pair(1, 30.0));
    CHECK(fired[3] == std::make_pair(3, 40.0));
    CHECK(clock.nowMs() == 45.0);
    CHECK(timers.pendingCount() == 1);
}

TEST_CASE("TestTimerService runs timers scheduled by a firing task in the same advance")
{
    TestClock clock;
    TestTimerService timers(clock);
    int inner = 0;

    timers.scheduleOnce(10, [&] { timers.scheduleOnce(5, [&] { ++inner; }); });
    timers.advance(20);
    CHECK(inner == 1);
}

TEST_CASE("TestTimerService cancel removes pending entries")
{
    TestClock clock;
    TestTimerService timers(clock);
    int hits = 0;

    TimerId id = timers.schedulePeriodic(10, [&] { ++hits; });
    timers.advance(25);
    CHECK(hits == 2);

    timers.cancel(id);
    timers.advance(100);
    CHECK(hits == 2);
    CHECK(timers.pendingCount() == 0);
}
