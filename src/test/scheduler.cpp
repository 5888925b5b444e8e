#include <gtest/gtest.h>

#include "common/scheduler.hpp"

#include <stdexcept>

using namespace masterlist;
using namespace std::chrono_literals;

TEST(Scheduler, RunsImmediatelyThenEveryInterval) {
    ManualClock clock;
    Scheduler scheduler(clock);
    int runs = 0;
    scheduler.scheduleEvery("tick", 1000ms, [&] { ++runs; });

    EXPECT_EQ(scheduler.update(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(scheduler.update(), 0u);

    clock.advance(999ms);
    scheduler.update();
    EXPECT_EQ(runs, 1);

    clock.advance(1ms);
    scheduler.update();
    EXPECT_EQ(runs, 2);
}

TEST(Scheduler, DelayedStart) {
    ManualClock clock;
    Scheduler scheduler(clock);
    int runs = 0;
    scheduler.scheduleEvery("later", 500ms, [&] { ++runs; }, false);

    scheduler.update();
    EXPECT_EQ(runs, 0);
    ASSERT_TRUE(scheduler.nextDue().has_value());
    EXPECT_EQ(*scheduler.nextDue(), clock.now() + 500ms);

    clock.advance(500ms);
    scheduler.update();
    EXPECT_EQ(runs, 1);
}

TEST(Scheduler, MissedIntervalsCollapse) {
    ManualClock clock;
    Scheduler scheduler(clock);
    int runs = 0;
    scheduler.scheduleEvery("tick", 100ms, [&] { ++runs; });
    scheduler.update();

    clock.advance(1s);
    EXPECT_EQ(scheduler.update(), 1u);
    EXPECT_EQ(runs, 2);
    EXPECT_EQ(*scheduler.nextDue(), clock.now() + 100ms);
}

TEST(Scheduler, CancelStopsTask) {
    ManualClock clock;
    Scheduler scheduler(clock);
    int runs = 0;
    TaskHandle handle = scheduler.scheduleEvery("tick", 100ms, [&] { ++runs; });
    EXPECT_TRUE(handle.active());

    TaskHandle copy = handle;
    copy.cancel();
    EXPECT_FALSE(handle.active());
    EXPECT_EQ(scheduler.activeTaskCount(), 0u);

    scheduler.update();
    EXPECT_EQ(runs, 0);
    EXPECT_FALSE(scheduler.nextDue().has_value());

    TaskHandle empty;
    empty.cancel();
    EXPECT_FALSE(empty.active());
}

TEST(Scheduler, ThrowingTaskKeepsSchedule) {
    ManualClock clock;
    Scheduler scheduler(clock);
    int failures = 0;
    int others = 0;
    scheduler.scheduleEvery("fails", 100ms, [&] {
        ++failures;
        throw std::runtime_error("boom");
    });
    scheduler.scheduleEvery("other", 100ms, [&] { ++others; });

    EXPECT_EQ(scheduler.update(), 2u);
    clock.advance(100ms);
    EXPECT_EQ(scheduler.update(), 2u);
    EXPECT_EQ(failures, 2);
    EXPECT_EQ(others, 2);
}
