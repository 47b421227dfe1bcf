#include <gtest/gtest.h>
#include "inkwell/typewriter/scheduler.hpp"

using namespace inkwell;
using namespace inkwell::typewriter;

// ============================================================================
// Clock Tests
// ============================================================================

TEST(ManualClockTest, AdvanceAndSet) {
    ManualClock clock;
    EXPECT_DOUBLE_EQ(clock.now_ms(), 0.0);
    clock.advance(25);
    EXPECT_DOUBLE_EQ(clock.now_ms(), 25.0);
    clock.set(1000);
    EXPECT_DOUBLE_EQ(clock.now_ms(), 1000.0);
}

TEST(SteadyClockTest, Monotonic) {
    SteadyClock clock;
    f64 first = clock.now_ms();
    f64 second = clock.now_ms();
    EXPECT_LE(first, second);
}

// ============================================================================
// Scheduler Tests
// ============================================================================

class SchedulerTest : public ::testing::Test {
protected:
    ManualClock clock;
    Scheduler scheduler{clock};
    int fired{0};

    Scheduler::Callback counter() {
        return [this] { ++fired; };
    }
};

TEST_F(SchedulerTest, FiresOnlyWhenDue) {
    scheduler.schedule(100, SuspensionKind::Delay, counter());

    ASSERT_TRUE(scheduler.next_deadline().has_value());
    EXPECT_DOUBLE_EQ(*scheduler.next_deadline(), 100.0);
    EXPECT_EQ(scheduler.pending_kind(), SuspensionKind::Delay);

    clock.advance(99);
    EXPECT_FALSE(scheduler.process());
    EXPECT_EQ(fired, 0);

    clock.advance(1);
    EXPECT_TRUE(scheduler.process());
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(scheduler.has_pending());
}

TEST_F(SchedulerTest, NegativeDelayIsImmediate) {
    scheduler.schedule(-10, SuspensionKind::Pacing, counter());
    EXPECT_TRUE(scheduler.process());
    EXPECT_EQ(fired, 1);
}

TEST_F(SchedulerTest, SingleSlotReplaces) {
    auto first = scheduler.schedule(10, SuspensionKind::Pacing, counter());
    auto second = scheduler.schedule(20, SuspensionKind::Delay, [this] { fired += 10; });

    EXPECT_NE(first, second);
    EXPECT_EQ(scheduler.pending_id(), second);

    clock.advance(20);
    EXPECT_TRUE(scheduler.process());
    EXPECT_EQ(fired, 10);
    EXPECT_FALSE(scheduler.resolve(first));
}

TEST_F(SchedulerTest, CancelDropsCallback) {
    auto id = scheduler.schedule(10, SuspensionKind::Pacing, counter());
    scheduler.cancel(id);

    clock.advance(50);
    EXPECT_FALSE(scheduler.process());
    EXPECT_EQ(fired, 0);
    EXPECT_FALSE(scheduler.has_pending());
}

TEST_F(SchedulerTest, CancelIgnoresStaleId) {
    auto stale = scheduler.schedule(10, SuspensionKind::Pacing, counter());
    scheduler.schedule(10, SuspensionKind::Pacing, counter());
    scheduler.cancel(stale);

    EXPECT_TRUE(scheduler.has_pending());
}

TEST_F(SchedulerTest, ForceResolveRunsEarly) {
    auto id = scheduler.schedule(5000, SuspensionKind::Delay, counter());

    EXPECT_TRUE(scheduler.force_resolve(id));
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(scheduler.force_resolve(id));
    EXPECT_EQ(fired, 1);
}

TEST_F(SchedulerTest, ExternalSuspensionHasNoDeadline) {
    auto id = scheduler.suspend(counter());

    EXPECT_EQ(scheduler.pending_kind(), SuspensionKind::External);
    EXPECT_TRUE(scheduler.has_pending());
    EXPECT_FALSE(scheduler.next_deadline().has_value());

    clock.advance(1e9);
    EXPECT_FALSE(scheduler.process());
    EXPECT_TRUE(scheduler.resolve(id));
    EXPECT_EQ(fired, 1);
}

TEST_F(SchedulerTest, CallbackMayScheduleNext) {
    scheduler.schedule(10, SuspensionKind::Pacing, [this] {
        ++fired;
        scheduler.schedule(10, SuspensionKind::Pacing, counter());
    });

    clock.advance(10);
    EXPECT_TRUE(scheduler.process());
    EXPECT_TRUE(scheduler.has_pending());
    EXPECT_DOUBLE_EQ(*scheduler.next_deadline(), 20.0);

    clock.advance(10);
    EXPECT_TRUE(scheduler.process());
    EXPECT_EQ(fired, 2);
}

TEST_F(SchedulerTest, CancelAll) {
    scheduler.suspend(counter());
    scheduler.cancel_all();
    EXPECT_FALSE(scheduler.has_pending());
    EXPECT_FALSE(scheduler.pending_id().has_value());
}

TEST(SuspensionKindTest, Names) {
    EXPECT_EQ(suspension_kind_name(SuspensionKind::Pacing), "pacing");
    EXPECT_EQ(suspension_kind_name(SuspensionKind::Delay), "delay");
    EXPECT_EQ(suspension_kind_name(SuspensionKind::External), "external");
}
