#include <gtest/gtest.h>

#include "scribe/edit/timer_queue.hpp"

#include <chrono>
#include <string>
#include <vector>

using scribe::edit::PendingTimer;
using scribe::edit::TimerId;
using scribe::edit::TimerQueue;

using namespace std::chrono_literals;

namespace
{

struct ManualClock
{
    TimerQueue::Clock::time_point now{};

    TimerQueue::NowFunction function()
    {
        return [this] { return now; };
    }
};

} // namespace

TEST(TimerQueue, RunsOnlyDueTasks)
{
    ManualClock clock;
    TimerQueue queue(clock.function());
    std::vector<std::string> ran;

    queue.schedule(100ms, [&] { ran.push_back("late"); });
    queue.schedule(10ms, [&] { ran.push_back("early"); });

    EXPECT_EQ(queue.runDue(), 0u);
    clock.now += 50ms;
    EXPECT_EQ(queue.runDue(), 1u);
    clock.now += 50ms;
    EXPECT_EQ(queue.runDue(), 1u);

    EXPECT_EQ(ran, (std::vector<std::string>{"early", "late"}));
    EXPECT_EQ(queue.pendingCount(), 0u);
}

TEST(TimerQueue, SameDeadlineKeepsSchedulingOrder)
{
    ManualClock clock;
    TimerQueue queue(clock.function());
    std::vector<int> ran;

    for (int i = 0; i < 4; ++i)
        queue.schedule(5ms, [&ran, i] { ran.push_back(i); });

    clock.now += 5ms;
    EXPECT_EQ(queue.runDue(), 4u);
    EXPECT_EQ(ran, (std::vector<int>{0, 1, 2, 3}));
}

TEST(TimerQueue, CancelledTasksNeverRun)
{
    ManualClock clock;
    TimerQueue queue(clock.function());
    bool ran = false;

    TimerId id = queue.schedule(1ms, [&] { ran = true; });
    EXPECT_TRUE(queue.isPending(id));
    EXPECT_TRUE(queue.cancel(id));
    EXPECT_FALSE(queue.cancel(id));
    EXPECT_FALSE(queue.isPending(id));

    clock.now += 1s;
    EXPECT_EQ(queue.runDue(), 0u);
    EXPECT_FALSE(ran);
}

TEST(TimerQueue, ReportsNextDeadline)
{
    ManualClock clock;
    TimerQueue queue(clock.function());
    EXPECT_FALSE(queue.nextDeadline());

    queue.schedule(30ms, [] {});
    queue.schedule(20ms, [] {});
    ASSERT_TRUE(queue.nextDeadline());
    EXPECT_EQ(*queue.nextDeadline(), clock.now + 20ms);
}

TEST(TimerQueue, TasksMayScheduleFollowUps)
{
    ManualClock clock;
    TimerQueue queue(clock.function());
    int count = 0;

    queue.schedule(0ms, [&] {
        ++count;
        queue.schedule(0ms, [&] { ++count; });
    });

    EXPECT_EQ(queue.runDue(), 2u);
    EXPECT_EQ(count, 2);
}

TEST(PendingTimer, ArmingReplacesPreviousShot)
{
    ManualClock clock;
    TimerQueue queue(clock.function());
    PendingTimer timer(queue);
    std::vector<std::string> ran;

    timer.arm(100ms, [&] { ran.push_back("first"); });
    clock.now += 60ms;
    timer.arm(100ms, [&] { ran.push_back("second"); });
    EXPECT_EQ(queue.pendingCount(), 1u);

    clock.now += 60ms;
    queue.runDue();
    EXPECT_TRUE(ran.empty());
    EXPECT_TRUE(timer.isArmed());

    clock.now += 40ms;
    queue.runDue();
    EXPECT_EQ(ran, (std::vector<std::string>{"second"}));
    EXPECT_FALSE(timer.isArmed());
}

TEST(PendingTimer, IsDisarmedInsideItsTask)
{
    ManualClock clock;
    TimerQueue queue(clock.function());
    PendingTimer timer(queue);
    bool armedDuringTask = true;

    timer.arm(0ms, [&] { armedDuringTask = timer.isArmed(); });
    queue.runDue();
    EXPECT_FALSE(armedDuringTask);
}

TEST(PendingTimer, DestructionCancels)
{
    ManualClock clock;
    TimerQueue queue(clock.function());
    bool ran = false;
    {
        PendingTimer timer(queue);
        timer.arm(1ms, [&] { ran = true; });
    }
    EXPECT_EQ(queue.pendingCount(), 0u);
    clock.now += 1s;
    queue.runDue();
    EXPECT_FALSE(ran);
}
