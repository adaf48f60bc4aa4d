/**
 * LoopScheduler tests
 *
 * - Due tasks run in deadline order, FIFO for equal deadlines
 * - Cancellation, also from within a running task
 * - Tasks scheduled while running wait for the next runDue()
 */

#include <burn/loop_scheduler.hpp>
#include <unity.h>
#include <chrono>
#include <functional>
#include <vector>

using namespace burn;
using namespace std::chrono_literals;

void setUp(void)
{
}

void tearDown(void)
{
}

void test_runs_only_due_tasks_in_deadline_order()
{
    LoopScheduler scheduler;
    const auto now = LoopScheduler::Clock::now();
    std::vector<int> order;
    scheduler.scheduleAt(now + 20ms, [&order] { order.push_back(2); });
    scheduler.scheduleAt(now + 10ms, [&order] { order.push_back(1); });
    scheduler.scheduleAt(now + 30ms, [&order] { order.push_back(3); });

    TEST_ASSERT_EQUAL_INT(0, scheduler.runDue(now));
    TEST_ASSERT_EQUAL_INT(2, scheduler.runDue(now + 20ms));
    TEST_ASSERT_TRUE(order == (std::vector<int>{1, 2}));
    TEST_ASSERT_EQUAL_UINT(1, scheduler.pending());
    TEST_ASSERT_TRUE(scheduler.nextDeadline() == now + 30ms);

    TEST_ASSERT_EQUAL_INT(1, scheduler.runDue(now + 1s));
    TEST_ASSERT_TRUE(order == (std::vector<int>{1, 2, 3}));
    TEST_ASSERT_FALSE(scheduler.nextDeadline());
}

void test_equal_deadlines_run_in_scheduling_order()
{
    LoopScheduler scheduler;
    const auto now = LoopScheduler::Clock::now();
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        scheduler.scheduleAt(now, [&order, i] { order.push_back(i); });
    }
    scheduler.runDue(now);
    const int expected[] = {0, 1, 2, 3, 4};
    TEST_ASSERT_EQUAL_UINT(5, order.size());
    TEST_ASSERT_EQUAL_INT_ARRAY(expected, order.data(), 5);
}

void test_cancelled_tasks_never_run()
{
    LoopScheduler scheduler;
    int runs = 0;
    const auto id = scheduler.scheduleAfter(0ms, [&runs] { ++runs; });
    TEST_ASSERT_TRUE(id != Scheduler::kInvalidTask);
    TEST_ASSERT_TRUE(scheduler.cancel(id));
    TEST_ASSERT_FALSE(scheduler.cancel(id));
    TEST_ASSERT_EQUAL_INT(0, scheduler.runDue(LoopScheduler::Clock::now() + 1s));
    TEST_ASSERT_EQUAL_INT(0, runs);
}

void test_cancel_unknown_task()
{
    LoopScheduler scheduler;
    TEST_ASSERT_FALSE(scheduler.cancel(Scheduler::kInvalidTask));
    TEST_ASSERT_FALSE(scheduler.cancel(1234));
}

void test_tasks_scheduled_while_running_wait_for_the_next_call()
{
    LoopScheduler scheduler;
    int runs = 0;
    std::function<void()> repeat = [&] {
        ++runs;
        scheduler.scheduleAfter(0ms, repeat);
    };
    scheduler.scheduleAfter(0ms, repeat);

    const auto later = LoopScheduler::Clock::now() + 1h;
    TEST_ASSERT_EQUAL_INT(1, scheduler.runDue(later));
    TEST_ASSERT_EQUAL_INT(1, scheduler.runDue(later));
    TEST_ASSERT_EQUAL_INT(2, runs);
    TEST_ASSERT_EQUAL_UINT(1, scheduler.pending());
}

void test_task_can_cancel_another_task()
{
    LoopScheduler scheduler;
    const auto now = LoopScheduler::Clock::now();
    int runs = 0;
    Scheduler::TaskId second = Scheduler::kInvalidTask;
    scheduler.scheduleAt(now, [&] { scheduler.cancel(second); });
    second = scheduler.scheduleAt(now + 1ms, [&runs] { ++runs; });

    TEST_ASSERT_EQUAL_INT(1, scheduler.runDue(now + 1s));
    TEST_ASSERT_EQUAL_INT(0, runs);
    TEST_ASSERT_EQUAL_UINT(0, scheduler.pending());
}

void test_negative_delay_is_due_immediately()
{
    LoopScheduler scheduler;
    int runs = 0;
    scheduler.scheduleAfter(-5ms, [&runs] { ++runs; });
    TEST_ASSERT_EQUAL_INT(1, scheduler.runDue());
    TEST_ASSERT_EQUAL_INT(1, runs);
}

int main()
{
    UNITY_BEGIN();

    RUN_TEST(test_runs_only_due_tasks_in_deadline_order);
    RUN_TEST(test_equal_deadlines_run_in_scheduling_order);
    RUN_TEST(test_cancelled_tasks_never_run);
    RUN_TEST(test_cancel_unknown_task);
    RUN_TEST(test_tasks_scheduled_while_running_wait_for_the_next_call);
    RUN_TEST(test_task_can_cancel_another_task);
    RUN_TEST(test_negative_delay_is_due_immediately);

    return UNITY_END();
}
