/**
 * @file test_executor.cpp
 * @brief Unit tests for fwcore::Executor and idle support
 */

#include "fwcore/channel.hpp"
#include "fwcore/executor.hpp"
#include "fwcore/poll.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <vector>

using namespace fwcore;
using Turn = Executor::Turn;

/* ============================================================================
 * Test Fixtures
 * ========================================================================= */

class ExecutorTest : public ::testing::Test
{
protected:
   Executor executor;
};

/**
 * @brief Task that stays pending until `remaining` reaches zero
 *
 * Stores its waker so the test can play the role of an ISR.
 */
struct ManualTask
{
   int*                   polls;
   int*                   remaining;
   std::optional<Waker>*  parked;

   Poll<Unit> poll(Waker const& waker)
   {
      ++*polls;
      if (*remaining == 0) return Unit{};
      --*remaining;
      *parked = waker;
      return Pending;
   }
};

/* ============================================================================
 * Spawning and Completion
 * ========================================================================= */

TEST_F(ExecutorTest, EmptyExecutorReportsEmpty)
{
   EXPECT_EQ(executor.run(), Turn::Empty);
   EXPECT_EQ(executor.task_count(), 0u);
}

TEST_F(ExecutorTest, SpawnedTaskIsPolledOnNextTurn)
{
   int polls = 0;
   executor.spawn(poll_fn([&polls](Waker const&) -> Poll<Unit> { ++polls; return Unit{}; }));

   EXPECT_EQ(polls, 0);
   EXPECT_EQ(executor.task_count(), 1u);

   EXPECT_EQ(executor.run(), Turn::Completed);
   EXPECT_EQ(polls, 1);
   EXPECT_EQ(executor.task_count(), 0u);
   EXPECT_EQ(executor.run(), Turn::Empty);
}

TEST_F(ExecutorTest, TaskIdsAreFreshAndIncreasing)
{
   auto noop = [] { return poll_fn([](Waker const&) -> Poll<Unit> { return Unit{}; }); };

   TaskId const a = executor.spawn(noop());
   TaskId const b = executor.spawn(noop());

   EXPECT_LT(a, b);
   EXPECT_TRUE(executor.contains(a));
   executor.run_until_idle();
   EXPECT_FALSE(executor.contains(a));
   EXPECT_FALSE(executor.contains(b));
}

TEST_F(ExecutorTest, FirstPollFollowsSpawnOrder)
{
   std::vector<int> order;
   for (int i = 0; i < 4; ++i) {
      executor.spawn(poll_fn([&order, i](Waker const&) -> Poll<Unit> {
         order.push_back(i);
         return Unit{};
      }));
   }

   EXPECT_EQ(executor.run_until_idle(), 4u);
   EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(ExecutorTest, TaskOutputIsDiscarded)
{
   executor.spawn(poll_fn([](Waker const&) -> Poll<int> { return 42; }));
   EXPECT_EQ(executor.run(), Turn::Completed);
}

/* ============================================================================
 * Waking
 * ========================================================================= */

TEST_F(ExecutorTest, PendingTaskIsNotPolledUntilWoken)
{
   int polls = 0;
   int remaining = 1;
   std::optional<Waker> parked;
   executor.spawn(ManualTask{&polls, &remaining, &parked});

   EXPECT_EQ(executor.run(), Turn::Polled);
   EXPECT_EQ(executor.run(), Turn::Empty);
   EXPECT_EQ(polls, 1);

   ASSERT_TRUE(parked.has_value());
   parked->wake();

   EXPECT_EQ(executor.run(), Turn::Completed);
   EXPECT_EQ(polls, 2);
}

TEST_F(ExecutorTest, RepeatedWakesQueueTaskOnce)
{
   int polls = 0;
   int remaining = 2;
   std::optional<Waker> parked;
   executor.spawn(ManualTask{&polls, &remaining, &parked});
   executor.run();

   parked->wake();
   parked->wake();
   parked->wake();

   EXPECT_EQ(executor.run(), Turn::Polled);
   EXPECT_EQ(executor.run(), Turn::Empty);
   EXPECT_EQ(polls, 2);
}

TEST_F(ExecutorTest, WakeDuringPollSchedulesExactlyOneMorePoll)
{
   int polls = 0;
   executor.spawn(poll_fn([&polls](Waker const& waker) -> Poll<Unit> {
      ++polls;
      if (polls == 1) {
         waker.wake();
         waker.wake();
         return Pending;
      }
      return Unit{};
   }));

   EXPECT_EQ(executor.run(), Turn::Polled);
   EXPECT_EQ(executor.run(), Turn::Completed);
   EXPECT_EQ(executor.run(), Turn::Empty);
   EXPECT_EQ(polls, 2);
}

TEST_F(ExecutorTest, SelfWakeGoesToTailOfQueue)
{
   std::vector<char> order;
   int a_polls = 0;
   executor.spawn(poll_fn([&](Waker const& waker) -> Poll<Unit> {
      order.push_back('a');
      if (++a_polls < 3) {
         waker.wake();
         return Pending;
      }
      return Unit{};
   }));
   executor.spawn(poll_fn([&](Waker const&) -> Poll<Unit> {
      order.push_back('b');
      return Unit{};
   }));

   executor.run_until_idle();
   EXPECT_EQ(order, (std::vector<char>{'a', 'b', 'a', 'a'}));
}

TEST_F(ExecutorTest, WakeThenCompleteLeavesStaleEntry)
{
   executor.spawn(poll_fn([](Waker const& waker) -> Poll<Unit> {
      waker.wake();
      return Unit{};
   }));

   EXPECT_EQ(executor.run(), Turn::Completed);
   EXPECT_EQ(executor.run(), Turn::Stale);
   EXPECT_EQ(executor.run(), Turn::Empty);
}

TEST_F(ExecutorTest, WakerOfCompletedTaskIsNoop)
{
   int polls = 0;
   int remaining = 1;
   std::optional<Waker> parked;
   executor.spawn(ManualTask{&polls, &remaining, &parked});
   executor.run();
   parked->wake();
   EXPECT_EQ(executor.run(), Turn::Completed);

   parked->wake();
   EXPECT_EQ(executor.run(), Turn::Empty);
}

TEST_F(ExecutorTest, TaskCanSpawnTasks)
{
   int child_polls = 0;
   executor.spawn(poll_fn([&](Waker const&) -> Poll<Unit> {
      executor.spawn(poll_fn([&child_polls](Waker const&) -> Poll<Unit> {
         ++child_polls;
         return Unit{};
      }));
      return Unit{};
   }));

   EXPECT_EQ(executor.run_until_idle(), 2u);
   EXPECT_EQ(child_polls, 1);
}

TEST(Executor, WakerOutlivingExecutorIsHarmless)
{
   std::optional<Waker> parked;
   {
      Executor executor;
      int polls = 0;
      int remaining = 1;
      executor.spawn(ManualTask{&polls, &remaining, &parked});
      executor.run();
   }
   ASSERT_TRUE(parked.has_value());
   parked->wake();
}

/* ============================================================================
 * Idle Task
 * ========================================================================= */

TEST_F(ExecutorTest, IdleTaskPolledOnlyWhenQueueEmpty)
{
   int idle_polls = 0;
   executor.set_idle_task(poll_fn([&idle_polls](Waker const&) -> Poll<Unit> {
      ++idle_polls;
      return Pending;
   }));
   executor.spawn(poll_fn([](Waker const&) -> Poll<Unit> { return Unit{}; }));

   EXPECT_EQ(executor.run(), Turn::Completed);
   EXPECT_EQ(idle_polls, 0);

   EXPECT_EQ(executor.run(), Turn::Idle);
   EXPECT_EQ(executor.run(), Turn::Idle);
   EXPECT_EQ(idle_polls, 2);
}

TEST_F(ExecutorTest, IdleTaskIsPolledWithNoopWaker)
{
   bool saw_noop = false;
   executor.set_idle_task(poll_fn([&saw_noop](Waker const& waker) -> Poll<Unit> {
      saw_noop = waker.is_noop();
      return Pending;
   }));

   executor.run();
   EXPECT_TRUE(saw_noop);
}

TEST_F(ExecutorTest, CompletedIdleTaskIsDropped)
{
   executor.set_idle_task(poll_fn([](Waker const&) -> Poll<Unit> { return Unit{}; }));
   ASSERT_TRUE(executor.has_idle_task());

   EXPECT_EQ(executor.run(), Turn::Idle);
   EXPECT_FALSE(executor.has_idle_task());
   EXPECT_EQ(executor.run(), Turn::Empty);
}

TEST_F(ExecutorTest, RunUntilIdleDoesNotPollIdleTask)
{
   int idle_polls = 0;
   executor.set_idle_task(poll_fn([&idle_polls](Waker const&) -> Poll<Unit> {
      ++idle_polls;
      return Pending;
   }));

   EXPECT_EQ(executor.run_until_idle(), 0u);
   EXPECT_EQ(idle_polls, 0);
}

/* ============================================================================
 * IdleStream
 * ========================================================================= */

TEST_F(ExecutorTest, IdleStreamResumesTaskOnceQueueDrains)
{
   auto [idle_tx, idle_rx] = unbounded<Waker>();
   executor.set_idle_task(IdleWakerTask(std::move(idle_rx)));

   std::vector<const char*> log;

   // Background task: does one step of work each time the CPU is idle
   executor.spawn(poll_fn([&log, stream = IdleStream(idle_tx), steps = 0](Waker const& waker) mutable -> Poll<Unit> {
      for (;;) {
         auto ready = stream.poll_next(waker);
         if (ready.is_pending()) return Pending;
         log.push_back("background");
         if (++steps == 2) return Unit{};
      }
   }));

   // Foreground task: three turns of busy work
   executor.spawn(poll_fn([&log, turns = 0](Waker const& waker) mutable -> Poll<Unit> {
      log.push_back("foreground");
      if (++turns == 3) return Unit{};
      waker.wake();
      return Pending;
   }));

   // Both tasks run, background parks on the idle stream
   for (int i = 0; i < 20 && executor.task_count() > 0; ++i) {
      executor.run();
   }

   EXPECT_EQ(executor.task_count(), 0u);
   ASSERT_EQ(log.size(), 5u);
   EXPECT_STREQ(log[0], "foreground");
   EXPECT_STREQ(log[1], "foreground");
   EXPECT_STREQ(log[2], "foreground");
   EXPECT_STREQ(log[3], "background");
   EXPECT_STREQ(log[4], "background");
}

TEST(IdleStream, AlternatesPendingAndReady)
{
   auto [tx, rx] = unbounded<Waker>();
   IdleStream stream(tx);

   EXPECT_TRUE(stream.poll_next(Waker::noop()).is_pending());
   auto ready = stream.poll_next(Waker::noop());
   ASSERT_TRUE(ready.is_ready());
   EXPECT_TRUE(ready.get().has_value());
   EXPECT_TRUE(stream.poll_next(Waker::noop()).is_pending());

   // One waker parked per Pending
   int received = 0;
   while (rx.poll_next(Waker::noop()).is_ready()) ++received;
   EXPECT_EQ(received, 2);
}
