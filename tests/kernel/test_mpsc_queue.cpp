/**
 * @file test_mpsc_queue.cpp
 * @brief Unit tests for fwcore::MpscQueue
 */

#include "fwcore/mpsc_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

using namespace fwcore;

class MpscQueueTest : public ::testing::Test
{
protected:
   MpscQueue<int> queue;
};

/* ============================================================================
 * Single Producer
 * ========================================================================= */

TEST_F(MpscQueueTest, NewQueueIsEmpty)
{
   EXPECT_TRUE(queue.empty());
   auto result = queue.pop();
   EXPECT_TRUE(result.is_empty());
   EXPECT_FALSE(result.value.has_value());
}

TEST_F(MpscQueueTest, PopsInPushOrder)
{
   for (int i = 0; i < 5; ++i) queue.push(i);
   EXPECT_FALSE(queue.empty());

   for (int i = 0; i < 5; ++i) {
      auto result = queue.pop();
      ASSERT_TRUE(result.is_data());
      EXPECT_EQ(*result.value, i);
   }
   EXPECT_TRUE(queue.pop().is_empty());
   EXPECT_TRUE(queue.empty());
}

TEST_F(MpscQueueTest, InterleavedPushPop)
{
   // Exercises the stub being re-linked behind the last node
   for (int round = 0; round < 100; ++round) {
      queue.push(round);
      auto result = queue.pop();
      ASSERT_TRUE(result.is_data());
      EXPECT_EQ(*result.value, round);
      EXPECT_TRUE(queue.pop().is_empty());
   }
}

TEST_F(MpscQueueTest, PushAfterDrainKeepsOrder)
{
   queue.push(1);
   queue.push(2);
   EXPECT_EQ(*queue.pop().value, 1);
   queue.push(3);
   EXPECT_EQ(*queue.pop().value, 2);
   EXPECT_EQ(*queue.pop().value, 3);
   EXPECT_TRUE(queue.pop().is_empty());
}

TEST(MpscQueue, MoveOnlyElements)
{
   MpscQueue<std::unique_ptr<int>> q;
   q.push(std::make_unique<int>(7));

   auto result = q.pop();
   ASSERT_TRUE(result.is_data());
   EXPECT_EQ(**result.value, 7);
}

TEST(MpscQueue, DestructorReleasesQueuedItems)
{
   auto tracked = std::make_shared<int>(0);
   {
      MpscQueue<std::shared_ptr<int>> q;
      q.push(tracked);
      q.push(tracked);
      EXPECT_EQ(tracked.use_count(), 3);
   }
   EXPECT_EQ(tracked.use_count(), 1);
}

/* ============================================================================
 * Multiple Producers
 * ========================================================================= */

TEST(MpscQueue, ConcurrentProducersDeliverEverythingInPerProducerOrder)
{
   constexpr int PRODUCERS = 4;
   constexpr int PER_PRODUCER = 20000;

   MpscQueue<std::uint32_t> q;
   std::atomic<bool> go{false};

   std::vector<std::thread> producers;
   for (int p = 0; p < PRODUCERS; ++p) {
      producers.emplace_back([&q, &go, p] {
         while (!go.load()) {}
         for (int i = 0; i < PER_PRODUCER; ++i) {
            q.push(static_cast<std::uint32_t>(p) << 24 | static_cast<std::uint32_t>(i));
         }
      });
   }

   go.store(true);

   std::vector<int> next(PRODUCERS, 0);
   int received = 0;
   int inconsistent = 0;
   while (received < PRODUCERS * PER_PRODUCER) {
      auto result = q.pop();
      if (result.is_inconsistent()) {
         ++inconsistent;
         continue;
      }
      if (result.is_empty()) continue;

      std::uint32_t const item = *result.value;
      int const producer = static_cast<int>(item >> 24);
      int const seq      = static_cast<int>(item & 0xFFFFFF);
      ASSERT_LT(producer, PRODUCERS);
      ASSERT_EQ(seq, next[producer]) << "producer " << producer << " out of order";
      ++next[producer];
      ++received;
   }

   for (auto& t : producers) t.join();

   EXPECT_TRUE(q.pop().is_empty());
   for (int p = 0; p < PRODUCERS; ++p) EXPECT_EQ(next[p], PER_PRODUCER);
   RecordProperty("inconsistent_pops", inconsistent);
}
