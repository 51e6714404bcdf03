#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "stakematch/errors.hpp"
#include "stakematch/operational_queue.hpp"

namespace {
using Clock = stakematch::OperationalQueue::Clock;
}

TEST(OperationalQueueTest, PopsOldestFirstAndStagesProcessing) {
  stakematch::InMemoryOperationalQueue queue;
  queue.Push(1000, 1);
  queue.Push(1000, 2);
  queue.Push(2000, 3);

  auto now = Clock::now();
  auto first = queue.PopAndStage(1000, now);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 1);
  EXPECT_EQ(queue.Length(1000), 1u);
  EXPECT_EQ(queue.ProcessingCount(1000), 1u);
  ASSERT_TRUE(queue.ProcessingSince(1000, 1).has_value());
  EXPECT_EQ(*queue.ProcessingSince(1000, 1), now);
  EXPECT_EQ(queue.TotalLength(), 2u);

  queue.ClearProcessing(1000, 1);
  EXPECT_FALSE(queue.ProcessingSince(1000, 1).has_value());
}

TEST(OperationalQueueTest, ListsOnlyStaleProcessingEntries) {
  stakematch::InMemoryOperationalQueue queue;
  queue.Push(1000, 1);
  queue.Push(2000, 2);
  queue.Push(2000, 3);
  auto now = Clock::now();
  queue.PopAndStage(1000, now - std::chrono::minutes(5));
  queue.PopAndStage(2000, now - std::chrono::minutes(5));
  queue.PopAndStage(2000, now);

  auto stale = queue.ListStaleProcessing(now - std::chrono::seconds(30));
  ASSERT_EQ(stale.size(), 2u);
  std::set<std::int64_t> ids;
  for (const auto& item : stale) {
    ids.insert(item.second);
    EXPECT_EQ(item.first, item.second == 1 ? 1000 : 2000);
  }
  EXPECT_EQ(ids, (std::set<std::int64_t>{1, 2}));
}

TEST(OperationalQueueTest, StakesAreIsolated) {
  stakematch::InMemoryOperationalQueue queue;
  queue.Push(2000, 9);
  EXPECT_FALSE(queue.PopAndStage(1000, Clock::now()).has_value());
  EXPECT_EQ(queue.Length(2000), 1u);
}

TEST(OperationalQueueTest, PushIgnoresDuplicates) {
  stakematch::InMemoryOperationalQueue queue;
  queue.Push(1000, 5);
  queue.Push(1000, 5);
  EXPECT_EQ(queue.Length(1000), 1u);
}

TEST(OperationalQueueTest, RequeueGivesPriorityAndClearsProcessing) {
  stakematch::InMemoryOperationalQueue queue;
  queue.Push(1000, 1);
  queue.Push(1000, 2);
  auto popped = queue.PopAndStage(1000, Clock::now());
  ASSERT_EQ(*popped, 1);
  queue.Push(1000, 3);

  queue.Requeue(1000, 1);
  EXPECT_EQ(queue.ProcessingCount(1000), 0u);
  EXPECT_EQ(*queue.PopAndStage(1000, Clock::now()), 1);
  EXPECT_EQ(*queue.PopAndStage(1000, Clock::now()), 2);
}

TEST(OperationalQueueTest, RemoveDropsWaitingEntry) {
  stakematch::InMemoryOperationalQueue queue;
  queue.Push(1000, 1);
  queue.Push(1000, 2);
  EXPECT_TRUE(queue.Remove(1000, 1));
  EXPECT_FALSE(queue.Remove(1000, 1));
  EXPECT_FALSE(queue.Remove(5000, 1));
  EXPECT_EQ(*queue.PopAndStage(1000, Clock::now()), 2);
}

TEST(OperationalQueueTest, PushAllIfEmptyOnlyFillsEmptyList) {
  stakematch::InMemoryOperationalQueue queue;
  EXPECT_TRUE(queue.PushAllIfEmpty(1000, {4, 5, 6}));
  EXPECT_FALSE(queue.PushAllIfEmpty(1000, {7}));
  EXPECT_EQ(queue.Length(1000), 3u);
  EXPECT_EQ(*queue.PopAndStage(1000, Clock::now()), 4);
  EXPECT_FALSE(queue.PushAllIfEmpty(2000, {}));
}

TEST(OperationalQueueTest, UnavailableCacheThrows) {
  stakematch::InMemoryOperationalQueue queue;
  queue.Push(1000, 1);
  queue.SetAvailable(false);
  EXPECT_THROW(queue.PopAndStage(1000, Clock::now()), stakematch::CacheUnavailableError);
  EXPECT_THROW(queue.Push(1000, 2), stakematch::CacheUnavailableError);
  EXPECT_THROW(queue.TotalLength(), stakematch::CacheUnavailableError);
  queue.SetAvailable(true);
  EXPECT_EQ(queue.Length(1000), 1u);
}

TEST(OperationalQueueTest, ConcurrentPopsNeverShareAnEntry) {
  stakematch::InMemoryOperationalQueue queue;
  for (std::int64_t id = 1; id <= 200; ++id) {
    queue.Push(1000, id);
  }
  std::vector<std::vector<std::int64_t>> taken(8);
  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < taken.size(); ++t) {
    threads.emplace_back([&, t]() {
      while (auto id = queue.PopAndStage(1000, Clock::now())) {
        taken[t].push_back(*id);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  std::set<std::int64_t> unique;
  std::size_t total = 0;
  for (const auto& ids : taken) {
    total += ids.size();
    unique.insert(ids.begin(), ids.end());
  }
  EXPECT_EQ(total, 200u);
  EXPECT_EQ(unique.size(), 200u);
}
