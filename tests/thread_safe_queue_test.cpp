// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for quorum::ThreadSafeQueue<T>, quorum::CancellationToken and
// quorum::OrderIdGenerator, the primitives every thread boundary relies on.
//
// Validates:
//   - FIFO semantics across push / pop / try_pop / drain
//   - pop_for() timing out, and wake() interrupting a blocked consumer
//   - Exactly-once delivery under multi-producer / multi-consumer load
//   - CancellationToken waits end early on cancel, shared across copies
//   - OrderIdGenerator hands out unique ids across threads
// =============================================================================

#include "quorum/concurrent/cancellation_token.hpp"
#include "quorum/concurrent/order_id_generator.hpp"
#include "quorum/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <set>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  quorum::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesFifoOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopReturnsNulloptWhenEmpty) {
  EXPECT_FALSE(queue.try_pop().has_value());
  queue.push(7);
  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 7);
}

// -----------------------------------------------------------------------------
// 3. pop_for() on an empty queue returns nullopt after roughly the timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOut) {
  const auto start = std::chrono::steady_clock::now();
  auto item = queue.pop_for(30ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(item.has_value());
  EXPECT_GE(elapsed, 25ms);
}

// -----------------------------------------------------------------------------
// 4. wake() releases a consumer blocked in pop_for() long before its timeout.
// Event loop stop() depends on this to join promptly.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, WakeInterruptsPopFor) {
  std::atomic<bool> returned{false};
  const auto start = std::chrono::steady_clock::now();

  std::thread consumer([this, &returned] {
    auto item = queue.pop_for(5s);
    EXPECT_FALSE(item.has_value());
    returned.store(true);
  });

  std::this_thread::sleep_for(20ms);
  queue.wake();
  consumer.join();

  EXPECT_TRUE(returned.load());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

// -----------------------------------------------------------------------------
// 5. drain() empties the queue and returns everything in order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainReturnsAllItemsInOrder) {
  queue.push(1);
  queue.push(2);
  queue.push(3);

  std::vector<int> drained = queue.drain();

  EXPECT_EQ(drained, (std::vector<int>{1, 2, 3}));
  EXPECT_TRUE(queue.empty());
  EXPECT_TRUE(queue.drain().empty());
}

// -----------------------------------------------------------------------------
// 6. Concurrent producers and consumers: every item delivered exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 3;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotal = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kItemsPerProducer; ++i) {
        queue.push(p * kItemsPerProducer + i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotal) {
        if (auto item = queue.pop_for(5ms)) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());
  ASSERT_EQ(static_cast<int>(all.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}

// =============================================================================
// CancellationToken
// =============================================================================

// -----------------------------------------------------------------------------
// 7. waitFor() returns false when the full duration elapses.
// -----------------------------------------------------------------------------
TEST(CancellationTokenTest, WaitForElapsesWithoutCancel) {
  quorum::CancellationToken token;
  EXPECT_FALSE(token.isCancelled());
  EXPECT_FALSE(token.waitFor(10ms));
}

// -----------------------------------------------------------------------------
// 8. A cancel from another copy ends a long wait immediately.
// -----------------------------------------------------------------------------
TEST(CancellationTokenTest, CancelFromCopyInterruptsWait) {
  quorum::CancellationToken token;
  quorum::CancellationToken copy = token;

  const auto start = std::chrono::steady_clock::now();
  std::thread canceller([copy] {
    std::this_thread::sleep_for(20ms);
    copy.requestCancel();
  });

  EXPECT_TRUE(token.waitFor(10s));
  canceller.join();

  EXPECT_TRUE(token.isCancelled());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  // Already cancelled: subsequent waits return at once.
  EXPECT_TRUE(token.waitFor(10s));
}

// =============================================================================
// OrderIdGenerator
// =============================================================================

// -----------------------------------------------------------------------------
// 9. Ids are unique and monotonically allocated across threads.
// -----------------------------------------------------------------------------
TEST(OrderIdGeneratorTest, UniqueAcrossThreads) {
  quorum::OrderIdGenerator ids(100);
  EXPECT_EQ(ids.next_id(), 100u);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;
  std::vector<std::vector<quorum::domain::OrderId>> seen(kThreads);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&ids, &seen, t] {
      for (int i = 0; i < kPerThread; ++i) {
        seen[t].push_back(ids.next_id());
      }
    });
  }
  for (auto& w : workers) w.join();

  std::set<quorum::domain::OrderId> unique;
  for (const auto& v : seen) {
    unique.insert(v.begin(), v.end());
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*unique.begin(), 101u);
}
