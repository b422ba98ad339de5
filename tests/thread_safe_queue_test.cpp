// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for oms::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO semantics for pop_for() and drain()
//   - drain() on empty and non-empty queues
//   - pop_for() timeout and wakeup paths
//   - Thread-safety under concurrent multi-producer / multi-consumer load
//
// Threading model:
//   Threads spawned by a test are joined before its assertions.
// =============================================================================

#include "oms/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  oms::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A newly constructed queue reports itself as empty.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Items come back in FIFO order.
// Why: broker events for one order are applied in arrival order only if the
//      reconciler queue never reorders them.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), static_cast<std::size_t>(kCount));

  for (int i = 0; i < kCount / 2; ++i) {
    EXPECT_EQ(queue.pop_for(std::chrono::milliseconds(0)), i)
        << "FIFO violated at index " << i;
  }
  const std::vector<int> rest = queue.drain();
  ASSERT_EQ(rest.size(), static_cast<std::size_t>(kCount / 2));
  for (int i = 0; i < kCount / 2; ++i) {
    EXPECT_EQ(rest[i], kCount / 2 + i) << "FIFO violated in drain at " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. drain() returns nothing on an empty queue and leaves the queue usable.
// Why: EventReconciler::stop() drains unconditionally.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainEmptyThenReuse) {
  EXPECT_TRUE(queue.drain().empty());

  queue.push(99);
  const std::vector<int> taken = queue.drain();
  ASSERT_EQ(taken.size(), 1u);
  EXPECT_EQ(taken[0], 99);
  EXPECT_TRUE(queue.empty());

  queue.push(100);
  EXPECT_EQ(queue.size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. pop_for() on an empty queue gives up after the timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  const auto started = std::chrono::steady_clock::now();
  std::optional<int> result = queue.pop_for(std::chrono::milliseconds(20));
  const auto waited = std::chrono::steady_clock::now() - started;

  EXPECT_FALSE(result.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(15));
}

// -----------------------------------------------------------------------------
// 5. pop_for() wakes up when another thread pushes.
// Why: the reconciler waits in pop_for(); a missing notify would delay
//      every broker event by a full timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] {
    if (auto v = queue.pop_for(std::chrono::seconds(2))) {
      received.store(*v);
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 6. Move-only payloads are supported.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueMoveOnly, UniquePtrRoundTrip) {
  oms::ThreadSafeQueue<std::unique_ptr<std::string>> q;
  q.push(std::make_unique<std::string>("ack"));

  q.push(std::make_unique<std::string>("fill"));

  auto first = q.pop_for(std::chrono::milliseconds(0));
  ASSERT_TRUE(first.has_value());
  ASSERT_NE(*first, nullptr);
  EXPECT_EQ(**first, "ack");

  auto rest = q.drain();
  ASSERT_EQ(rest.size(), 1u);
  EXPECT_EQ(*rest[0], "fill");
}

// -----------------------------------------------------------------------------
// 7. Concurrent multi-producer, multi-consumer stress test.
// How: 4 producers push disjoint ranges, 4 consumers drain. Every value must
//      be popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);

  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        if (auto item = queue.pop_for(std::chrono::milliseconds(1))) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
