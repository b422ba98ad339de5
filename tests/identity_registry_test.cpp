// =============================================================================
// identity_registry_test.cpp
// =============================================================================
// Unit tests for oms::IdentityRegistry.
//
// Validates:
//   - allocate() is monotonic and collision-free across threads
//   - seed() raises the allocation floor and never lowers it
//   - bind() is idempotent and refuses conflicting bindings both ways
//   - Unbound events are parked, released once bound and expired after the
//     buffer window
// =============================================================================

#include "oms/identity/identity_registry.hpp"
#include "oms/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

class IdentityRegistryTest : public ::testing::Test {
 protected:
  oms::SimulationTimeProvider clock{10'000};
  oms::IdentityRegistry registry{clock, std::chrono::milliseconds(2000)};

  static oms::BrokerEvent ack(oms::domain::BrokerOrderId bid) {
    return oms::BrokerAck{bid, std::nullopt, 0};
  }
};

// -----------------------------------------------------------------------------
// 1. Ids start at 1 and increase by one.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, AllocateIsMonotonic) {
  EXPECT_EQ(registry.allocate(), 1);
  EXPECT_EQ(registry.allocate(), 2);
  EXPECT_EQ(registry.allocate(), 3);
}

// -----------------------------------------------------------------------------
// 2. seed() moves the floor past the highest stored id, never backwards.
// Why: ids must not be reused after a restart that restored the ledger.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, SeedRaisesFloorOnly) {
  registry.seed(41);
  EXPECT_EQ(registry.allocate(), 42);

  registry.seed(10);
  EXPECT_EQ(registry.allocate(), 43);
}

// -----------------------------------------------------------------------------
// 3. Concurrent allocation: 8 threads x 500 ids, all distinct.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, ConcurrentAllocateHasNoCollisions) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 500;

  std::mutex mutex;
  std::vector<oms::domain::OrderId> all;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      std::vector<oms::domain::OrderId> mine;
      for (int i = 0; i < kPerThread; ++i) {
        mine.push_back(registry.allocate());
      }
      EXPECT_TRUE(std::is_sorted(mine.begin(), mine.end()));
      std::lock_guard lock(mutex);
      all.insert(all.end(), mine.begin(), mine.end());
    });
  }
  for (auto& t : threads) t.join();

  std::set<oms::domain::OrderId> unique(all.begin(), all.end());
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*unique.begin(), 1);
  EXPECT_EQ(*unique.rbegin(), kThreads * kPerThread);
}

// -----------------------------------------------------------------------------
// 4. bind() then resolve() in both directions.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, BindAndResolve) {
  EXPECT_EQ(registry.bind(1, 555), oms::ErrorCode::None);

  EXPECT_EQ(registry.resolve(555), std::optional<oms::domain::OrderId>(1));
  EXPECT_EQ(registry.brokerIdFor(1),
            std::optional<oms::domain::BrokerOrderId>(555));
  EXPECT_FALSE(registry.resolve(556).has_value());
  EXPECT_FALSE(registry.brokerIdFor(2).has_value());
}

// -----------------------------------------------------------------------------
// 5. Rebinding to the same broker id is accepted; to a different one is not.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, RebindIsIdempotentButNotReassignable) {
  ASSERT_EQ(registry.bind(1, 555), oms::ErrorCode::None);

  EXPECT_EQ(registry.bind(1, 555), oms::ErrorCode::None);
  EXPECT_EQ(registry.bind(1, 556), oms::ErrorCode::AlreadyBound);
  EXPECT_EQ(registry.bind(2, 555), oms::ErrorCode::AlreadyBound);

  EXPECT_EQ(registry.resolve(555), std::optional<oms::domain::OrderId>(1));
  ASSERT_EQ(registry.bindings().size(), 1u);
}

// -----------------------------------------------------------------------------
// 6. bindings() is sorted by order id.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, BindingsAreSorted) {
  registry.bind(3, 900);
  registry.bind(1, 700);
  registry.bind(2, 800);

  const auto b = registry.bindings();
  ASSERT_EQ(b.size(), 3u);
  EXPECT_EQ(b[0], std::make_pair(oms::domain::OrderId{1},
                                 oms::domain::BrokerOrderId{700}));
  EXPECT_EQ(b[2], std::make_pair(oms::domain::OrderId{3},
                                 oms::domain::BrokerOrderId{900}));
}

// -----------------------------------------------------------------------------
// 7. Parked events come back oldest first for their broker id only.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, TakeBufferedReturnsOnlyThatBrokerId) {
  registry.bufferEvent(555, ack(555));
  registry.bufferEvent(600, ack(600));
  registry.bufferEvent(555, oms::BrokerStatus{555, std::nullopt, "Submitted", "", 0});
  EXPECT_EQ(registry.bufferedCount(), 3u);

  auto taken = registry.takeBuffered(555);
  ASSERT_EQ(taken.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<oms::BrokerAck>(taken[0]));
  EXPECT_TRUE(std::holds_alternative<oms::BrokerStatus>(taken[1]));
  EXPECT_EQ(registry.bufferedCount(), 1u);
}

// -----------------------------------------------------------------------------
// 8. takeReady() releases exactly the events whose broker id became bound.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, TakeReadyReleasesBoundEvents) {
  registry.bufferEvent(555, ack(555));
  registry.bufferEvent(600, ack(600));

  EXPECT_TRUE(registry.takeReady().empty());

  registry.bind(1, 600);
  auto ready = registry.takeReady();
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_EQ(ready[0].broker_order_id, 600);
  EXPECT_EQ(registry.bufferedCount(), 1u);
}

// -----------------------------------------------------------------------------
// 9. Events older than the window expire; younger ones stay parked.
// Why: orphan events from an untracked session must not be retained forever.
// -----------------------------------------------------------------------------
TEST_F(IdentityRegistryTest, ExpireDropsOnlyStaleEvents) {
  registry.bufferEvent(555, ack(555));       // received at 10'000
  clock.advance_by(1500);
  registry.bufferEvent(600, ack(600));       // received at 11'500

  EXPECT_TRUE(registry.expire().empty());

  clock.advance_by(500);                     // 12'000: 555 is 2000 ms old
  auto expired = registry.expire();
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_EQ(expired[0].broker_order_id, 555);
  EXPECT_EQ(expired[0].received_ms, 10'000);
  EXPECT_EQ(registry.bufferedCount(), 1u);
}
