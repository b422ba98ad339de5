// =============================================================================
// session_guard_test.cpp
// =============================================================================
// Unit tests for oms::SessionGuard.
//
// Validates:
//   - Calls fail fast with BrokerUnavailable when not running or connected
//   - Transport failures map to BrokerUnavailable, stalls to BrokerTimeout
//   - Mutating calls never overlap, even from many caller threads
//   - Health counters (reconnects, consecutive timeouts)
//   - stop() abandons queued calls without waiting for their timeout
// =============================================================================

#include "oms/session/session_guard.hpp"
#include "oms/time/simulation_time_provider.hpp"

#include "fake_broker_session.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

class SessionGuardTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto fake = std::make_unique<oms::test::FakeBrokerSession>();
    broker = fake.get();
    guard = std::make_unique<oms::SessionGuard>(std::move(fake), clock,
                                                std::chrono::milliseconds(200));
  }

  void TearDown() override { guard->stop(); }

  static oms::SubmitRequest request(oms::domain::OrderId id) {
    oms::SubmitRequest r;
    r.client_order_id = id;
    r.spec.symbol = "AAPL";
    r.spec.quantity = 100;
    return r;
  }

  oms::SimulationTimeProvider clock{5'000};
  oms::test::FakeBrokerSession* broker{nullptr};
  std::unique_ptr<oms::SessionGuard> guard;
};

// -----------------------------------------------------------------------------
// 1. Not started / not connected: BrokerUnavailable, the broker is untouched.
// -----------------------------------------------------------------------------
TEST_F(SessionGuardTest, UnavailableWithoutSession) {
  auto before_start = guard->submit(request(1));
  EXPECT_EQ(before_start.error, oms::ErrorCode::BrokerUnavailable);

  guard->start();
  auto not_connected = guard->cancel(555);
  EXPECT_EQ(not_connected.error, oms::ErrorCode::BrokerUnavailable);
  EXPECT_EQ(broker->mutatingCallCount(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Happy path: the broker id comes back and the call is recorded.
// -----------------------------------------------------------------------------
TEST_F(SessionGuardTest, SubmitReturnsBrokerId) {
  guard->start();
  ASSERT_TRUE(guard->connect().ok());
  EXPECT_TRUE(guard->isConnected());

  auto result = guard->submit(request(1));
  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(result.value, std::optional<oms::domain::BrokerOrderId>(555));

  ASSERT_TRUE(guard->modify(555, oms::domain::ModifyRequest{80, std::nullopt,
                                                           std::nullopt,
                                                           std::nullopt})
                  .ok());
  ASSERT_TRUE(guard->cancel(555).ok());
  ASSERT_TRUE(guard->requestSnapshot().ok());

  const auto calls = broker->calls();
  ASSERT_EQ(calls.submits.size(), 1u);
  EXPECT_EQ(calls.submits[0].client_order_id, 1);
  ASSERT_EQ(calls.modifies.size(), 1u);
  EXPECT_EQ(calls.modifies[0].second.quantity, std::optional<std::int64_t>(80));
  EXPECT_EQ(calls.cancels, std::vector<oms::domain::BrokerOrderId>{555});
  EXPECT_EQ(calls.snapshots, 1);
}

// -----------------------------------------------------------------------------
// 3. A BrokerError thrown inside the call becomes BrokerUnavailable.
// -----------------------------------------------------------------------------
TEST_F(SessionGuardTest, TransportFailureIsUnavailable) {
  guard->start();
  ASSERT_TRUE(guard->connect().ok());
  broker->fail_calls = true;

  auto result = guard->submit(request(1));
  EXPECT_EQ(result.error, oms::ErrorCode::BrokerUnavailable);
  EXPECT_NE(result.message.find("socket closed"), std::string::npos);
  EXPECT_EQ(guard->health().last_error, result.message);
}

// -----------------------------------------------------------------------------
// 4. A call that outlives the timeout is BrokerTimeout, and counted.
// Why: the caller must learn the outcome is unknown rather than block.
// -----------------------------------------------------------------------------
TEST_F(SessionGuardTest, StalledCallTimesOut) {
  guard->start();
  ASSERT_TRUE(guard->connect().ok());
  broker->call_delay_ms = 400;

  const auto t0 = std::chrono::steady_clock::now();
  auto result = guard->cancel(555);
  const auto elapsed = std::chrono::steady_clock::now() - t0;

  EXPECT_EQ(result.error, oms::ErrorCode::BrokerTimeout);
  EXPECT_LT(elapsed, std::chrono::milliseconds(390));
  EXPECT_EQ(guard->health().consecutive_timeouts, 1u);

  // Once the broker is responsive again the counter resets.
  broker->call_delay_ms = 0;
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  ASSERT_TRUE(guard->cancel(556).ok());
  EXPECT_EQ(guard->health().consecutive_timeouts, 0u);
}

// -----------------------------------------------------------------------------
// 5. Twelve caller threads: mutating calls run one at a time.
// -----------------------------------------------------------------------------
TEST_F(SessionGuardTest, MutatingCallsAreSerialized) {
  guard->start();
  ASSERT_TRUE(guard->connect().ok());
  broker->call_delay_ms = 5;

  constexpr int kCallers = 12;
  std::vector<std::thread> threads;
  std::atomic<int> ok{0};
  for (int i = 0; i < kCallers; ++i) {
    threads.emplace_back([&, i] {
      auto r = (i % 2 == 0) ? guard->submit(request(i + 1)).error
                            : guard->cancel(1000 + i).error;
      if (r == oms::ErrorCode::None) ++ok;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(ok.load(), kCallers);
  EXPECT_EQ(broker->mutatingCallCount(), static_cast<std::size_t>(kCallers));
  EXPECT_EQ(broker->max_concurrent_mutations.load(), 1);
}

// -----------------------------------------------------------------------------
// 6. Connection loss reported by the broker flips health; restore counts a
//    reconnect.
// -----------------------------------------------------------------------------
TEST_F(SessionGuardTest, ConnectionLossAndRestore) {
  guard->start();
  ASSERT_TRUE(guard->connect().ok());
  EXPECT_EQ(guard->health().reconnect_count, 0u);
  EXPECT_EQ(guard->health().last_change_ms, 5'000);

  clock.advance_by(100);
  guard->markConnectionLost("socket EOF");
  auto down = guard->health();
  EXPECT_FALSE(down.connected);
  EXPECT_EQ(down.last_error, "connection lost: socket EOF");
  EXPECT_EQ(down.last_change_ms, 5'100);

  guard->markConnectionRestored();
  EXPECT_TRUE(guard->health().connected);
  EXPECT_EQ(guard->health().reconnect_count, 1u);

  // A second restore without a loss in between is not another reconnect.
  guard->markConnectionRestored();
  EXPECT_EQ(guard->health().reconnect_count, 1u);
}

// -----------------------------------------------------------------------------
// 7. Refused connect and explicit disconnect.
// -----------------------------------------------------------------------------
TEST_F(SessionGuardTest, ConnectFailureAndDisconnect) {
  guard->start();
  broker->fail_connect = true;
  auto refused = guard->connect();
  EXPECT_EQ(refused.error, oms::ErrorCode::BrokerUnavailable);
  EXPECT_FALSE(guard->isConnected());

  broker->fail_connect = false;
  ASSERT_TRUE(guard->connect().ok());
  ASSERT_TRUE(guard->disconnect().ok());
  EXPECT_FALSE(guard->health().connected);
  EXPECT_EQ(guard->submit(request(1)).error, oms::ErrorCode::BrokerUnavailable);

  ASSERT_TRUE(guard->connect().ok());
  EXPECT_EQ(guard->health().reconnect_count, 1u);
}

// -----------------------------------------------------------------------------
// 8. A socket drop the broker did not report is caught at call time.
// -----------------------------------------------------------------------------
TEST_F(SessionGuardTest, SilentDropFailsFast) {
  guard->start();
  ASSERT_TRUE(guard->connect().ok());
  broker->drop();
  EXPECT_EQ(guard->submit(request(1)).error, oms::ErrorCode::BrokerUnavailable);
  EXPECT_EQ(broker->mutatingCallCount(), 0u);
}

// -----------------------------------------------------------------------------
// 9. stop() drops calls still queued behind a running one; their callers get
//    BrokerUnavailable at once instead of waiting out the call timeout.
// -----------------------------------------------------------------------------
TEST(SessionGuardStop, QueuedCallsAreAbandoned) {
  oms::SimulationTimeProvider clock{5'000};
  auto fake = std::make_unique<oms::test::FakeBrokerSession>();
  oms::test::FakeBrokerSession* broker = fake.get();
  oms::SessionGuard guard(std::move(fake), clock, std::chrono::seconds(5));
  guard.start();
  ASSERT_TRUE(guard.connect().ok());
  broker->call_delay_ms = 150;

  oms::SubmitRequest req;
  req.client_order_id = 1;
  req.spec.symbol = "AAPL";
  req.spec.quantity = 100;

  oms::BrokerCall<std::optional<oms::domain::BrokerOrderId>> running;
  oms::BrokerCall<bool> queued;
  std::thread first([&] { running = guard.submit(req); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  const auto started = std::chrono::steady_clock::now();
  std::thread second([&] { queued = guard.cancel(555); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  guard.stop();
  first.join();
  second.join();
  const auto waited = std::chrono::steady_clock::now() - started;

  EXPECT_TRUE(running.ok()) << running.message;
  EXPECT_EQ(queued.error, oms::ErrorCode::BrokerUnavailable);
  EXPECT_LT(waited, std::chrono::seconds(2));
  EXPECT_TRUE(broker->calls().cancels.empty());
}
