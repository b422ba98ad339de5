// =============================================================================
// command_processor_test.cpp
// =============================================================================
// Unit tests for oms::CommandProcessor against a scripted broker session.
//
// Validates:
//   - place(): validation before any side effect, id allocation, broker id
//     binding, BrokerUnavailable -> ERROR, BrokerTimeout -> PENDING_SUBMIT
//   - cancel(): lifecycle guards and exactly one broker call
//   - modify(): guards run before the broker is touched
//   - Every stored change is published on the EventBus
//   - Commands on one order are serialized; other orders proceed
// =============================================================================

#include "oms/commands/command_processor.hpp"
#include "oms/time/simulation_time_provider.hpp"

#include "fake_broker_session.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using oms::CommandResult;
using oms::domain::OrderStatus;

class CommandProcessorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto fake = std::make_unique<oms::test::FakeBrokerSession>();
    broker = fake.get();
    session = std::make_unique<oms::SessionGuard>(
        std::move(fake), clock, std::chrono::milliseconds(200));
    session->start();
    ASSERT_TRUE(session->connect().ok());

    commands = std::make_unique<oms::CommandProcessor>(
        ledger, registry, *session, locks, bus, clock);

    bus.subscribe<oms::OrderUpdateEvent>(
        [this](const oms::OrderUpdateEvent& e) { updates.push_back(e); });
  }

  void TearDown() override { session->stop(); }

  static oms::domain::OrderSpec limitBuy(std::int64_t qty = 100,
                                         double price = 190.0) {
    oms::domain::OrderSpec spec;
    spec.symbol = "AAPL";
    spec.side = oms::domain::Side::Buy;
    spec.quantity = qty;
    spec.order_type = oms::domain::OrderType::Limit;
    spec.price = price;
    return spec;
  }

  // Moves an order along as the reconciler would.
  void advance(oms::domain::OrderId id, OrderStatus status) {
    auto order = *ledger.getOrder(id);
    auto t = machine.onBrokerStatus(order, status, "", clock.now_ms());
    ASSERT_TRUE(t.applied()) << t.reason;
    ASSERT_EQ(ledger.putOrder(t.order), oms::ErrorCode::None);
  }

  void fill(oms::domain::OrderId id, std::int64_t qty) {
    auto t = machine.onFill(*ledger.getOrder(id), qty, 190.0, clock.now_ms());
    ASSERT_TRUE(t.applied()) << t.reason;
    ASSERT_EQ(ledger.putOrder(t.order), oms::ErrorCode::None);
  }

  oms::SimulationTimeProvider clock{1'000};
  oms::OrderLedger ledger{clock, 100};
  oms::IdentityRegistry registry{clock, std::chrono::milliseconds(2000)};
  oms::OrderLockTable locks;
  oms::EventBus bus;
  oms::OrderStateMachine machine;

  oms::test::FakeBrokerSession* broker{nullptr};
  std::unique_ptr<oms::SessionGuard> session;
  std::unique_ptr<oms::CommandProcessor> commands;
  std::vector<oms::OrderUpdateEvent> updates;
};

// -----------------------------------------------------------------------------
// 1. Happy path: PENDING_SUBMIT, broker id bound, NEW and PENDING_SUBMIT
//    both published.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, PlaceBindsBrokerId) {
  auto r = commands->place(limitBuy());
  ASSERT_TRUE(r.ok()) << r.message;
  EXPECT_EQ(r.order_id, 1);
  EXPECT_EQ(r.broker_order_id, std::optional<oms::domain::BrokerOrderId>(555));
  EXPECT_EQ(r.status, OrderStatus::PendingSubmit);

  EXPECT_EQ(registry.resolve(555), std::optional<oms::domain::OrderId>(1));
  auto stored = ledger.getOrder(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->broker_order_id, std::optional<oms::domain::BrokerOrderId>(555));
  EXPECT_EQ(stored->created_ms, 1'000);

  const auto calls = broker->calls();
  ASSERT_EQ(calls.submits.size(), 1u);
  EXPECT_EQ(calls.submits[0].client_order_id, 1);
  EXPECT_EQ(calls.submits[0].spec.symbol, "AAPL");

  ASSERT_GE(updates.size(), 2u);
  EXPECT_EQ(updates[0].order.status, OrderStatus::New);
  EXPECT_EQ(updates[1].order.status, OrderStatus::PendingSubmit);
  EXPECT_EQ(updates[1].previous_status, OrderStatus::New);
}

// -----------------------------------------------------------------------------
// 2. Validation failures: no id allocated, nothing stored, no broker call.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, PlaceValidationHasNoSideEffects) {
  auto no_price = limitBuy();
  no_price.price.reset();
  auto r = commands->place(no_price);
  EXPECT_EQ(r.error, oms::ErrorCode::ValidationError);
  EXPECT_EQ(r.order_id, 0);

  auto zero_qty = limitBuy(0);
  EXPECT_EQ(commands->place(zero_qty).error, oms::ErrorCode::ValidationError);

  auto market_with_price = limitBuy();
  market_with_price.order_type = oms::domain::OrderType::Market;
  EXPECT_EQ(commands->place(market_with_price).error,
            oms::ErrorCode::ValidationError);

  auto bad_option = limitBuy();
  bad_option.instrument =
      oms::domain::OptionContract{"2026-12-18", 200.0, oms::domain::OptionRight::Call};
  EXPECT_EQ(commands->place(bad_option).error, oms::ErrorCode::ValidationError);

  EXPECT_EQ(ledger.orderCount(), 0u);
  EXPECT_EQ(broker->mutatingCallCount(), 0u);
  EXPECT_TRUE(updates.empty());
  EXPECT_EQ(registry.allocate(), 1);
}

// -----------------------------------------------------------------------------
// 3. validate() accepts the three order types when priced correctly.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, ValidateAcceptsWellFormedSpecs) {
  auto market = limitBuy();
  market.order_type = oms::domain::OrderType::Market;
  market.price.reset();
  EXPECT_FALSE(oms::CommandProcessor::validate(market).has_value());

  auto stop = limitBuy();
  stop.order_type = oms::domain::OrderType::Stop;
  EXPECT_FALSE(oms::CommandProcessor::validate(stop).has_value());

  auto option = limitBuy(1, 3.5);
  option.instrument =
      oms::domain::OptionContract{"20261218", 200.0, oms::domain::OptionRight::Put};
  EXPECT_FALSE(oms::CommandProcessor::validate(option).has_value());

  auto padded = limitBuy();
  padded.symbol = " AAPL";
  EXPECT_TRUE(oms::CommandProcessor::validate(padded).has_value());
}

// -----------------------------------------------------------------------------
// 4. Broker unreachable: the order is kept, in ERROR, with the reason.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, PlaceWithBrokerDownEndsInError) {
  broker->fail_calls = true;
  auto r = commands->place(limitBuy());
  EXPECT_EQ(r.error, oms::ErrorCode::BrokerUnavailable);
  EXPECT_EQ(r.order_id, 1);
  EXPECT_EQ(r.status, OrderStatus::Error);

  auto stored = ledger.getOrder(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, OrderStatus::Error);
  EXPECT_FALSE(stored->message.empty());
}

// -----------------------------------------------------------------------------
// 5. Broker timeout: outcome unknown, so the order stays PENDING_SUBMIT.
// Why: resubmitting could double the position if the first call landed.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, PlaceTimeoutStaysPending) {
  broker->call_delay_ms = 400;
  auto r = commands->place(limitBuy());
  EXPECT_EQ(r.error, oms::ErrorCode::BrokerTimeout);
  EXPECT_EQ(r.status, OrderStatus::PendingSubmit);
  EXPECT_FALSE(r.broker_order_id.has_value());

  auto stored = ledger.getOrder(r.order_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, OrderStatus::PendingSubmit);
  EXPECT_NE(stored->message.find("outcome unknown"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 6. Cancel: unknown id, not yet working, then one broker call.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, CancelLifecycle) {
  EXPECT_EQ(commands->cancel(99).error, oms::ErrorCode::NotFound);

  auto placed = commands->place(limitBuy());
  auto early = commands->cancel(placed.order_id);
  EXPECT_FALSE(early.ok);
  EXPECT_EQ(early.error, oms::ErrorCode::InvalidState);
  EXPECT_EQ(early.status, OrderStatus::PendingSubmit);

  advance(placed.order_id, OrderStatus::Acked);
  auto r = commands->cancel(placed.order_id);
  ASSERT_TRUE(r.ok) << r.message;
  EXPECT_EQ(r.status, OrderStatus::CancelRequested);
  EXPECT_EQ(broker->calls().cancels,
            std::vector<oms::domain::BrokerOrderId>{555});

  // A repeat does not resend.
  auto again = commands->cancel(placed.order_id);
  EXPECT_FALSE(again.ok);
  EXPECT_EQ(again.error, oms::ErrorCode::InvalidState);
  EXPECT_EQ(again.status, OrderStatus::CancelRequested);
  EXPECT_EQ(broker->calls().cancels.size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. Cancel on a FILLED order makes no broker call.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, CancelFilledOrderIsRefused) {
  auto placed = commands->place(limitBuy());
  advance(placed.order_id, OrderStatus::Acked);
  fill(placed.order_id, 100);

  auto r = commands->cancel(placed.order_id);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, oms::ErrorCode::InvalidState);
  EXPECT_EQ(r.status, OrderStatus::Filled);
  EXPECT_TRUE(broker->calls().cancels.empty());
}

// -----------------------------------------------------------------------------
// 8. A failed broker cancel leaves the status alone and records why.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, CancelBrokerFailureKeepsStatus) {
  auto placed = commands->place(limitBuy());
  advance(placed.order_id, OrderStatus::Acked);
  broker->fail_calls = true;

  auto r = commands->cancel(placed.order_id);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, oms::ErrorCode::BrokerUnavailable);
  EXPECT_EQ(ledger.getOrder(placed.order_id)->status, OrderStatus::Acked);
  EXPECT_EQ(ledger.getOrder(placed.order_id)->message, r.message);
}

// -----------------------------------------------------------------------------
// 9. Modify below the filled quantity never reaches the broker.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, ModifyBelowFilledIsRefused) {
  auto placed = commands->place(limitBuy());
  advance(placed.order_id, OrderStatus::Acked);
  fill(placed.order_id, 40);

  oms::domain::ModifyRequest changes;
  changes.quantity = 39;
  auto r = commands->modify(placed.order_id, changes);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, oms::ErrorCode::InvalidModification);
  EXPECT_EQ(r.status, OrderStatus::PartiallyFilled);
  EXPECT_TRUE(broker->calls().modifies.empty());
}

// -----------------------------------------------------------------------------
// 10. Accepted modify stores the merged order.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, ModifyStoresMergedOrder) {
  auto placed = commands->place(limitBuy());
  advance(placed.order_id, OrderStatus::Acked);

  oms::domain::ModifyRequest changes;
  changes.price = 191.0;
  auto r = commands->modify(placed.order_id, changes);
  ASSERT_TRUE(r.ok) << r.message;
  EXPECT_EQ(r.status, OrderStatus::Acked);

  auto stored = ledger.getOrder(placed.order_id);
  EXPECT_DOUBLE_EQ(*stored->price, 191.0);
  EXPECT_EQ(stored->quantity, 100);
  const auto calls = broker->calls();
  ASSERT_EQ(calls.modifies.size(), 1u);
  EXPECT_EQ(calls.modifies[0].first, 555);
  EXPECT_FALSE(calls.modifies[0].second.quantity.has_value());

  EXPECT_EQ(commands->modify(42, changes).error, oms::ErrorCode::NotFound);
}

// -----------------------------------------------------------------------------
// 11. Reads delegate to the ledger.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, ReadsDelegateToLedger) {
  commands->place(limitBuy());
  commands->place(limitBuy(5));
  auto orders = commands->listOrders(0);
  ASSERT_EQ(orders.size(), 2u);
  EXPECT_EQ(orders[0].id, 2);
  EXPECT_TRUE(commands->getOrder(2).has_value());
  EXPECT_TRUE(commands->listFills(std::nullopt, 0).empty());
  EXPECT_TRUE(commands->listPositions().empty());
  EXPECT_TRUE(commands->listAccountValues().empty());
}

// -----------------------------------------------------------------------------
// 12. A modify racing a stalled cancel on the same order waits for it and
//     then sees CANCEL_REQUESTED; other orders and reads are not held up.
// Why: the per-order lock is held across the broker call, so the two
//      commands can never both pass their guards against the same status.
// -----------------------------------------------------------------------------
TEST_F(CommandProcessorTest, StalledCancelSerializesModifyOnSameOrder) {
  auto a = commands->place(limitBuy());
  auto b = commands->place(limitBuy(10));
  advance(a.order_id, OrderStatus::Acked);
  advance(b.order_id, OrderStatus::Acked);
  fill(b.order_id, 10);
  broker->call_delay_ms = 150;

  CommandResult cancelled;
  CommandResult modified;
  std::thread canceller([&] { cancelled = commands->cancel(a.order_id); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  std::thread modifier([&] {
    oms::domain::ModifyRequest changes;
    changes.price = 191.0;
    modified = commands->modify(a.order_id, changes);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  // While the cancel is still inside the broker call:
  const auto started = std::chrono::steady_clock::now();
  auto other = commands->cancel(b.order_id);
  EXPECT_EQ(other.error, oms::ErrorCode::InvalidState);
  EXPECT_EQ(commands->getOrder(a.order_id)->status, OrderStatus::Acked);
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::milliseconds(80));

  canceller.join();
  modifier.join();

  ASSERT_TRUE(cancelled.ok) << cancelled.message;
  EXPECT_EQ(cancelled.status, OrderStatus::CancelRequested);
  EXPECT_FALSE(modified.ok);
  EXPECT_EQ(modified.error, oms::ErrorCode::InvalidState);
  EXPECT_EQ(modified.status, OrderStatus::CancelRequested);

  const auto calls = broker->calls();
  EXPECT_EQ(calls.cancels, std::vector<oms::domain::BrokerOrderId>{555});
  EXPECT_TRUE(calls.modifies.empty());
  EXPECT_EQ(broker->max_concurrent_mutations.load(), 1);
  EXPECT_EQ(ledger.getOrder(a.order_id)->price, std::optional<double>(190.0));
}
