// =============================================================================
// trading_api_test.cpp
// =============================================================================
// Unit tests for oms::TradingApi, driven through handle() with raw JSON the
// way the IPC server calls it.
//
// Validates:
//   - Request decoding: malformed JSON, unknown methods, wrong field types
//   - Place responses and option contract fields
//   - 0 / "" / null treated as absent for optional fields
//   - Error envelopes for NotFound (no status) and command failures
//   - List, health and audit log responses; oversized limits are clamped
// =============================================================================

#include "oms/api/trading_api.hpp"
#include "oms/time/simulation_time_provider.hpp"

#include "fake_broker_session.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>

using nlohmann::json;

class TradingApiTest : public ::testing::Test {
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
    api = std::make_unique<oms::TradingApi>(*commands, ledger, *session, clock);
  }

  void TearDown() override { session->stop(); }

  json request(const std::string& method, json params = json::object()) {
    return json::parse(api->handle(
        json{{"method", method}, {"params", std::move(params)}}.dump()));
  }

  oms::SimulationTimeProvider clock{7'000};
  oms::OrderLedger ledger{clock, 100};
  oms::IdentityRegistry registry{clock, std::chrono::milliseconds(2000)};
  oms::OrderLockTable locks;
  oms::EventBus bus;
  oms::test::FakeBrokerSession* broker{nullptr};
  std::unique_ptr<oms::SessionGuard> session;
  std::unique_ptr<oms::CommandProcessor> commands;
  std::unique_ptr<oms::TradingApi> api;
};

// -----------------------------------------------------------------------------
// 1. Undecodable requests are ValidationErrors and touch nothing.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, MalformedRequests) {
  for (const char* raw : {"{not json", "[1,2]", R"({"params": {}})",
                          R"({"method": "Ping", "params": 5})"}) {
    const json r = json::parse(api->handle(raw));
    EXPECT_EQ(r.at("error"), "ValidationError") << raw;
    EXPECT_FALSE(r.at("message").get<std::string>().empty());
  }

  const json unknown = request("Teleport");
  EXPECT_EQ(unknown.at("error"), "ValidationError");
  EXPECT_EQ(ledger.orderCount(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Stock order with defaults: MKT, DAY.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, PlaceStockOrderDefaults) {
  const json r = request("PlaceStockOrder",
                         {{"symbol", "AAPL"}, {"side", "buy"}, {"quantity", 10},
                          {"order_type", ""}, {"price", 0}, {"tif", nullptr}});
  EXPECT_FALSE(r.contains("error")) << r.dump();
  EXPECT_EQ(r.at("order_id"), 1);
  EXPECT_EQ(r.at("broker_order_id"), 555);
  EXPECT_EQ(r.at("status"), "PENDING_SUBMIT");

  auto order = ledger.getOrder(1);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->order_type, oms::domain::OrderType::Market);
  EXPECT_EQ(order->tif, oms::domain::TimeInForce::Day);
  EXPECT_FALSE(order->price.has_value());
}

// -----------------------------------------------------------------------------
// 3. LMT without a price: ValidationError, no order, no broker call.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, LimitWithoutPriceIsRejected) {
  const json r = request("PlaceStockOrder",
                         {{"symbol", "AAPL"}, {"side", "BUY"}, {"quantity", 10},
                          {"order_type", "LMT"}});
  EXPECT_EQ(r.at("error"), "ValidationError");
  EXPECT_EQ(r.at("order_id"), 0);
  EXPECT_EQ(ledger.orderCount(), 0u);
  EXPECT_EQ(broker->mutatingCallCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Field type errors.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, FieldTypeErrors) {
  EXPECT_EQ(request("PlaceStockOrder", {{"symbol", "AAPL"}, {"side", "BUY"},
                                        {"quantity", 1.5}})
                .at("error"),
            "ValidationError");
  EXPECT_EQ(request("PlaceStockOrder", {{"symbol", "AAPL"}, {"side", "HOLD"},
                                        {"quantity", 1}})
                .at("error"),
            "ValidationError");
  EXPECT_EQ(request("GetOrder", {{"order_id", "1"}}).at("error"),
            "ValidationError");
  EXPECT_EQ(ledger.orderCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Option order carries its contract terms into the record.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, PlaceOptionOrder) {
  const json placed = request(
      "PlaceOptionOrder",
      {{"symbol", "SPY"}, {"side", "SELL"}, {"quantity", 2},
       {"order_type", "LMT"}, {"price", 3.25}, {"tif", "GTC"},
       {"expiry", "20261218"}, {"strike", 450}, {"right", "P"}});
  ASSERT_FALSE(placed.contains("error")) << placed.dump();

  const json order = request("GetOrder", {{"order_id", placed.at("order_id")}});
  EXPECT_EQ(order.at("asset_class"), "OPT");
  EXPECT_EQ(order.at("expiry"), "20261218");
  EXPECT_DOUBLE_EQ(order.at("strike").get<double>(), 450.0);
  EXPECT_EQ(order.at("right"), "P");
  EXPECT_EQ(order.at("tif"), "GTC");

  const json missing = request("PlaceOptionOrder",
                               {{"symbol", "SPY"}, {"side", "SELL"},
                                {"quantity", 2}, {"right", "P"}});
  EXPECT_EQ(missing.at("error"), "ValidationError");
}

// -----------------------------------------------------------------------------
// 6. GetOrder on an unknown id.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, GetOrderNotFound) {
  const json r = request("GetOrder", {{"order_id", 404}});
  EXPECT_EQ(r.at("error"), "NotFound");
}

// -----------------------------------------------------------------------------
// 7. Cancel and modify responses carry ok/status/error.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, CancelAndModifyResponses) {
  request("PlaceStockOrder", {{"symbol", "AAPL"}, {"side", "BUY"},
                              {"quantity", 10}, {"order_type", "LMT"},
                              {"price", 190.0}});

  // Still PENDING_SUBMIT: not cancellable yet.
  const json early = request("CancelOrder", {{"order_id", 1}});
  EXPECT_EQ(early.at("ok"), false);
  EXPECT_EQ(early.at("error"), "InvalidState");
  EXPECT_EQ(early.at("status"), "PENDING_SUBMIT");

  const json missing = request("CancelOrder", {{"order_id", 99}});
  EXPECT_EQ(missing.at("error"), "NotFound");

  const json nothing = request("ModifyOrder", {{"order_id", 1}, {"quantity", 0}});
  EXPECT_EQ(nothing.at("ok"), false);
  EXPECT_EQ(nothing.at("error"), "InvalidState");
  EXPECT_TRUE(broker->calls().modifies.empty());
}

// -----------------------------------------------------------------------------
// 8. Listing endpoints wrap their rows; limit 0 means the default.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, ListEndpoints) {
  for (int i = 0; i < 3; ++i) {
    request("PlaceStockOrder", {{"symbol", "AAPL"}, {"side", "BUY"},
                                {"quantity", 1}});
  }
  EXPECT_EQ(request("ListOrders").at("orders").size(), 3u);
  EXPECT_EQ(request("ListOrders", {{"limit", 0}}).at("orders").size(), 3u);
  const json two = request("ListOrders", {{"limit", 2}});
  ASSERT_EQ(two.at("orders").size(), 2u);
  EXPECT_EQ(two.at("orders")[0].at("order_id"), 3);

  EXPECT_TRUE(request("ListFills", {{"order_id", 1}}).at("fills").empty());
  EXPECT_TRUE(request("GetPositions").at("positions").is_array());
  EXPECT_TRUE(request("GetAccountValues").at("account_values").is_array());
}

// -----------------------------------------------------------------------------
// 9. Health, ping and audit log.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, DiagnosticsEndpoints) {
  const json health = request("GetSessionHealth");
  EXPECT_EQ(health.at("connected"), true);
  EXPECT_EQ(health.at("consecutive_timeouts"), 0);

  const json pong = request("Ping");
  EXPECT_EQ(pong.at("pong"), true);
  EXPECT_EQ(pong.at("ts_ms"), 7'000);

  request("PlaceStockOrder", {{"symbol", "AAPL"}, {"side", "BUY"},
                              {"quantity", 1}});
  const json logs = request("GetAuditLog");
  ASSERT_FALSE(logs.at("logs").empty());
  const json& first = logs.at("logs")[0];
  EXPECT_EQ(first.at("event_type"), "order_upsert");
  EXPECT_EQ(first.at("payload").at("status"), "NEW");

  const auto last_seq = logs.at("logs").back().at("seq").get<std::uint64_t>();
  EXPECT_TRUE(request("GetAuditLog", {{"since_seq", last_seq}}).at("logs").empty());
  EXPECT_EQ(request("GetAuditLog", {{"since_seq", -1}}).at("error"),
            "ValidationError");
}

// -----------------------------------------------------------------------------
// 10. Cancel/modify of an unknown order report no status at all.
// Why: "NEW" would describe an order that does not exist.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, UnknownOrderResponsesOmitStatus) {
  const json cancel = request("CancelOrder", {{"order_id", 99}});
  EXPECT_EQ(cancel.at("ok"), false);
  EXPECT_EQ(cancel.at("error"), "NotFound");
  EXPECT_FALSE(cancel.contains("status"));

  const json modify = request("ModifyOrder", {{"order_id", 99}, {"price", 1.5}});
  EXPECT_EQ(modify.at("error"), "NotFound");
  EXPECT_FALSE(modify.contains("status"));

  EXPECT_FALSE(commands->cancel(99).status.has_value());
  EXPECT_FALSE(commands->modify(99, oms::domain::ModifyRequest{}).status.has_value());
}

// -----------------------------------------------------------------------------
// 11. Limits beyond int range are clamped, not wrapped into small numbers.
// -----------------------------------------------------------------------------
TEST_F(TradingApiTest, OversizedLimitsAreClamped) {
  for (int i = 0; i < 3; ++i) {
    request("PlaceStockOrder", {{"symbol", "AAPL"}, {"side", "BUY"},
                                {"quantity", 1}});
  }
  // 2^32 + 2 would truncate to a limit of 2.
  EXPECT_EQ(request("ListOrders", {{"limit", 4294967298LL}}).at("orders").size(), 3u);
  EXPECT_EQ(request("ListOrders", {{"limit", INT64_MAX}}).at("orders").size(), 3u);
  EXPECT_EQ(request("ListOrders", {{"limit", -5}}).at("orders").size(), 3u);
  EXPECT_EQ(request("ListFills", {{"limit", 4294967297LL}}).at("fills").size(), 0u);

  const json logs = request("GetAuditLog", {{"limit", 4294967297LL}});
  EXPECT_GT(logs.at("logs").size(), 1u);
  EXPECT_EQ(request("ListOrders", {{"limit", "ten"}}).at("error"), "ValidationError");
}
