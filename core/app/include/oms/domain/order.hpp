#pragma once

#include "oms/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// Identifiers
// -----------------------------------------------------------------------------
// OrderId is the engine's own id: allocated once by IdentityRegistry, never
// reused, never changed. BrokerOrderId is whatever the broker assigns on
// submit/ack. Both are signed 64-bit to match the wire contract (int64).
// -----------------------------------------------------------------------------
using OrderId = std::int64_t;
using BrokerOrderId = std::int64_t;
using FillId = std::int64_t;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,  // MKT
  Limit,   // LMT: price is the limit price
  Stop,    // STP: price is the stop trigger
};

enum class TimeInForce {
  Day,
  Gtc,
};

enum class OptionRight {
  Call,  // "C"
  Put,   // "P"
};

// -----------------------------------------------------------------------------
// Instrument: tagged variant of the tradable asset classes
// -----------------------------------------------------------------------------
//
// @brief  Stock carries nothing beyond the order's symbol; Option carries
//         the contract terms (expiry, strike, right).
//
// @details
// Using std::variant instead of a loose bag of optional option fields makes
// it impossible to build an option order without its contract terms, or a
// stock order with stray option fields. CommandProcessor validates the
// contents (expiry non-empty, strike > 0) at the boundary; past that point
// the engine trusts the variant.
// -----------------------------------------------------------------------------
struct StockContract {};

struct OptionContract {
  std::string expiry;                   // YYYYMMDD
  double strike{0.0};
  OptionRight right{OptionRight::Call};
};

using Instrument = std::variant<StockContract, OptionContract>;

enum class AssetClass {
  Stock,   // "STK" on the wire
  Option,  // "OPT" on the wire
};

inline AssetClass assetClassOf(const Instrument& instrument) {
  return std::holds_alternative<OptionContract>(instrument)
             ? AssetClass::Option
             : AssetClass::Stock;
}

// -----------------------------------------------------------------------------
// OrderSpec: the client's intent, as received by place()
// -----------------------------------------------------------------------------
struct OrderSpec {
  std::string symbol;
  Instrument instrument{StockContract{}};
  Side side{Side::Buy};
  std::int64_t quantity{0};
  OrderType order_type{OrderType::Market};
  std::optional<double> price;          // Required iff Limit or Stop
  TimeInForce tif{TimeInForce::Day};
};

// -----------------------------------------------------------------------------
// ModifyRequest: fields left empty mean "no change"
// -----------------------------------------------------------------------------
struct ModifyRequest {
  std::optional<std::int64_t> quantity;
  std::optional<OrderType> order_type;
  std::optional<double> price;
  std::optional<TimeInForce> tif;

  bool empty() const {
    return !quantity && !order_type && !price && !tif;
  }
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The authoritative record of one order, owned by the
// OrderLedger. Every other component works on copies; a mutation is a
// copy → OrderStateMachine → OrderLedger::putOrder() round trip.
//
// @details
// Invariants (enforced by OrderStateMachine):
//   - 0 <= filled_qty <= quantity
//   - avg_price has a value iff filled_qty > 0
//   - status == Filled iff filled_qty == quantity
//   - broker_order_id, once set, never changes
//
// pre_cancel_status is only meaningful while status == CancelRequested; it
// holds the status to restore if the broker refuses the cancel.
//
// created_seq is a ledger-assigned insertion counter used to order listings
// newest-first independently of wall-clock resolution.
//
// adopted_filled_qty is the part of filled_qty taken over from a broker
// open-order snapshot with no Fill rows behind it. Executions reported later
// for the same order are netted against it before they add to filled_qty.
//
// commission and realized_pnl are totals over the order's fills, in
// commission_currency, as the broker's commission reports arrive.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{0};
  std::optional<BrokerOrderId> broker_order_id;

  std::string symbol;
  Instrument instrument{StockContract{}};
  Side side{Side::Buy};
  std::int64_t quantity{0};
  OrderType order_type{OrderType::Market};
  std::optional<double> price;
  TimeInForce tif{TimeInForce::Day};

  OrderStatus status{OrderStatus::New};
  std::int64_t filled_qty{0};
  std::optional<double> avg_price;
  std::string message;

  std::optional<OrderStatus> pre_cancel_status;
  std::int64_t adopted_filled_qty{0};

  std::optional<double> commission;
  std::string commission_currency;
  std::optional<double> realized_pnl;

  std::int64_t created_ms{0};
  std::int64_t updated_ms{0};
  std::uint64_t created_seq{0};

  AssetClass assetClass() const { return assetClassOf(instrument); }
};

}  // namespace domain
}  // namespace oms
