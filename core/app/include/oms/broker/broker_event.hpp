#pragma once

#include "oms/domain/account_value.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/position.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// Broker events: what the broker session pushes into the engine
// -----------------------------------------------------------------------------
//
// @brief  One struct per event kind, carried as the BrokerEvent variant on
//         the channel from the IBrokerSession into the EventReconciler.
//
// @details
// Order-scoped events carry the broker_order_id and, where the broker echoes
// it, the client_order_id (the engine's own OrderId sent with the submit as
// the client reference). The reconciler routes by broker_order_id first and
// falls back to client_order_id so an ack that overtakes the submit return
// can still bind.
//
// Snapshot events are not order-scoped and never go through the order state
// machine.
//
// Every event stamps the broker-side time it was produced (event_ms). For
// position snapshots this is the as-of time used when merging fill deltas.
// -----------------------------------------------------------------------------

struct BrokerAck {
  domain::BrokerOrderId broker_order_id{0};
  std::optional<domain::OrderId> client_order_id;
  std::int64_t event_ms{0};
};

struct BrokerFill {
  domain::BrokerOrderId broker_order_id{0};
  std::optional<domain::OrderId> client_order_id;
  std::string exec_id;
  double price{0.0};
  std::int64_t quantity{0};   // Increment of this execution
  std::string time;           // Broker text time, may be empty
  std::string account;        // Empty: engine default account
  std::string exchange;       // Empty: engine default exchange
  std::int64_t con_id{0};
  std::int64_t event_ms{0};
};

// Commission and realized P&L for one execution. Usually follows the fill
// with the same exec_id, but may overtake it.
struct BrokerCommissionReport {
  domain::BrokerOrderId broker_order_id{0};
  std::string exec_id;
  double commission{0.0};
  std::string currency;
  std::optional<double> realized_pnl;  // Empty until the broker knows it
  std::int64_t event_ms{0};
};

// Broker status strings: PendingSubmit, PreSubmitted, Submitted,
// PendingCancel, Cancelled, ApiCancelled, Inactive, Filled.
struct BrokerStatus {
  domain::BrokerOrderId broker_order_id{0};
  std::optional<domain::OrderId> client_order_id;
  std::string status;
  std::string message;
  std::int64_t event_ms{0};
};

// The broker refused a cancel (typically because the order already filled).
struct BrokerCancelReject {
  domain::BrokerOrderId broker_order_id{0};
  std::string message;
  std::int64_t event_ms{0};
};

struct BrokerReject {
  domain::BrokerOrderId broker_order_id{0};
  std::optional<domain::OrderId> client_order_id;
  std::string message;
  std::int64_t event_ms{0};
};

// Without a broker_order_id the error concerns the session, not an order.
struct BrokerErrorNotice {
  std::optional<domain::BrokerOrderId> broker_order_id;
  int code{0};
  std::string message;
  std::int64_t event_ms{0};
};

struct PositionSnapshot {
  std::vector<domain::Position> rows;
  std::int64_t event_ms{0};
};

struct AccountValueSnapshot {
  std::vector<domain::AccountValue> values;
  std::int64_t event_ms{0};
};

// One working order as the broker sees it. Used both to refresh orders the
// engine already tracks and to discover orders entered outside the engine.
struct OpenOrderSnapshot {
  domain::BrokerOrderId broker_order_id{0};
  std::optional<domain::OrderId> client_order_id;
  domain::OrderSpec spec;
  std::string status;
  std::int64_t filled_qty{0};
  std::optional<double> avg_price;
  std::int64_t event_ms{0};
};

struct ConnectionLost {
  std::string reason;
  std::int64_t event_ms{0};
};

struct ConnectionRestored {
  std::int64_t event_ms{0};
};

using BrokerEvent = std::variant<
    BrokerAck,
    BrokerFill,
    BrokerStatus,
    BrokerCancelReject,
    BrokerReject,
    BrokerErrorNotice,
    BrokerCommissionReport,
    PositionSnapshot,
    AccountValueSnapshot,
    OpenOrderSnapshot,
    ConnectionLost,
    ConnectionRestored>;

// Short kind name for log lines ("Ack", "Fill", ...).
const char* brokerEventName(const BrokerEvent& event);

}  // namespace oms
