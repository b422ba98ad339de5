#pragma once

#include "oms/concurrent/order_lock_table.hpp"
#include "oms/domain/account_value.hpp"
#include "oms/domain/error_code.hpp"
#include "oms/domain/fill.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/position.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/identity/identity_registry.hpp"
#include "oms/ledger/order_ledger.hpp"
#include "oms/session/session_guard.hpp"
#include "oms/state/order_state_machine.hpp"
#include "oms/time/i_time_provider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// PlaceResult / CommandResult
// -----------------------------------------------------------------------------
// order_id is 0 only when validation failed and nothing was persisted.
// -----------------------------------------------------------------------------
struct PlaceResult {
  ErrorCode error{ErrorCode::None};
  std::string message;
  domain::OrderId order_id{0};
  std::optional<domain::BrokerOrderId> broker_order_id;
  domain::OrderStatus status{domain::OrderStatus::New};

  bool ok() const { return error == ErrorCode::None; }
};

struct CommandResult {
  bool ok{false};
  ErrorCode error{ErrorCode::None};
  std::optional<domain::OrderStatus> status;  // Empty when the order is unknown
  std::string message;
};

// -----------------------------------------------------------------------------
// CommandProcessor: place, cancel, modify and the read queries
// -----------------------------------------------------------------------------
//
// @brief  The public command contract. Validates, consults the state
//         machine, makes at most one broker call per command through the
//         SessionGuard and records the outcome in the ledger.
//
// @details
// place(spec):
//   1. validate(spec); on failure return ValidationError. No id is
//      allocated and nothing is stored.
//   2. allocate an id, store the order as NEW then PENDING_SUBMIT.
//   3. submit through the SessionGuard; the client order reference is the
//      internal id.
//        ok               bind the returned broker id if there is one;
//                         status stays PENDING_SUBMIT until the broker's ack.
//        BrokerUnavailable order -> ERROR with the reason (auditable).
//        BrokerTimeout    order stays PENDING_SUBMIT with a message; the
//                         call may still land and its ack will bind.
//
// cancel(id):
//   NotFound for an unknown id. A terminal order, or one not yet working,
//   gives InvalidState with no broker call. A repeat cancel while
//   CANCEL_REQUESTED returns ok=false, InvalidState and the current status
//   without resending. Otherwise the broker cancel goes out and the order
//   moves to CANCEL_REQUESTED; confirmation arrives via the reconciler.
//
// modify(id, changes):
//   The state machine's guards run first (working status, quantity not
//   below filled_qty, price present for LMT/STP). Only then is the broker
//   called; the merged order is stored once the broker accepted the call.
//
// Broker failures on cancel/modify leave the status untouched and record
// the reason in message.
//
// Concurrency:
//   Each command holds the order's mutex from the OrderLockTable for its
//   whole duration, broker call included. The EventReconciler takes the
//   same mutex, so commands and events for one order never interleave.
//   Commands for different orders run concurrently; the SessionGuard
//   serializes their broker calls.
//
// Telemetry: publishes OrderUpdateEvent after every stored change.
// -----------------------------------------------------------------------------
class CommandProcessor {
 public:
  CommandProcessor(OrderLedger& ledger, IdentityRegistry& registry,
                   SessionGuard& session, OrderLockTable& locks,
                   EventBus& bus, const ITimeProvider& time_provider);

  CommandProcessor(const CommandProcessor&) = delete;
  CommandProcessor& operator=(const CommandProcessor&) = delete;

  PlaceResult place(const domain::OrderSpec& spec);
  CommandResult cancel(domain::OrderId order_id);
  CommandResult modify(domain::OrderId order_id,
                       const domain::ModifyRequest& changes);

  // Pure reads, delegated to the ledger.
  std::optional<domain::Order> getOrder(domain::OrderId order_id) const;
  std::vector<domain::Order> listOrders(int limit) const;
  std::vector<domain::Fill> listFills(std::optional<domain::OrderId> order_id,
                                      int limit) const;
  std::vector<domain::Position> listPositions() const;
  std::vector<domain::AccountValue> listAccountValues() const;

  // -------------------------------------------------------------------------
  // validate(spec)
  // -------------------------------------------------------------------------
  // @return std::nullopt when valid, otherwise the reason.
  //
  //   symbol      non-empty, no surrounding whitespace
  //   quantity    > 0
  //   price       present and > 0 for LMT/STP, absent for MKT
  //   option      expiry YYYYMMDD, strike > 0
  // -------------------------------------------------------------------------
  static std::optional<std::string> validate(const domain::OrderSpec& spec);

 private:
  // Stores `order`, publishes the update. Returns false (and logs) if the
  // ledger refused it.
  bool store(const domain::Order& order, domain::OrderStatus previous);

  // Records a broker failure message without changing status.
  void noteFailure(domain::Order order, const std::string& message);

  OrderLedger& ledger_;
  IdentityRegistry& registry_;
  SessionGuard& session_;
  OrderLockTable& locks_;
  EventBus& bus_;
  const ITimeProvider& time_provider_;
  OrderStateMachine machine_;
};

}  // namespace oms
