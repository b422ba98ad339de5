#pragma once

#include "oms/domain/error_code.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// Transition: the outcome of asking the state machine to change an order
// -----------------------------------------------------------------------------
//
// @details
//   Applied  order holds the new state; the caller persists it.
//   Ignored  the request is legal but changes nothing (idempotent replay,
//            late event on a terminal order, ack after the order moved on).
//            order is the unchanged input.
//   Refused  the request is illegal. error/reason say why; order is the
//            unchanged input and must not be persisted.
// -----------------------------------------------------------------------------
struct Transition {
  enum class Outcome { Applied, Ignored, Refused };

  Outcome outcome{Outcome::Ignored};
  ErrorCode error{ErrorCode::None};
  std::string reason;
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::New};

  bool applied() const { return outcome == Outcome::Applied; }
  bool refused() const { return outcome == Outcome::Refused; }
};

// -----------------------------------------------------------------------------
// OrderStateMachine
// -----------------------------------------------------------------------------
//
// @brief  The single authority on order lifecycle. Every status, fill or
//         modification that reaches the OrderLedger was produced here.
//
// @details
// The machine is stateless: each method takes a copy of the current order
// plus the stimulus and returns a Transition. Callers hold the per-order
// lock while they read, transition and write back.
//
// Rules:
//   - Only New -> PendingSubmit is client-initiated (markPendingSubmit).
//   - Terminal orders (Filled, Cancelled, Rejected, Error) accept nothing;
//     broker events for them come back Ignored with a reason to log.
//   - A fill adds its increment to filled_qty and recomputes the volume
//     weighted avg_price. Reaching quantity -> Filled from any open status.
//     Otherwise PartiallyFilled, except under the CancelRequested overlay,
//     which is kept and its remembered status becomes PartiallyFilled.
//   - A fill that would exceed quantity is Refused.
//   - Cancel and modify are legal only from Submitted, Acked and
//     PartiallyFilled. A second cancel while CancelRequested is Ignored.
//   - Cancel confirm -> Cancelled from any open status. Cancel reject
//     restores the remembered status.
//   - Reject -> Rejected and broker error -> Error from any open status,
//     with the broker's text in message.
//
// Exec-id de-duplication is the ledger's job (appendFill); the machine
// only sees fills that were not recorded before.
//
// Thread model: stateless, safe from any thread.
// -----------------------------------------------------------------------------
class OrderStateMachine {
 public:
  // -------------------------------------------------------------------------
  // isLegal(from, to)
  // -------------------------------------------------------------------------
  // @brief  The raw transition graph, without stimulus-specific guards.
  //         Self-transitions are only legal for PartiallyFilled.
  // -------------------------------------------------------------------------
  static bool isLegal(domain::OrderStatus from, domain::OrderStatus to);

  // Client commands -------------------------------------------------------
  Transition markPendingSubmit(const domain::Order& order,
                               std::int64_t now_ms) const;
  Transition submitFailed(const domain::Order& order,
                          const std::string& message,
                          std::int64_t now_ms) const;
  Transition requestCancel(const domain::Order& order,
                           std::int64_t now_ms) const;

  // -------------------------------------------------------------------------
  // checkModify(order, changes)
  // -------------------------------------------------------------------------
  // @brief  Validates a modification without applying it. Returns the order
  //         as it would look afterwards (Applied) or the refusal.
  //
  // @details
  //   InvalidState        order not in Submitted/Acked/PartiallyFilled.
  //   ValidationError     nothing to change, or non-positive quantity.
  //   InvalidModification new quantity below filled_qty; LMT/STP without a
  //                       positive price after merging.
  //
  // Switching to MKT clears the price.
  // -------------------------------------------------------------------------
  Transition checkModify(const domain::Order& order,
                         const domain::ModifyRequest& changes,
                         std::int64_t now_ms) const;

  // Broker events ---------------------------------------------------------
  Transition onAck(const domain::Order& order, std::int64_t now_ms) const;
  // A Submitted/Acked status on a CANCEL_REQUESTED order resolves the overlay
  // as a cancel rejection.
  Transition onBrokerStatus(const domain::Order& order,
                            domain::OrderStatus target,
                            const std::string& message,
                            std::int64_t now_ms) const;
  Transition onFill(const domain::Order& order, std::int64_t quantity,
                    double price, std::int64_t now_ms) const;
  Transition onCancelConfirmed(const domain::Order& order,
                               const std::string& message,
                               std::int64_t now_ms) const;
  Transition onCancelRejected(const domain::Order& order,
                              const std::string& message,
                              std::int64_t now_ms) const;
  Transition onReject(const domain::Order& order, const std::string& message,
                      std::int64_t now_ms) const;
  Transition onError(const domain::Order& order, const std::string& message,
                     std::int64_t now_ms) const;

  // -------------------------------------------------------------------------
  // mapBrokerStatus(status)
  // -------------------------------------------------------------------------
  // @brief  Translates a broker status string into the engine status it
  //         drives, or std::nullopt when it drives nothing (Filled: fills do
  //         that) or is not recognised.
  //
  //   PendingSubmit, PreSubmitted -> Submitted
  //   Submitted                   -> Acked
  //   PendingCancel               -> CancelRequested
  //   Cancelled, ApiCancelled     -> Cancelled
  //   Inactive                    -> Rejected
  // -------------------------------------------------------------------------
  static std::optional<domain::OrderStatus> mapBrokerStatus(
      const std::string& status);

  static bool isKnownBrokerStatus(const std::string& status);
};

}  // namespace oms
