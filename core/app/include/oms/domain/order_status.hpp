#pragma once

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an order can occupy from the moment the
//         engine allocates its id until it reaches a terminal state.
//
// @details
// The legal transition graph is enforced by OrderStateMachine; no component
// writes a status into the OrderLedger without going through it.
//
//   New ──> PendingSubmit ──> Submitted ──> Acked ──> PartiallyFilled ──> Filled
//                │               │   │        │          │    ▲
//                │               │   └────────┼──────────┘    │ (re-entrant)
//                ▼               ▼            ▼               │
//              Error          CancelRequested (overlay) ──────┘
//                                  │
//                                  ├──> Cancelled
//                                  └──> back to the prior status
//
//   Any non-terminal status ──> Rejected | Error
//   Any open status         ──> Filled (fill completes the quantity)
//
// Terminal states: Filled, Cancelled, Rejected, Error. Terminal orders are
// never deleted; they remain in the ledger as history.
//
// CancelRequested is an overlay: the Order remembers the status it had when
// the cancel went out so that a broker-side cancel rejection can restore it.
//
// Wire encoding:
//   Serialised as the upper-case names NEW, PENDING_SUBMIT, SUBMITTED,
//   ACKED, PARTIALLY_FILLED, CANCEL_REQUESTED, FILLED, CANCELLED, REJECTED,
//   ERROR (see enum_codec.hpp). Existing clients depend on these strings.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  New,              // Allocated internally, not yet handed to the broker
  PendingSubmit,    // Submit dispatched, no broker acknowledgement yet
  Submitted,        // Broker acknowledged and assigned a broker order id
  Acked,            // Broker reports the order as working at the venue
  PartiallyFilled,  // Some quantity filled, remainder still working
  CancelRequested,  // Cancel sent to the broker, confirmation outstanding
  Filled,           // Fully filled: terminal
  Cancelled,        // Cancel confirmed by the broker: terminal
  Rejected,         // Rejected by the broker: terminal
  Error,            // Submission or broker error: terminal
};

// -----------------------------------------------------------------------------
// isTerminal(status)
// -----------------------------------------------------------------------------
// @brief  True for Filled, Cancelled, Rejected and Error.
// -----------------------------------------------------------------------------
inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected ||
         status == OrderStatus::Error;
}

// -----------------------------------------------------------------------------
// isWorking(status)
// -----------------------------------------------------------------------------
// @brief  True for the statuses in which cancel and modify are permitted:
//         Submitted, Acked and PartiallyFilled.
// -----------------------------------------------------------------------------
inline bool isWorking(OrderStatus status) {
  return status == OrderStatus::Submitted ||
         status == OrderStatus::Acked ||
         status == OrderStatus::PartiallyFilled;
}

}  // namespace domain
}  // namespace oms
