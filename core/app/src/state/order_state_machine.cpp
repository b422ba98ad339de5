#include "oms/state/order_state_machine.hpp"
#include "oms/domain/enum_codec.hpp"

namespace oms {

namespace {

using S = domain::OrderStatus;

Transition applied(const domain::Order& before, domain::Order after,
                   std::int64_t now_ms) {
  Transition t;
  t.outcome = Transition::Outcome::Applied;
  t.previous_status = before.status;
  after.updated_ms = now_ms;
  t.order = std::move(after);
  return t;
}

Transition ignored(const domain::Order& order, std::string reason) {
  Transition t;
  t.outcome = Transition::Outcome::Ignored;
  t.reason = std::move(reason);
  t.previous_status = order.status;
  t.order = order;
  return t;
}

Transition refused(const domain::Order& order, ErrorCode error,
                   std::string reason) {
  Transition t;
  t.outcome = Transition::Outcome::Refused;
  t.error = error;
  t.reason = std::move(reason);
  t.previous_status = order.status;
  t.order = order;
  return t;
}

std::string lateEvent(const char* what, const domain::Order& order) {
  return std::string(what) + " for order in terminal status " +
         domain::toString(order.status);
}

bool isOpen(S status) {
  return status != S::New && !domain::isTerminal(status);
}

bool needsPrice(domain::OrderType type) {
  return type == domain::OrderType::Limit || type == domain::OrderType::Stop;
}

}  // namespace

// -----------------------------------------------------------------------------
// isLegal: the transition graph
// -----------------------------------------------------------------------------
bool OrderStateMachine::isLegal(S from, S to) {
  switch (from) {
    case S::New:
      return to == S::PendingSubmit || to == S::Error;

    case S::PendingSubmit:
      return to == S::Submitted || to == S::Acked ||
             to == S::PartiallyFilled || to == S::Filled ||
             to == S::Cancelled || to == S::Rejected || to == S::Error;

    case S::Submitted:
      return to == S::Acked || to == S::PartiallyFilled || to == S::Filled ||
             to == S::CancelRequested || to == S::Cancelled ||
             to == S::Rejected || to == S::Error;

    case S::Acked:
      return to == S::PartiallyFilled || to == S::Filled ||
             to == S::CancelRequested || to == S::Cancelled ||
             to == S::Rejected || to == S::Error;

    case S::PartiallyFilled:
      return to == S::PartiallyFilled || to == S::Filled ||
             to == S::CancelRequested || to == S::Cancelled ||
             to == S::Rejected || to == S::Error;

    case S::CancelRequested:
      return to == S::Submitted || to == S::Acked ||
             to == S::PartiallyFilled || to == S::Filled ||
             to == S::Cancelled || to == S::Rejected || to == S::Error;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
    case S::Error:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// Client commands
// -----------------------------------------------------------------------------
Transition OrderStateMachine::markPendingSubmit(const domain::Order& order,
                                                std::int64_t now_ms) const {
  if (order.status != S::New) {
    return refused(order, ErrorCode::InvalidState,
                   std::string("submit requires NEW, order is ") +
                       domain::toString(order.status));
  }
  domain::Order next = order;
  next.status = S::PendingSubmit;
  return applied(order, std::move(next), now_ms);
}

Transition OrderStateMachine::submitFailed(const domain::Order& order,
                                           const std::string& message,
                                           std::int64_t now_ms) const {
  if (!isLegal(order.status, S::Error)) {
    return ignored(order, lateEvent("submit failure", order));
  }
  domain::Order next = order;
  next.status = S::Error;
  next.message = message;
  next.pre_cancel_status.reset();
  return applied(order, std::move(next), now_ms);
}

Transition OrderStateMachine::requestCancel(const domain::Order& order,
                                            std::int64_t now_ms) const {
  if (order.status == S::CancelRequested) {
    return ignored(order, "cancel already requested");
  }
  if (!domain::isWorking(order.status)) {
    return refused(order, ErrorCode::InvalidState,
                   std::string("cannot cancel order in status ") +
                       domain::toString(order.status));
  }
  domain::Order next = order;
  next.pre_cancel_status = order.status;
  next.status = S::CancelRequested;
  next.message = "cancel requested";
  return applied(order, std::move(next), now_ms);
}

// -----------------------------------------------------------------------------
// checkModify: guards first, then the merged order
// -----------------------------------------------------------------------------
Transition OrderStateMachine::checkModify(const domain::Order& order,
                                          const domain::ModifyRequest& changes,
                                          std::int64_t now_ms) const {
  if (!domain::isWorking(order.status)) {
    return refused(order, ErrorCode::InvalidState,
                   std::string("cannot modify order in status ") +
                       domain::toString(order.status));
  }
  if (changes.empty()) {
    return refused(order, ErrorCode::ValidationError,
                   "modify request changes nothing");
  }

  domain::Order next = order;
  if (changes.quantity) {
    if (*changes.quantity <= 0) {
      return refused(order, ErrorCode::ValidationError,
                     "quantity must be positive");
    }
    if (*changes.quantity < order.filled_qty) {
      return refused(order, ErrorCode::InvalidModification,
                     "new quantity " + std::to_string(*changes.quantity) +
                         " is below filled quantity " +
                         std::to_string(order.filled_qty));
    }
    next.quantity = *changes.quantity;
  }
  if (changes.order_type) {
    next.order_type = *changes.order_type;
  }
  if (changes.price) {
    next.price = changes.price;
  }
  if (changes.tif) {
    next.tif = *changes.tif;
  }

  if (needsPrice(next.order_type)) {
    if (!next.price || *next.price <= 0.0) {
      return refused(order, ErrorCode::InvalidModification,
                     std::string(domain::toString(next.order_type)) +
                         " order requires a positive price");
    }
  } else {
    next.price.reset();
  }

  if (next.filled_qty > 0 && next.filled_qty == next.quantity) {
    next.status = S::Filled;
    next.message = "quantity reduced to filled quantity";
  } else {
    next.message = "modify sent";
  }
  return applied(order, std::move(next), now_ms);
}

// -----------------------------------------------------------------------------
// Broker events
// -----------------------------------------------------------------------------
Transition OrderStateMachine::onAck(const domain::Order& order,
                                    std::int64_t now_ms) const {
  if (domain::isTerminal(order.status)) {
    return ignored(order, lateEvent("ack", order));
  }
  if (order.status != S::PendingSubmit) {
    return ignored(order, std::string("ack while ") +
                              domain::toString(order.status));
  }
  domain::Order next = order;
  next.status = S::Submitted;
  return applied(order, std::move(next), now_ms);
}

Transition OrderStateMachine::onBrokerStatus(const domain::Order& order,
                                             S target,
                                             const std::string& message,
                                             std::int64_t now_ms) const {
  if (domain::isTerminal(order.status)) {
    return ignored(order, lateEvent("status", order));
  }

  // The broker still reports the order working after our cancel went out:
  // the cancel was refused, so the overlay resolves back.
  if (order.status == S::CancelRequested &&
      (target == S::Submitted || target == S::Acked)) {
    return onCancelRejected(
        order, message.empty() ? "cancel not applied, order still working"
                               : message,
        now_ms);
  }

  switch (target) {
    case S::Submitted:
      if (order.status != S::PendingSubmit) {
        return ignored(order, "already past SUBMITTED");
      }
      break;

    case S::Acked:
      if (order.status != S::PendingSubmit && order.status != S::Submitted) {
        return ignored(order, "already past ACKED");
      }
      break;

    case S::CancelRequested: {
      if (!domain::isWorking(order.status)) {
        return ignored(order, std::string("pending cancel while ") +
                                  domain::toString(order.status));
      }
      domain::Order next = order;
      next.pre_cancel_status = order.status;
      next.status = S::CancelRequested;
      if (!message.empty()) next.message = message;
      return applied(order, std::move(next), now_ms);
    }

    case S::Cancelled:
      return onCancelConfirmed(order, message, now_ms);

    case S::Rejected:
      return onReject(order, message, now_ms);

    default:
      return refused(order, ErrorCode::InvalidState,
                     std::string("broker status cannot drive ") +
                         domain::toString(target));
  }

  domain::Order next = order;
  next.status = target;
  if (!message.empty()) next.message = message;
  return applied(order, std::move(next), now_ms);
}

Transition OrderStateMachine::onFill(const domain::Order& order,
                                     std::int64_t quantity, double price,
                                     std::int64_t now_ms) const {
  if (domain::isTerminal(order.status)) {
    return ignored(order, lateEvent("fill", order));
  }
  if (order.status == S::New) {
    return refused(order, ErrorCode::InvalidState,
                   "fill for an order that was never submitted");
  }
  if (quantity <= 0 || price <= 0.0) {
    return refused(order, ErrorCode::ValidationError,
                   "fill quantity and price must be positive");
  }
  if (order.filled_qty + quantity > order.quantity) {
    return refused(order, ErrorCode::InvalidState,
                   "fill of " + std::to_string(quantity) +
                       " would exceed order quantity " +
                       std::to_string(order.quantity) + " (filled " +
                       std::to_string(order.filled_qty) + ")");
  }

  domain::Order next = order;
  const double prior_notional =
      order.avg_price ? *order.avg_price * static_cast<double>(order.filled_qty)
                      : 0.0;
  next.filled_qty = order.filled_qty + quantity;
  next.avg_price = (prior_notional + price * static_cast<double>(quantity)) /
                   static_cast<double>(next.filled_qty);

  if (next.filled_qty == next.quantity) {
    next.status = S::Filled;
    next.pre_cancel_status.reset();
    next.message = "filled";
  } else if (order.status == S::CancelRequested) {
    next.pre_cancel_status = S::PartiallyFilled;
  } else {
    next.status = S::PartiallyFilled;
  }
  return applied(order, std::move(next), now_ms);
}

Transition OrderStateMachine::onCancelConfirmed(const domain::Order& order,
                                                const std::string& message,
                                                std::int64_t now_ms) const {
  if (!isOpen(order.status)) {
    return ignored(order, lateEvent("cancel confirm", order));
  }
  domain::Order next = order;
  next.status = S::Cancelled;
  next.pre_cancel_status.reset();
  next.message = message.empty() ? "cancelled" : message;
  return applied(order, std::move(next), now_ms);
}

Transition OrderStateMachine::onCancelRejected(const domain::Order& order,
                                               const std::string& message,
                                               std::int64_t now_ms) const {
  if (order.status != S::CancelRequested) {
    return ignored(order, std::string("cancel reject while ") +
                              domain::toString(order.status));
  }
  domain::Order next = order;
  next.status = order.pre_cancel_status.value_or(S::Acked);
  next.pre_cancel_status.reset();
  next.message = message.empty() ? "cancel rejected" : message;
  return applied(order, std::move(next), now_ms);
}

Transition OrderStateMachine::onReject(const domain::Order& order,
                                       const std::string& message,
                                       std::int64_t now_ms) const {
  if (!isOpen(order.status)) {
    return ignored(order, lateEvent("reject", order));
  }
  domain::Order next = order;
  next.status = S::Rejected;
  next.pre_cancel_status.reset();
  next.message = message.empty() ? "rejected by broker" : message;
  return applied(order, std::move(next), now_ms);
}

Transition OrderStateMachine::onError(const domain::Order& order,
                                      const std::string& message,
                                      std::int64_t now_ms) const {
  if (domain::isTerminal(order.status)) {
    return ignored(order, lateEvent("error", order));
  }
  domain::Order next = order;
  next.status = S::Error;
  next.pre_cancel_status.reset();
  next.message = message.empty() ? "broker error" : message;
  return applied(order, std::move(next), now_ms);
}

// -----------------------------------------------------------------------------
// mapBrokerStatus
// -----------------------------------------------------------------------------
std::optional<domain::OrderStatus> OrderStateMachine::mapBrokerStatus(
    const std::string& status) {
  if (status == "PendingSubmit" || status == "PreSubmitted") return S::Submitted;
  if (status == "Submitted") return S::Acked;
  if (status == "PendingCancel") return S::CancelRequested;
  if (status == "Cancelled" || status == "ApiCancelled") return S::Cancelled;
  if (status == "Inactive") return S::Rejected;
  return std::nullopt;
}

bool OrderStateMachine::isKnownBrokerStatus(const std::string& status) {
  return mapBrokerStatus(status).has_value() || status == "Filled" ||
         status == "ApiPending";
}

}  // namespace oms
