#include "oms/commands/command_processor.hpp"
#include "oms/domain/enum_codec.hpp"

#include <cctype>
#include <iostream>
#include <mutex>

namespace oms {

namespace {

bool isExpiry(const std::string& expiry) {
  if (expiry.size() != 8) {
    return false;
  }
  for (char c : expiry) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

CommandResult refusal(ErrorCode error,
                      std::optional<domain::OrderStatus> status,
                      std::string message) {
  CommandResult r;
  r.ok = false;
  r.error = error;
  r.status = status;
  r.message = std::move(message);
  return r;
}

}  // namespace

CommandProcessor::CommandProcessor(OrderLedger& ledger,
                                   IdentityRegistry& registry,
                                   SessionGuard& session,
                                   OrderLockTable& locks, EventBus& bus,
                                   const ITimeProvider& time_provider)
    : ledger_(ledger),
      registry_(registry),
      session_(session),
      locks_(locks),
      bus_(bus),
      time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
std::optional<std::string> CommandProcessor::validate(
    const domain::OrderSpec& spec) {
  if (spec.symbol.empty()) {
    return std::string("symbol must be a non-empty string");
  }
  if (std::isspace(static_cast<unsigned char>(spec.symbol.front())) ||
      std::isspace(static_cast<unsigned char>(spec.symbol.back()))) {
    return std::string("symbol must not carry surrounding whitespace");
  }
  if (spec.quantity <= 0) {
    return std::string("quantity must be a positive integer");
  }

  const bool priced = spec.order_type == domain::OrderType::Limit ||
                      spec.order_type == domain::OrderType::Stop;
  if (priced && (!spec.price || *spec.price <= 0.0)) {
    return std::string(domain::toString(spec.order_type)) +
           " order requires a positive price";
  }
  if (!priced && spec.price) {
    return std::string("MKT order must not carry a price");
  }

  if (const auto* option = std::get_if<domain::OptionContract>(&spec.instrument)) {
    if (!isExpiry(option->expiry)) {
      return std::string("option expiry must be YYYYMMDD");
    }
    if (option->strike <= 0.0) {
      return std::string("option strike must be positive");
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// place
// -----------------------------------------------------------------------------
PlaceResult CommandProcessor::place(const domain::OrderSpec& spec) {
  PlaceResult result;
  if (auto problem = validate(spec)) {
    result.error = ErrorCode::ValidationError;
    result.message = *problem;
    return result;
  }

  const domain::OrderId id = registry_.allocate();
  auto order_mutex = locks_.mutexFor(id);
  std::lock_guard lock(*order_mutex);

  const std::int64_t now = time_provider_.now_ms();
  domain::Order order;
  order.id = id;
  order.symbol = spec.symbol;
  order.instrument = spec.instrument;
  order.side = spec.side;
  order.quantity = spec.quantity;
  order.order_type = spec.order_type;
  order.price = spec.price;
  order.tif = spec.tif;
  order.status = domain::OrderStatus::New;
  order.created_ms = now;
  order.updated_ms = now;
  if (!store(order, domain::OrderStatus::New)) {
    result.error = ErrorCode::InvalidState;
    result.message = "ledger refused new order";
    result.order_id = id;
    return result;
  }

  Transition pending = machine_.markPendingSubmit(order, now);
  store(pending.order, pending.previous_status);

  result.order_id = id;
  result.status = pending.order.status;

  const BrokerCall<std::optional<domain::BrokerOrderId>> call =
      session_.submit(SubmitRequest{id, spec});

  // The reconciler cannot touch this order while we hold its lock.
  domain::Order current = ledger_.getOrder(id).value_or(pending.order);

  if (call.error == ErrorCode::BrokerUnavailable) {
    Transition failed =
        machine_.submitFailed(current, call.message, time_provider_.now_ms());
    if (failed.applied()) {
      store(failed.order, failed.previous_status);
    }
    std::cerr << "[CommandProcessor] WARNING: submit failed for order_id="
              << id << ": " << call.message << "\n";
    result.error = call.error;
    result.message = call.message;
    result.status = failed.order.status;
    return result;
  }

  if (call.error == ErrorCode::BrokerTimeout) {
    noteFailure(current, call.message);
    std::cerr << "[CommandProcessor] WARNING: submit timed out for order_id="
              << id << "\n";
    result.error = call.error;
    result.message = call.message;
    result.status = current.status;
    return result;
  }

  if (call.value) {
    const domain::BrokerOrderId broker_id = *call.value;
    if (registry_.bind(id, broker_id) == ErrorCode::None) {
      if (!current.broker_order_id) {
        domain::Order bound = current;
        bound.broker_order_id = broker_id;
        bound.updated_ms = time_provider_.now_ms();
        store(bound, current.status);
        current = bound;
      }
    } else {
      std::cerr << "[CommandProcessor] WARNING: order_id=" << id
                << " could not bind broker_order_id=" << broker_id << "\n";
    }
  }

  result.broker_order_id = current.broker_order_id;
  result.status = current.status;
  result.message = current.message;
  std::cout << "[CommandProcessor] Placed order_id=" << id << " "
            << domain::toString(spec.side) << " " << spec.quantity << " "
            << spec.symbol << " status=" << domain::toString(result.status)
            << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// cancel
// -----------------------------------------------------------------------------
CommandResult CommandProcessor::cancel(domain::OrderId order_id) {
  auto order_mutex = locks_.mutexFor(order_id);
  std::lock_guard lock(*order_mutex);

  std::optional<domain::Order> order = ledger_.getOrder(order_id);
  if (!order) {
    return refusal(ErrorCode::NotFound, std::nullopt,
                   "order " + std::to_string(order_id) + " not found");
  }

  const std::int64_t now = time_provider_.now_ms();
  Transition check = machine_.requestCancel(*order, now);
  if (!check.applied()) {
    return refusal(ErrorCode::InvalidState, order->status, check.reason);
  }
  if (!order->broker_order_id) {
    return refusal(ErrorCode::InvalidState, order->status,
                   "order has no broker order id yet");
  }

  const BrokerCall<bool> call = session_.cancel(*order->broker_order_id);
  if (!call.ok()) {
    noteFailure(*order, call.message);
    std::cerr << "[CommandProcessor] WARNING: cancel failed for order_id="
              << order_id << ": " << call.message << "\n";
    return refusal(call.error, order->status, call.message);
  }

  store(check.order, check.previous_status);

  CommandResult r;
  r.ok = true;
  r.status = check.order.status;
  r.message = check.order.message;
  return r;
}

// -----------------------------------------------------------------------------
// modify
// -----------------------------------------------------------------------------
CommandResult CommandProcessor::modify(domain::OrderId order_id,
                                       const domain::ModifyRequest& changes) {
  auto order_mutex = locks_.mutexFor(order_id);
  std::lock_guard lock(*order_mutex);

  std::optional<domain::Order> order = ledger_.getOrder(order_id);
  if (!order) {
    return refusal(ErrorCode::NotFound, std::nullopt,
                   "order " + std::to_string(order_id) + " not found");
  }

  Transition check =
      machine_.checkModify(*order, changes, time_provider_.now_ms());
  if (check.refused()) {
    return refusal(check.error, order->status, check.reason);
  }
  if (!order->broker_order_id) {
    return refusal(ErrorCode::InvalidState, order->status,
                   "order has no broker order id yet");
  }

  const BrokerCall<bool> call =
      session_.modify(*order->broker_order_id, changes);
  if (!call.ok()) {
    noteFailure(*order, call.message);
    std::cerr << "[CommandProcessor] WARNING: modify failed for order_id="
              << order_id << ": " << call.message << "\n";
    return refusal(call.error, order->status, call.message);
  }

  store(check.order, check.previous_status);

  CommandResult r;
  r.ok = true;
  r.status = check.order.status;
  r.message = check.order.message;
  return r;
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
std::optional<domain::Order> CommandProcessor::getOrder(
    domain::OrderId order_id) const {
  return ledger_.getOrder(order_id);
}

std::vector<domain::Order> CommandProcessor::listOrders(int limit) const {
  return ledger_.listOrders(limit);
}

std::vector<domain::Fill> CommandProcessor::listFills(
    std::optional<domain::OrderId> order_id, int limit) const {
  return ledger_.listFills(order_id, limit);
}

std::vector<domain::Position> CommandProcessor::listPositions() const {
  return ledger_.listPositions();
}

std::vector<domain::AccountValue> CommandProcessor::listAccountValues() const {
  return ledger_.listAccountValues();
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
bool CommandProcessor::store(const domain::Order& order,
                             domain::OrderStatus previous) {
  if (ledger_.putOrder(order) != ErrorCode::None) {
    std::cerr << "[CommandProcessor] WARNING: ledger refused order_id="
              << order.id << " status=" << domain::toString(order.status)
              << "\n";
    return false;
  }
  OrderUpdateEvent update;
  update.order = order;
  update.previous_status = previous;
  update.timestamp_ms = time_provider_.now_ms();
  bus_.publish(update);
  return true;
}

void CommandProcessor::noteFailure(domain::Order order,
                                   const std::string& message) {
  const domain::OrderStatus status = order.status;
  order.message = message;
  order.updated_ms = time_provider_.now_ms();
  store(order, status);
}

}  // namespace oms
