#include "oms/reconciler/event_reconciler.hpp"
#include "oms/domain/enum_codec.hpp"
#include "oms/domain/position_key.hpp"
#include "oms/events/fill_recorded_event.hpp"
#include "oms/events/order_update_event.hpp"
#include "oms/events/position_update_event.hpp"
#include "oms/events/session_status_event.hpp"
#include "oms/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>
#include <utility>
#include <vector>

namespace oms {

namespace {

// How long the consumer waits on an empty queue before re-checking
// running_ and sweeping the unbound buffer.
constexpr std::chrono::milliseconds kIdleWaitTimeout{10};

// Commission reports waiting for their execution.
constexpr std::chrono::milliseconds kPendingCommissionTtl{10 * 60 * 1000};

// Broker error: cancel attempted on an order that is not cancellable.
constexpr int kCancelNotCancellable = 161;

// Order-scoped broker notices that refuse a request without ending the
// order: modify/cancel of an order in the wrong state, cancel confirmations
// and the 21xx warning range.
bool isFatalOrderError(int code) {
  if (code == 104 || code == kCancelNotCancellable || code == 202 ||
      code == 399) {
    return false;
  }
  return code < 2100 || code > 2199;
}

}  // namespace

EventReconciler::EventReconciler(OrderLedger& ledger,
                                 IdentityRegistry& registry,
                                 OrderLockTable& locks, EventBus& bus,
                                 const ITimeProvider& time_provider,
                                 const EngineConfig& config)
    : ledger_(ledger),
      registry_(registry),
      locks_(locks),
      bus_(bus),
      time_provider_(time_provider),
      foreign_order_policy_(config.foreign_order_policy),
      default_account_(config.default_account),
      default_exchange_(config.default_exchange) {}

EventReconciler::~EventReconciler() { stop(); }

void EventReconciler::setConnectionHook(ConnectionHook hook) {
  connection_hook_ = std::move(hook);
}

BrokerEventSink EventReconciler::sink() {
  return [this](BrokerEvent event) { enqueue(std::move(event)); };
}

void EventReconciler::enqueue(BrokerEvent event) {
  enqueued_.fetch_add(1);
  queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// start / stop
// -----------------------------------------------------------------------------
void EventReconciler::start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread([this] { runLoop(); });
}

void EventReconciler::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  for (BrokerEvent& event : queue_.drain()) {
    processGuarded(event);
    markCompleted();
  }
}

void EventReconciler::runLoop() {
  while (running_.load()) {
    if (auto event = queue_.pop_for(kIdleWaitTimeout)) {
      processGuarded(*event);
      markCompleted();
    }
    sweep();
  }
}

void EventReconciler::markCompleted() {
  {
    std::lock_guard lock(idle_mutex_);
    completed_.fetch_add(1);
  }
  idle_cv_.notify_all();
}

bool EventReconciler::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(idle_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] {
    return completed_.load() >= enqueued_.load();
  });
}

ReconcilerStats EventReconciler::stats() const {
  std::lock_guard lock(stats_mutex_);
  return stats_;
}

void EventReconciler::count(std::uint64_t ReconcilerStats::*field) {
  std::lock_guard lock(stats_mutex_);
  ++(stats_.*field);
}

// -----------------------------------------------------------------------------
// process
// -----------------------------------------------------------------------------
void EventReconciler::process(const BrokerEvent& event) {
  std::visit([this](const auto& e) { handle(e); }, event);
  count(&ReconcilerStats::processed);
}

void EventReconciler::processGuarded(const BrokerEvent& event) {
  try {
    process(event);
  } catch (const std::exception& e) {
    std::cerr << "[EventReconciler] WARNING: failed to apply "
              << brokerEventName(event) << ": " << e.what() << "\n";
    count(&ReconcilerStats::dropped);
  }
}

void EventReconciler::sweep() {
  for (IdentityRegistry::BufferedEvent& ready : registry_.takeReady()) {
    processGuarded(ready.event);
  }
  for (const IdentityRegistry::BufferedEvent& stale : registry_.expire()) {
    std::cerr << "[EventReconciler] WARNING: " << toString(ErrorCode::UnknownOrder)
              << ": dropping " << brokerEventName(stale.event)
              << " for broker_order_id=" << stale.broker_order_id
              << " received at " << stale.received_ms << " ms\n";
    count(&ReconcilerStats::expired);
  }
  expirePendingCommissions();
}

// -----------------------------------------------------------------------------
// route
// -----------------------------------------------------------------------------
std::optional<domain::OrderId> EventReconciler::route(
    domain::BrokerOrderId broker_order_id,
    std::optional<domain::OrderId> client_order_id, const BrokerEvent& event) {
  if (auto order_id = registry_.resolve(broker_order_id)) {
    releaseBuffered(broker_order_id);
    return order_id;
  }

  if (client_order_id && ledger_.getOrder(*client_order_id)) {
    const ErrorCode bound = registry_.bind(*client_order_id, broker_order_id);
    if (bound == ErrorCode::None) {
      releaseBuffered(broker_order_id);
      return client_order_id;
    }
    std::cerr << "[EventReconciler] WARNING: " << toString(bound)
              << ": order_id=" << *client_order_id
              << " cannot take broker_order_id=" << broker_order_id
              << "; dropping " << brokerEventName(event) << "\n";
    count(&ReconcilerStats::dropped);
    return std::nullopt;
  }

  registry_.bufferEvent(broker_order_id, event);
  count(&ReconcilerStats::buffered);
  return std::nullopt;
}

void EventReconciler::releaseBuffered(domain::BrokerOrderId broker_order_id) {
  for (const BrokerEvent& parked : registry_.takeBuffered(broker_order_id)) {
    processGuarded(parked);
  }
}

// -----------------------------------------------------------------------------
// applyTransition
// -----------------------------------------------------------------------------
void EventReconciler::applyTransition(
    domain::OrderId order_id, domain::BrokerOrderId broker_order_id,
    const char* what,
    const std::function<Transition(const domain::Order&)>& step) {
  auto order_mutex = locks_.mutexFor(order_id);
  std::lock_guard lock(*order_mutex);

  std::optional<domain::Order> order = ledger_.getOrder(order_id);
  if (!order) {
    std::cerr << "[EventReconciler] WARNING: " << what << " for order_id="
              << order_id << " which is not in the ledger\n";
    count(&ReconcilerStats::dropped);
    return;
  }

  const bool learned_broker_id = !order->broker_order_id.has_value();
  if (learned_broker_id) {
    order->broker_order_id = broker_order_id;
  }

  Transition t = step(*order);
  if (t.applied()) {
    store(t.order, t.previous_status);
    return;
  }
  if (learned_broker_id) {
    store(*order, order->status);
  }
  if (t.refused()) {
    std::cerr << "[EventReconciler] WARNING: " << what << " refused for order_id="
              << order_id << " (" << toString(t.error) << "): " << t.reason
              << "\n";
    count(&ReconcilerStats::dropped);
  }
}

bool EventReconciler::store(const domain::Order& order,
                            domain::OrderStatus previous) {
  if (ledger_.putOrder(order) != ErrorCode::None) {
    count(&ReconcilerStats::dropped);
    return false;
  }
  bus_.publish(OrderUpdateEvent{order, previous, time_provider_.now_ms()});
  return true;
}

// -----------------------------------------------------------------------------
// Order-scoped events
// -----------------------------------------------------------------------------
void EventReconciler::handle(const BrokerAck& ack) {
  auto order_id = route(ack.broker_order_id, ack.client_order_id, ack);
  if (!order_id) {
    return;
  }
  const std::int64_t now = time_provider_.now_ms();
  applyTransition(*order_id, ack.broker_order_id, "ack",
                  [&](const domain::Order& o) { return machine_.onAck(o, now); });
}

void EventReconciler::handle(const BrokerFill& fill) {
  if (fill.exec_id.empty()) {
    std::cerr << "[EventReconciler] WARNING: fill for broker_order_id="
              << fill.broker_order_id << " has no exec_id; dropping\n";
    count(&ReconcilerStats::dropped);
    return;
  }
  auto order_id = route(fill.broker_order_id, fill.client_order_id, fill);
  if (!order_id) {
    return;
  }

  auto order_mutex = locks_.mutexFor(*order_id);
  std::lock_guard lock(*order_mutex);

  std::optional<domain::Order> order = ledger_.getOrder(*order_id);
  if (!order) {
    count(&ReconcilerStats::dropped);
    return;
  }
  if (ledger_.hasFill(*order_id, fill.exec_id)) {
    std::cout << "[EventReconciler] Duplicate fill exec_id=" << fill.exec_id
              << " for order_id=" << *order_id << " ignored\n";
    count(&ReconcilerStats::duplicate_fills);
    return;
  }
  if (!order->broker_order_id) {
    order->broker_order_id = fill.broker_order_id;
  }

  const std::int64_t now = time_provider_.now_ms();
  const std::int64_t event_ms = fill.event_ms > 0 ? fill.event_ms : now;

  // An adopted order already counts the executions its snapshot reported;
  // replays of those are recorded but not applied a second time.
  const std::int64_t absorbed =
      fill.quantity > 0 ? std::min(order->adopted_filled_qty, fill.quantity) : 0;
  const std::int64_t applied_qty = fill.quantity - absorbed;
  order->adopted_filled_qty -= absorbed;

  Transition t;
  if (absorbed == 0 || applied_qty > 0) {
    t = machine_.onFill(*order, applied_qty, fill.price, now);
  } else {
    t.outcome = Transition::Outcome::Applied;
    t.previous_status = order->status;
    t.order = *order;
    t.order.updated_ms = now;
  }
  if (!t.applied()) {
    std::cerr << "[EventReconciler] WARNING: dropping fill exec_id="
              << fill.exec_id << " for order_id=" << *order_id << ": "
              << t.reason << "\n";
    count(&ReconcilerStats::dropped);
    return;
  }

  domain::Fill record;
  record.order_id = *order_id;
  record.exec_id = fill.exec_id;
  record.price = fill.price;
  record.filled_qty = fill.quantity;
  record.symbol = order->symbol;
  record.side = order->side;
  record.time = fill.time.empty() ? format_fill_time(event_ms) : fill.time;
  record.broker_order_id = fill.broker_order_id;
  record.created_ms = now;

  std::optional<domain::Fill> stored = ledger_.appendFill(record);
  if (!stored) {
    count(&ReconcilerStats::duplicate_fills);
    return;
  }
  if (!store(t.order, t.previous_status)) {
    std::cerr << "[EventReconciler] WARNING: order_id=" << *order_id
              << " not updated after fill exec_id=" << fill.exec_id << "\n";
  }
  bus_.publish(FillRecordedEvent{*stored, now});
  applyPendingCommission(*order_id, fill.exec_id);

  if (applied_qty == 0) {
    std::cout << "[EventReconciler] exec_id=" << fill.exec_id
              << " already counted by the adoption of order_id=" << *order_id
              << "\n";
    return;
  }
  const domain::PositionKey key = domain::positionKeyFor(
      order->symbol, order->instrument,
      fill.account.empty() ? default_account_ : fill.account,
      fill.exchange.empty() ? default_exchange_ : fill.exchange, fill.con_id);
  const double signed_quantity =
      order->side == domain::Side::Buy ? static_cast<double>(applied_qty)
                                       : -static_cast<double>(applied_qty);
  PositionChange change =
      ledger_.applyFillDelta(key, signed_quantity, fill.price, event_ms);
  bus_.publish(PositionUpdateEvent{change.position, change.removed, now});
}

// -----------------------------------------------------------------------------
// Commission reports
// -----------------------------------------------------------------------------
// A report that overtakes its execution is held until the fill is recorded,
// and dropped once older than kPendingCommissionTtl.
// -----------------------------------------------------------------------------
void EventReconciler::handle(const BrokerCommissionReport& report) {
  if (report.exec_id.empty()) {
    std::cerr << "[EventReconciler] WARNING: commission report for "
                 "broker_order_id="
              << report.broker_order_id << " has no exec_id; dropping\n";
    count(&ReconcilerStats::dropped);
    return;
  }
  auto order_id = route(report.broker_order_id, std::nullopt, report);
  if (!order_id) {
    return;
  }

  auto order_mutex = locks_.mutexFor(*order_id);
  std::lock_guard lock(*order_mutex);
  if (!ledger_.hasFill(*order_id, report.exec_id)) {
    pending_commissions_[{*order_id, report.exec_id}] =
        PendingCommission{report, time_provider_.now_ms()};
    return;
  }
  applyCommission(*order_id, report);
}

void EventReconciler::applyPendingCommission(domain::OrderId order_id,
                                             const std::string& exec_id) {
  auto it = pending_commissions_.find({order_id, exec_id});
  if (it == pending_commissions_.end()) {
    return;
  }
  const BrokerCommissionReport report = it->second.report;
  pending_commissions_.erase(it);
  applyCommission(order_id, report);
}

// Caller holds the order lock.
void EventReconciler::applyCommission(domain::OrderId order_id,
                                      const BrokerCommissionReport& report) {
  std::optional<CommissionChange> change =
      ledger_.applyCommission(order_id, report.exec_id, report.commission,
                              report.currency, report.realized_pnl);
  std::optional<domain::Order> order = ledger_.getOrder(order_id);
  if (!change || !order) {
    count(&ReconcilerStats::dropped);
    return;
  }

  order->commission = order->commission.value_or(0.0) + report.commission -
                      change->previous_commission.value_or(0.0);
  order->commission_currency = report.currency;
  if (report.realized_pnl) {
    order->realized_pnl = order->realized_pnl.value_or(0.0) +
                          *report.realized_pnl -
                          change->previous_realized_pnl.value_or(0.0);
  }
  order->updated_ms = time_provider_.now_ms();
  store(*order, order->status);
  count(&ReconcilerStats::commissions);
}

void EventReconciler::expirePendingCommissions() {
  const std::int64_t cutoff = time_provider_.now_ms() - kPendingCommissionTtl.count();
  for (auto it = pending_commissions_.begin(); it != pending_commissions_.end();) {
    if (it->second.received_ms < cutoff) {
      std::cerr << "[EventReconciler] WARNING: no fill exec_id="
                << it->first.second << " for order_id=" << it->first.first
                << "; dropping its commission report\n";
      count(&ReconcilerStats::expired);
      it = pending_commissions_.erase(it);
    } else {
      ++it;
    }
  }
}

void EventReconciler::handle(const BrokerStatus& status) {
  const std::optional<domain::OrderStatus> target =
      OrderStateMachine::mapBrokerStatus(status.status);
  if (!target) {
    if (!OrderStateMachine::isKnownBrokerStatus(status.status)) {
      std::cerr << "[EventReconciler] WARNING: unrecognised broker status '"
                << status.status << "' for broker_order_id="
                << status.broker_order_id << "\n";
      count(&ReconcilerStats::dropped);
    }
    return;
  }
  auto order_id = route(status.broker_order_id, status.client_order_id, status);
  if (!order_id) {
    return;
  }
  const std::int64_t now = time_provider_.now_ms();
  applyTransition(*order_id, status.broker_order_id, "status",
                  [&](const domain::Order& o) {
                    return machine_.onBrokerStatus(o, *target, status.message,
                                                   now);
                  });
}

void EventReconciler::handle(const BrokerCancelReject& reject) {
  auto order_id = route(reject.broker_order_id, std::nullopt, reject);
  if (!order_id) {
    return;
  }
  const std::int64_t now = time_provider_.now_ms();
  applyTransition(*order_id, reject.broker_order_id, "cancel reject",
                  [&](const domain::Order& o) {
                    return machine_.onCancelRejected(o, reject.message, now);
                  });
}

void EventReconciler::handle(const BrokerReject& reject) {
  auto order_id = route(reject.broker_order_id, reject.client_order_id, reject);
  if (!order_id) {
    return;
  }
  const std::int64_t now = time_provider_.now_ms();
  applyTransition(*order_id, reject.broker_order_id, "reject",
                  [&](const domain::Order& o) {
                    return machine_.onReject(o, reject.message, now);
                  });
}

void EventReconciler::handle(const BrokerErrorNotice& notice) {
  if (!notice.broker_order_id) {
    std::cerr << "[EventReconciler] WARNING: broker error " << notice.code
              << ": " << notice.message << "\n";
    return;
  }
  auto order_id = route(*notice.broker_order_id, std::nullopt, notice);
  if (!order_id) {
    return;
  }

  const std::string text =
      "broker error " + std::to_string(notice.code) + ": " + notice.message;
  const std::int64_t now = time_provider_.now_ms();
  if (isFatalOrderError(notice.code)) {
    applyTransition(*order_id, *notice.broker_order_id, "error",
                    [&](const domain::Order& o) {
                      return machine_.onError(o, text, now);
                    });
    return;
  }

  std::cerr << "[EventReconciler] WARNING: order_id=" << *order_id << " "
            << text << "\n";
  auto order_mutex = locks_.mutexFor(*order_id);
  std::lock_guard lock(*order_mutex);
  std::optional<domain::Order> order = ledger_.getOrder(*order_id);
  if (!order) {
    return;
  }
  if (notice.code == kCancelNotCancellable &&
      order->status == domain::OrderStatus::CancelRequested) {
    Transition t = machine_.onCancelRejected(*order, text, now);
    store(t.order, t.previous_status);
    return;
  }
  order->message = text;
  order->updated_ms = now;
  store(*order, order->status);
}

// -----------------------------------------------------------------------------
// Account-level snapshots
// -----------------------------------------------------------------------------
void EventReconciler::handle(const PositionSnapshot& snapshot) {
  const std::int64_t as_of =
      snapshot.event_ms > 0 ? snapshot.event_ms : time_provider_.now_ms();
  const std::vector<PositionChange> changes =
      ledger_.applyPositionSnapshot(snapshot.rows, as_of);
  const std::int64_t now = time_provider_.now_ms();
  for (const PositionChange& change : changes) {
    bus_.publish(PositionUpdateEvent{change.position, change.removed, now});
  }
}

void EventReconciler::handle(const AccountValueSnapshot& snapshot) {
  for (const domain::AccountValue& value : snapshot.values) {
    ledger_.upsertAccountValue(value);
  }
}

// -----------------------------------------------------------------------------
// OpenOrderSnapshot
// -----------------------------------------------------------------------------
//
// @details
// Never parked in the unbound buffer: a snapshot row the engine cannot
// attribute belongs to an order placed outside this engine, and is handled
// by the foreign order policy right away.
// -----------------------------------------------------------------------------
void EventReconciler::handle(const OpenOrderSnapshot& snapshot) {
  std::optional<domain::OrderId> order_id =
      registry_.resolve(snapshot.broker_order_id);
  if (!order_id && snapshot.client_order_id &&
      ledger_.getOrder(*snapshot.client_order_id) &&
      registry_.bind(*snapshot.client_order_id, snapshot.broker_order_id) ==
          ErrorCode::None) {
    order_id = snapshot.client_order_id;
  }
  if (!order_id) {
    adoptForeignOrder(snapshot);
    return;
  }
  releaseBuffered(snapshot.broker_order_id);

  const std::optional<domain::OrderStatus> target =
      OrderStateMachine::mapBrokerStatus(snapshot.status);
  const std::int64_t now = time_provider_.now_ms();
  applyTransition(*order_id, snapshot.broker_order_id, "open order refresh",
                  [&](const domain::Order& o) {
                    if (snapshot.filled_qty > o.filled_qty) {
                      std::cerr << "[EventReconciler] WARNING: broker reports "
                                   "filled_qty="
                                << snapshot.filled_qty << " for order_id="
                                << o.id << ", ledger has " << o.filled_qty
                                << "; waiting for the executions\n";
                    }
                    if (!target) {
                      Transition none;
                      none.order = o;
                      none.previous_status = o.status;
                      return none;
                    }
                    return machine_.onBrokerStatus(o, *target, "", now);
                  });
}

void EventReconciler::adoptForeignOrder(const OpenOrderSnapshot& snapshot) {
  if (foreign_order_policy_ == ForeignOrderPolicy::Ignore) {
    std::cout << "[EventReconciler] Ignoring foreign broker_order_id="
              << snapshot.broker_order_id << " (" << snapshot.spec.symbol
              << ")\n";
    count(&ReconcilerStats::dropped);
    return;
  }
  if (snapshot.spec.symbol.empty() || snapshot.spec.quantity <= 0) {
    std::cerr << "[EventReconciler] WARNING: cannot adopt broker_order_id="
              << snapshot.broker_order_id << ": incomplete order details\n";
    count(&ReconcilerStats::dropped);
    return;
  }

  using S = domain::OrderStatus;
  const std::optional<S> mapped =
      OrderStateMachine::mapBrokerStatus(snapshot.status);
  std::int64_t filled =
      std::clamp<std::int64_t>(snapshot.filled_qty, 0, snapshot.spec.quantity);
  if (filled > 0 && (!snapshot.avg_price || *snapshot.avg_price <= 0.0)) {
    if (mapped == S::Filled) {
      std::cerr << "[EventReconciler] WARNING: cannot adopt filled "
                   "broker_order_id="
                << snapshot.broker_order_id << ": no average fill price\n";
      count(&ReconcilerStats::dropped);
      return;
    }
    std::cerr << "[EventReconciler] WARNING: broker_order_id="
              << snapshot.broker_order_id << " reports filled_qty=" << filled
              << " without an average price; adopting as unfilled\n";
    filled = 0;
  }

  const domain::OrderId id = registry_.allocate();
  const ErrorCode bound = registry_.bind(id, snapshot.broker_order_id);
  if (bound != ErrorCode::None) {
    std::cerr << "[EventReconciler] WARNING: " << toString(bound)
              << ": cannot adopt broker_order_id=" << snapshot.broker_order_id
              << "\n";
    count(&ReconcilerStats::dropped);
    return;
  }

  auto order_mutex = locks_.mutexFor(id);
  std::lock_guard lock(*order_mutex);

  const std::int64_t now = time_provider_.now_ms();

  domain::Order order;
  order.id = id;
  order.broker_order_id = snapshot.broker_order_id;
  order.symbol = snapshot.spec.symbol;
  order.instrument = snapshot.spec.instrument;
  order.side = snapshot.spec.side;
  order.quantity = snapshot.spec.quantity;
  order.order_type = snapshot.spec.order_type;
  order.price = snapshot.spec.price;
  order.tif = snapshot.spec.tif;
  order.filled_qty = filled;
  order.adopted_filled_qty = filled;
  if (filled > 0) {
    order.avg_price = snapshot.avg_price;
  }
  order.message = "adopted from broker snapshot";
  order.created_ms = now;
  order.updated_ms = now;

  const S working = filled > 0 ? S::PartiallyFilled : S::Acked;
  if (mapped && domain::isTerminal(*mapped)) {
    order.status = *mapped;
  } else if (filled == order.quantity) {
    order.status = S::Filled;
  } else if (mapped == S::CancelRequested) {
    order.status = S::CancelRequested;
    order.pre_cancel_status = working;
  } else if (filled > 0 || !mapped) {
    order.status = working;
  } else {
    order.status = *mapped;
  }

  if (store(order, S::New)) {
    std::cout << "[EventReconciler] Adopted broker_order_id="
              << snapshot.broker_order_id << " as order_id=" << id << " ("
              << order.symbol << " " << domain::toString(order.status)
              << ")\n";
    count(&ReconcilerStats::adopted);
  }
}

// -----------------------------------------------------------------------------
// Connection events
// -----------------------------------------------------------------------------
void EventReconciler::handle(const ConnectionLost& lost) {
  std::cerr << "[EventReconciler] WARNING: broker connection lost: "
            << lost.reason << "\n";
  publishConnection(false, lost.reason);
}

void EventReconciler::handle(const ConnectionRestored&) {
  std::cout << "[EventReconciler] Broker connection restored\n";
  publishConnection(true, "connection restored");
}

void EventReconciler::publishConnection(bool connected,
                                        const std::string& detail) {
  if (connection_hook_) {
    connection_hook_(connected, detail);
  }
  bus_.publish(SessionStatusEvent{connected, detail, time_provider_.now_ms()});
}

}  // namespace oms
