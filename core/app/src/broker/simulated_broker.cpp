#include "oms/broker/simulated_broker.hpp"
#include "oms/domain/position_key.hpp"
#include "oms/domain/error_code.hpp"
#include "oms/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace oms {

namespace {

bool isOpenStatus(const std::string& status) {
  return status != "Filled" && status != "Cancelled";
}

}  // namespace

SimulatedBroker::SimulatedBroker(const ITimeProvider& time_provider)
    : SimulatedBroker(time_provider, Options{}) {}

SimulatedBroker::SimulatedBroker(const ITimeProvider& time_provider,
                                 Options options)
    : time_provider_(time_provider),
      options_(std::move(options)),
      next_broker_order_id_(options_.first_broker_order_id) {}

// -----------------------------------------------------------------------------
// connect / disconnect
// -----------------------------------------------------------------------------
void SimulatedBroker::connect() {
  bool restored = false;
  {
    std::lock_guard lock(mutex_);
    if (connected_) {
      return;
    }
    restored = ever_connected_;
    connected_ = true;
    ever_connected_ = true;
  }
  std::cout << "[SimulatedBroker] Connected (account=" << options_.account
            << ")\n";
  if (restored) {
    emit({ConnectionRestored{time_provider_.now_ms()}});
  }
}

void SimulatedBroker::disconnect() {
  std::lock_guard lock(mutex_);
  connected_ = false;
}

bool SimulatedBroker::isConnected() const {
  std::lock_guard lock(mutex_);
  return connected_;
}

void SimulatedBroker::attachEventSink(BrokerEventSink sink) {
  std::lock_guard lock(mutex_);
  sink_ = std::move(sink);
}

void SimulatedBroker::requireConnected() const {
  if (!connected_) {
    throw BrokerError("simulated broker is not connected");
  }
}

// -----------------------------------------------------------------------------
// submit: book the order, then ack and optionally fill it
// -----------------------------------------------------------------------------
std::optional<domain::BrokerOrderId> SimulatedBroker::submit(
    const SubmitRequest& request) {
  std::vector<BrokerEvent> events;
  domain::BrokerOrderId broker_id = 0;
  {
    std::lock_guard lock(mutex_);
    requireConnected();

    broker_id = next_broker_order_id_++;
    ++submit_count_;

    BookEntry entry;
    entry.broker_order_id = broker_id;
    entry.client_order_id = request.client_order_id;
    entry.spec = request.spec;
    auto& booked = book_[broker_id] = entry;

    const std::int64_t now = time_provider_.now_ms();
    if (options_.auto_ack) {
      events.emplace_back(BrokerAck{broker_id, request.client_order_id, now});
    }
    if (options_.auto_fill) {
      applyExecution(booked, booked.spec.quantity, fillPriceFor(booked.spec),
                     events);
    }
  }
  emit(events);
  return broker_id;
}

// -----------------------------------------------------------------------------
// cancel
// -----------------------------------------------------------------------------
void SimulatedBroker::cancel(domain::BrokerOrderId broker_order_id) {
  std::vector<BrokerEvent> events;
  {
    std::lock_guard lock(mutex_);
    requireConnected();
    const std::int64_t now = time_provider_.now_ms();

    auto it = book_.find(broker_order_id);
    if (it == book_.end()) {
      events.emplace_back(BrokerCancelReject{
          broker_order_id, "Order to cancel not found", now});
    } else if (!isOpenStatus(it->second.status)) {
      events.emplace_back(BrokerCancelReject{
          broker_order_id,
          "Order already " + it->second.status + "; cannot cancel", now});
    } else {
      it->second.status = "Cancelled";
      events.emplace_back(BrokerStatus{broker_order_id,
                                       it->second.client_order_id,
                                       "Cancelled", "", now});
    }
  }
  emit(events);
}

// -----------------------------------------------------------------------------
// modify
// -----------------------------------------------------------------------------
void SimulatedBroker::modify(domain::BrokerOrderId broker_order_id,
                             const domain::ModifyRequest& changes) {
  std::vector<BrokerEvent> events;
  {
    std::lock_guard lock(mutex_);
    requireConnected();

    auto it = book_.find(broker_order_id);
    if (it == book_.end() || !isOpenStatus(it->second.status)) {
      events.emplace_back(BrokerErrorNotice{
          broker_order_id, 104, "Cannot modify a filled or unknown order",
          time_provider_.now_ms()});
    } else {
      domain::OrderSpec& spec = it->second.spec;
      if (changes.quantity) spec.quantity = *changes.quantity;
      if (changes.order_type) spec.order_type = *changes.order_type;
      if (changes.price) spec.price = changes.price;
      if (changes.tif) spec.tif = *changes.tif;
      if (spec.order_type == domain::OrderType::Market) spec.price.reset();
    }
  }
  emit(events);
}

// -----------------------------------------------------------------------------
// requestSnapshot: open orders, positions, account values
// -----------------------------------------------------------------------------
void SimulatedBroker::requestSnapshot() {
  std::vector<BrokerEvent> events;
  {
    std::lock_guard lock(mutex_);
    requireConnected();
    const std::int64_t now = time_provider_.now_ms();

    for (const auto& [id, entry] : book_) {
      if (!isOpenStatus(entry.status)) {
        continue;
      }
      OpenOrderSnapshot snap;
      snap.broker_order_id = id;
      snap.client_order_id = entry.client_order_id;
      snap.spec = entry.spec;
      snap.status = entry.status;
      snap.filled_qty = entry.filled_qty;
      if (entry.filled_qty > 0) {
        snap.avg_price = entry.notional / static_cast<double>(entry.filled_qty);
      }
      snap.event_ms = now;
      events.emplace_back(std::move(snap));
    }

    PositionSnapshot positions;
    positions.event_ms = now;
    for (const auto& [name, holding] : holdings_) {
      domain::Position row;
      row.key = holding.key;
      row.position = holding.quantity;
      row.avg_cost = holding.avg_cost;
      row.as_of_ms = now;
      positions.rows.push_back(row);
    }
    events.emplace_back(std::move(positions));

    AccountValueSnapshot account;
    account.event_ms = now;
    account.values.push_back(
        {options_.account, "NetLiquidation", options_.currency, "1000000.00"});
    account.values.push_back(
        {options_.account, "BuyingPower", options_.currency, "4000000.00"});
    account.values.push_back(
        {options_.account, "AccountType", "", "INDIVIDUAL"});
    events.emplace_back(std::move(account));
  }
  emit(events);
}

// -----------------------------------------------------------------------------
// Test hooks
// -----------------------------------------------------------------------------
bool SimulatedBroker::fill(domain::BrokerOrderId broker_order_id,
                           std::int64_t quantity, double price) {
  std::vector<BrokerEvent> events;
  {
    std::lock_guard lock(mutex_);
    auto it = book_.find(broker_order_id);
    if (it == book_.end() || !isOpenStatus(it->second.status)) {
      return false;
    }
    applyExecution(it->second, quantity, price, events);
  }
  emit(events);
  return true;
}

void SimulatedBroker::injectEvent(BrokerEvent event) {
  emit({std::move(event)});
}

domain::BrokerOrderId SimulatedBroker::addForeignOrder(
    const domain::OrderSpec& spec) {
  std::lock_guard lock(mutex_);
  const domain::BrokerOrderId broker_id = next_broker_order_id_++;
  BookEntry entry;
  entry.broker_order_id = broker_id;
  entry.spec = spec;
  book_[broker_id] = entry;
  return broker_id;
}

void SimulatedBroker::dropConnection(const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    connected_ = false;
  }
  std::cerr << "[SimulatedBroker] WARNING: connection dropped: " << reason
            << "\n";
  emit({ConnectionLost{reason, time_provider_.now_ms()}});
}

std::size_t SimulatedBroker::submitCount() const {
  std::lock_guard lock(mutex_);
  return submit_count_;
}

// -----------------------------------------------------------------------------
// applyExecution: update book and holdings, queue the fill and its
// commission report
// -----------------------------------------------------------------------------
void SimulatedBroker::applyExecution(BookEntry& entry, std::int64_t quantity,
                                     double price,
                                     std::vector<BrokerEvent>& events) {
  const std::int64_t now = time_provider_.now_ms();
  entry.filled_qty += quantity;
  entry.notional += static_cast<double>(quantity) * price;
  if (entry.filled_qty >= entry.spec.quantity) {
    entry.status = "Filled";
  }

  const domain::PositionKey key = domain::positionKeyFor(
      entry.spec.symbol, entry.spec.instrument, options_.account,
      options_.exchange, 0);
  Holding& holding = holdings_[key.sec_type + "|" + key.symbol];
  holding.key = key;
  const double signed_qty = entry.spec.side == domain::Side::Buy
                                ? static_cast<double>(quantity)
                                : -static_cast<double>(quantity);
  const double new_qty = holding.quantity + signed_qty;
  if (holding.quantity == 0.0 || (holding.quantity > 0) == (signed_qty > 0)) {
    holding.avg_cost = (holding.quantity * holding.avg_cost + signed_qty * price) /
                       new_qty;
  } else if ((holding.quantity > 0) != (new_qty > 0) && new_qty != 0.0) {
    holding.avg_cost = price;
  }
  holding.quantity = new_qty;

  BrokerFill fill;
  fill.broker_order_id = entry.broker_order_id;
  fill.client_order_id = entry.client_order_id;
  fill.exec_id = "SIM." + std::to_string(next_exec_seq_++);
  fill.price = price;
  fill.quantity = quantity;
  fill.time = format_fill_time(now);
  fill.account = options_.account;
  fill.exchange = options_.exchange;
  fill.event_ms = now;

  BrokerCommissionReport report;
  report.broker_order_id = entry.broker_order_id;
  report.exec_id = fill.exec_id;
  report.commission = std::max(options_.min_commission,
                               options_.commission_per_share *
                                   static_cast<double>(quantity));
  report.currency = options_.currency;
  report.event_ms = now;

  events.emplace_back(std::move(fill));
  events.emplace_back(std::move(report));
}

double SimulatedBroker::fillPriceFor(const domain::OrderSpec& spec) const {
  if (spec.order_type != domain::OrderType::Market && spec.price) {
    return *spec.price;
  }
  return options_.market_price;
}

// -----------------------------------------------------------------------------
// emit: deliver outside the lock, in order
// -----------------------------------------------------------------------------
void SimulatedBroker::emit(const std::vector<BrokerEvent>& events) {
  BrokerEventSink sink;
  {
    std::lock_guard lock(mutex_);
    sink = sink_;
  }
  if (!sink) {
    return;
  }
  for (const auto& event : events) {
    sink(event);
  }
}

}  // namespace oms
