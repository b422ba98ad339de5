#include "oms/identity/identity_registry.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace oms {

namespace {

// Moves the entries matching `pred` out of `buffer`, preserving the arrival
// order of both the extracted and the remaining entries.
template <typename Pred>
std::vector<IdentityRegistry::BufferedEvent> extractIf(
    std::deque<IdentityRegistry::BufferedEvent>& buffer, Pred pred) {
  std::vector<IdentityRegistry::BufferedEvent> extracted;
  std::deque<IdentityRegistry::BufferedEvent> remaining;
  for (auto& entry : buffer) {
    if (pred(entry)) {
      extracted.push_back(std::move(entry));
    } else {
      remaining.push_back(std::move(entry));
    }
  }
  buffer.swap(remaining);
  return extracted;
}

}  // namespace

IdentityRegistry::IdentityRegistry(const ITimeProvider& time_provider,
                                   std::chrono::milliseconds buffer_window)
    : time_provider_(time_provider), buffer_window_(buffer_window) {}

domain::OrderId IdentityRegistry::allocate() {
  return next_id_.fetch_add(1, std::memory_order_relaxed);
}

void IdentityRegistry::seed(domain::OrderId max_existing_id) {
  domain::OrderId wanted = max_existing_id + 1;
  domain::OrderId current = next_id_.load();
  while (current < wanted &&
         !next_id_.compare_exchange_weak(current, wanted)) {
  }
}

// -----------------------------------------------------------------------------
// bind: one broker id per order, one order per broker id
// -----------------------------------------------------------------------------
ErrorCode IdentityRegistry::bind(domain::OrderId order_id,
                                 domain::BrokerOrderId broker_order_id) {
  std::unique_lock lock(bindings_mutex_);

  auto by_order = by_order_.find(order_id);
  if (by_order != by_order_.end()) {
    if (by_order->second == broker_order_id) {
      return ErrorCode::None;
    }
    std::cerr << "[IdentityRegistry] WARNING: order_id=" << order_id
              << " already bound to broker_order_id=" << by_order->second
              << ", refusing " << broker_order_id << "\n";
    return ErrorCode::AlreadyBound;
  }

  auto by_broker = by_broker_.find(broker_order_id);
  if (by_broker != by_broker_.end()) {
    std::cerr << "[IdentityRegistry] WARNING: broker_order_id="
              << broker_order_id << " already bound to order_id="
              << by_broker->second << ", refusing " << order_id << "\n";
    return ErrorCode::AlreadyBound;
  }

  by_order_.emplace(order_id, broker_order_id);
  by_broker_.emplace(broker_order_id, order_id);
  return ErrorCode::None;
}

std::optional<domain::OrderId> IdentityRegistry::resolve(
    domain::BrokerOrderId broker_order_id) const {
  std::shared_lock lock(bindings_mutex_);
  auto it = by_broker_.find(broker_order_id);
  if (it == by_broker_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::BrokerOrderId> IdentityRegistry::brokerIdFor(
    domain::OrderId order_id) const {
  std::shared_lock lock(bindings_mutex_);
  auto it = by_order_.find(order_id);
  if (it == by_order_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::pair<domain::OrderId, domain::BrokerOrderId>>
IdentityRegistry::bindings() const {
  std::shared_lock lock(bindings_mutex_);
  std::vector<std::pair<domain::OrderId, domain::BrokerOrderId>> result(
      by_order_.begin(), by_order_.end());
  std::sort(result.begin(), result.end());
  return result;
}

// -----------------------------------------------------------------------------
// Unbound-event buffer
// -----------------------------------------------------------------------------
void IdentityRegistry::bufferEvent(domain::BrokerOrderId broker_order_id,
                                   BrokerEvent event) {
  std::lock_guard lock(buffer_mutex_);
  buffer_.push_back(
      BufferedEvent{broker_order_id, std::move(event), time_provider_.now_ms()});
}

std::vector<BrokerEvent> IdentityRegistry::takeBuffered(
    domain::BrokerOrderId broker_order_id) {
  std::lock_guard lock(buffer_mutex_);
  std::vector<BrokerEvent> taken;
  for (auto& parked : extractIf(buffer_, [broker_order_id](const BufferedEvent& e) {
         return e.broker_order_id == broker_order_id;
       })) {
    taken.push_back(std::move(parked.event));
  }
  return taken;
}

std::vector<IdentityRegistry::BufferedEvent> IdentityRegistry::takeReady() {
  std::lock_guard lock(buffer_mutex_);
  if (buffer_.empty()) {
    return {};
  }
  std::shared_lock bindings_lock(bindings_mutex_);
  return extractIf(buffer_, [this](const BufferedEvent& e) {
    return by_broker_.count(e.broker_order_id) != 0;
  });
}

std::vector<IdentityRegistry::BufferedEvent> IdentityRegistry::expire() {
  const std::int64_t cutoff = time_provider_.now_ms() - buffer_window_.count();
  std::lock_guard lock(buffer_mutex_);
  return extractIf(buffer_, [cutoff](const BufferedEvent& e) {
    return e.received_ms <= cutoff;
  });
}

std::size_t IdentityRegistry::bufferedCount() const {
  std::lock_guard lock(buffer_mutex_);
  return buffer_.size();
}

}  // namespace oms
