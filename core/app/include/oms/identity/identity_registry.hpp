#pragma once

#include "oms/broker/broker_event.hpp"
#include "oms/domain/error_code.hpp"
#include "oms/domain/order.hpp"
#include "oms/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// IdentityRegistry: internal order ids and the broker id mapping
// -----------------------------------------------------------------------------
//
// @brief  Allocates internal OrderIds, records the one-time binding to the
//         broker's id, and parks broker events that arrive for a broker id
//         nobody has bound yet.
//
// @details
// Allocation:
//   allocate() is a lock-free fetch_add starting at 1. At startup the engine
//   calls seed() with the largest id found in the persisted ledger so ids
//   are never reused across restarts.
//
// Binding:
//   bind(order, broker) succeeds once. Repeating it with the same pair is a
//   no-op; any attempt to attach a different broker id to the order, or the
//   same broker id to a different order, fails with AlreadyBound.
//
// Unbound-event buffer:
//   The broker can emit a fill or status for a broker id before the submit
//   call has returned and the binding exists. The reconciler parks such
//   events with bufferEvent(). Once the id is bound, takeReady() and
//   takeBuffered() release them in arrival order. Events still unbound
//   after `buffer_window` are returned by expire() and dropped by the
//   caller as UnknownOrder.
//
// Thread model:
//   allocate() is lock-free. Bindings sit behind a shared_mutex (resolve is
//   the hot read path). The buffer has its own mutex and is in practice
//   only touched by the reconciler thread.
// -----------------------------------------------------------------------------
class IdentityRegistry {
 public:
  struct BufferedEvent {
    domain::BrokerOrderId broker_order_id{0};
    BrokerEvent event;
    std::int64_t received_ms{0};
  };

  IdentityRegistry(const ITimeProvider& time_provider,
                   std::chrono::milliseconds buffer_window);

  IdentityRegistry(const IdentityRegistry&) = delete;
  IdentityRegistry& operator=(const IdentityRegistry&) = delete;
  IdentityRegistry(IdentityRegistry&&) = delete;
  IdentityRegistry& operator=(IdentityRegistry&&) = delete;

  // -------------------------------------------------------------------------
  // allocate()
  // -------------------------------------------------------------------------
  // @return A fresh id, strictly greater than every id returned before and
  //         every id passed to seed().
  // -------------------------------------------------------------------------
  domain::OrderId allocate();

  // Raises the allocation floor so the next allocate() returns at least
  // max_existing_id + 1. Never lowers it.
  void seed(domain::OrderId max_existing_id);

  // -------------------------------------------------------------------------
  // bind(order_id, broker_order_id)
  // -------------------------------------------------------------------------
  // @return ErrorCode::None on a new or identical binding,
  //         ErrorCode::AlreadyBound on a conflicting one.
  // -------------------------------------------------------------------------
  ErrorCode bind(domain::OrderId order_id,
                 domain::BrokerOrderId broker_order_id);

  std::optional<domain::OrderId> resolve(
      domain::BrokerOrderId broker_order_id) const;

  std::optional<domain::BrokerOrderId> brokerIdFor(
      domain::OrderId order_id) const;

  std::vector<std::pair<domain::OrderId, domain::BrokerOrderId>> bindings()
      const;

  // -------------------------------------------------------------------------
  // Unbound-event buffer
  // -------------------------------------------------------------------------

  void bufferEvent(domain::BrokerOrderId broker_order_id, BrokerEvent event);

  // Removes and returns the parked events for one broker id, oldest first.
  std::vector<BrokerEvent> takeBuffered(domain::BrokerOrderId broker_order_id);

  // Removes and returns every parked event whose broker id is now bound.
  std::vector<BufferedEvent> takeReady();

  // Removes and returns every parked event older than the buffer window.
  std::vector<BufferedEvent> expire();

  std::size_t bufferedCount() const;

 private:
  const ITimeProvider& time_provider_;
  const std::chrono::milliseconds buffer_window_;

  std::atomic<domain::OrderId> next_id_{1};

  mutable std::shared_mutex bindings_mutex_;
  std::unordered_map<domain::OrderId, domain::BrokerOrderId> by_order_;
  std::unordered_map<domain::BrokerOrderId, domain::OrderId> by_broker_;

  mutable std::mutex buffer_mutex_;
  std::deque<BufferedEvent> buffer_;
};

}  // namespace oms
