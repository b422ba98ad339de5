#pragma once

#include "oms/broker/broker_event.hpp"
#include "oms/broker/i_broker_session.hpp"
#include "oms/concurrent/order_lock_table.hpp"
#include "oms/concurrent/thread_safe_queue.hpp"
#include "oms/config/engine_config.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/identity/identity_registry.hpp"
#include "oms/ledger/order_ledger.hpp"
#include "oms/state/order_state_machine.hpp"
#include "oms/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace oms {

// Counters exposed for health reporting and tests.
struct ReconcilerStats {
  std::uint64_t processed{0};
  std::uint64_t duplicate_fills{0};
  std::uint64_t dropped{0};
  std::uint64_t buffered{0};
  std::uint64_t expired{0};
  std::uint64_t adopted{0};
  std::uint64_t commissions{0};
};

// -----------------------------------------------------------------------------
// EventReconciler
// -----------------------------------------------------------------------------
//
// @brief  Folds the asynchronous broker event stream into the OrderLedger.
//
// @details
// The broker pushes events through sink() from its own thread. They are
// queued and consumed by one dedicated thread, so events for the same order
// are applied in arrival order. Each order-scoped event is resolved to an
// internal order id through the IdentityRegistry:
//
//   - bound broker id        applied under the order's lock
//   - unbound, client id     bound on the spot, then applied
//     known to the ledger
//   - unbound otherwise      parked in the registry; released when the
//                            binding appears, dropped as UnknownOrder once
//                            older than the buffer window
//
// Every status change goes through OrderStateMachine. A fill is written to
// the ledger together with its order update and position delta before the
// next event is taken. Fills already recorded for (order_id, exec_id) are
// dropped without side effects. For an adopted order, executions up to the
// filled_qty of its snapshot are recorded as fills but move neither the
// order nor the position.
//
// Commission reports update the matching fill and the order's totals; one
// that arrives before its fill waits for it.
//
// Thread model:
//   sink() / enqueue()  any thread
//   run loop            the reconciler thread
//   process() / sweep() the caller's thread; tests drive them directly
//                       without start()
//
// Ownership:
//   Holds references to the ledger, registry, lock table and bus; all must
//   outlive this object.
// -----------------------------------------------------------------------------
class EventReconciler {
 public:
  using ConnectionHook =
      std::function<void(bool connected, const std::string& detail)>;

  EventReconciler(OrderLedger& ledger, IdentityRegistry& registry,
                  OrderLockTable& locks, EventBus& bus,
                  const ITimeProvider& time_provider,
                  const EngineConfig& config);

  // Stops the consumer thread if still running.
  ~EventReconciler();

  EventReconciler(const EventReconciler&) = delete;
  EventReconciler& operator=(const EventReconciler&) = delete;
  EventReconciler(EventReconciler&&) = delete;
  EventReconciler& operator=(EventReconciler&&) = delete;

  // Called on ConnectionLost/ConnectionRestored, before the
  // SessionStatusEvent is published. Set before start().
  void setConnectionHook(ConnectionHook hook);

  // Sink to hand to the broker session.
  BrokerEventSink sink();

  void enqueue(BrokerEvent event);

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // start() spawns the consumer thread. stop() lets it finish the event in
  // hand and joins; events still queued are processed synchronously before
  // stop() returns. Both are idempotent.
  // -------------------------------------------------------------------------
  void start();
  void stop();
  bool isRunning() const { return running_.load(); }

  // Applies one event on the calling thread.
  void process(const BrokerEvent& event);

  // Releases parked events whose broker id is now bound and expires the
  // ones older than the buffer window.
  void sweep();

  // -------------------------------------------------------------------------
  // waitIdle(timeout)
  // -------------------------------------------------------------------------
  // @return true once every event enqueued so far has been processed,
  //         false if that did not happen within `timeout`.
  // -------------------------------------------------------------------------
  bool waitIdle(std::chrono::milliseconds timeout);

  ReconcilerStats stats() const;

 private:
  void runLoop();
  void processGuarded(const BrokerEvent& event);

  // Returns the internal id for an order-scoped event, or std::nullopt when
  // the event was parked or dropped.
  std::optional<domain::OrderId> route(
      domain::BrokerOrderId broker_order_id,
      std::optional<domain::OrderId> client_order_id,
      const BrokerEvent& event);
  void releaseBuffered(domain::BrokerOrderId broker_order_id);

  void handle(const BrokerAck& ack);
  void handle(const BrokerFill& fill);
  void handle(const BrokerStatus& status);
  void handle(const BrokerCancelReject& reject);
  void handle(const BrokerReject& reject);
  void handle(const BrokerErrorNotice& notice);
  void handle(const BrokerCommissionReport& report);
  void handle(const PositionSnapshot& snapshot);
  void handle(const AccountValueSnapshot& snapshot);
  void handle(const OpenOrderSnapshot& snapshot);
  void handle(const ConnectionLost& lost);
  void handle(const ConnectionRestored& restored);

  // Runs `step` against the stored order under its lock and stores the
  // result when applied. Fills in the broker id if the record lacks it.
  void applyTransition(
      domain::OrderId order_id, domain::BrokerOrderId broker_order_id,
      const char* what,
      const std::function<Transition(const domain::Order&)>& step);

  void adoptForeignOrder(const OpenOrderSnapshot& snapshot);
  void applyCommission(domain::OrderId order_id,
                       const BrokerCommissionReport& report);
  void applyPendingCommission(domain::OrderId order_id,
                              const std::string& exec_id);
  void expirePendingCommissions();
  bool store(const domain::Order& order, domain::OrderStatus previous);
  void count(std::uint64_t ReconcilerStats::*field);
  void markCompleted();
  void publishConnection(bool connected, const std::string& detail);

  OrderLedger& ledger_;
  IdentityRegistry& registry_;
  OrderLockTable& locks_;
  EventBus& bus_;
  const ITimeProvider& time_provider_;
  const ForeignOrderPolicy foreign_order_policy_;
  const std::string default_account_;
  const std::string default_exchange_;
  OrderStateMachine machine_;
  ConnectionHook connection_hook_;

  ThreadSafeQueue<BrokerEvent> queue_;
  std::atomic<bool> running_{false};
  std::thread thread_;

  std::atomic<std::uint64_t> enqueued_{0};
  std::atomic<std::uint64_t> completed_{0};
  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;

  struct PendingCommission {
    BrokerCommissionReport report;
    std::int64_t received_ms{0};
  };
  // Touched only by the thread that processes events.
  std::map<std::pair<domain::OrderId, std::string>, PendingCommission>
      pending_commissions_;

  mutable std::mutex stats_mutex_;
  ReconcilerStats stats_;
};

}  // namespace oms
