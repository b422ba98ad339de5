#pragma once

#include "oms/api/trading_api.hpp"
#include "oms/broker/i_broker_session.hpp"
#include "oms/commands/command_processor.hpp"
#include "oms/concurrent/order_lock_table.hpp"
#include "oms/config/engine_config.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/identity/identity_registry.hpp"
#include "oms/ledger/order_ledger.hpp"
#include "oms/network/ipc_server.hpp"
#include "oms/reconciler/event_reconciler.hpp"
#include "oms/session/session_guard.hpp"
#include "oms/time/i_time_provider.hpp"

#include <memory>
#include <optional>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// OmsEngine - owns and wires the order management components
// -----------------------------------------------------------------------------
//
// @brief  Builds the ledger, identity registry, session guard, command
//         processor and event reconciler around one broker session, and
//         runs them as a unit.
//
// @details
// Data flow:
//
//   TradingApi / IpcServer ──> CommandProcessor ──> SessionGuard ──> broker
//                                   │                                  │
//                                   ▼                                  ▼
//                              OrderLedger <──── EventReconciler <── events
//                                   │
//                                   └── EventBus ──> IpcServer PUB socket
//
// The broker session is handed in at construction and owned by the
// SessionGuard from then on; nothing else can reach it.
//
// Thread model:
//   start()/stop() from the owning thread. Threads while running: the
//   session guard's two workers, the reconciler, and the IPC server when
//   both endpoints are configured.
//
// Ownership:
//   Owns every component. The time provider must outlive the engine.
// -----------------------------------------------------------------------------
class OmsEngine {
 public:
  OmsEngine(EngineConfig config, std::unique_ptr<IBrokerSession> broker,
            const ITimeProvider& time_provider);

  // RAII: calls stop().
  ~OmsEngine();

  OmsEngine(const OmsEngine&) = delete;
  OmsEngine& operator=(const OmsEngine&) = delete;
  OmsEngine(OmsEngine&&) = delete;
  OmsEngine& operator=(OmsEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Restores persisted state and brings the engine online.
  //
  // @details
  // 1. Loads the ledger snapshot when ledger_path is set and the file
  //    exists; seeds the identity registry past the highest stored order id
  //    and restores the broker id bindings.
  // 2. Starts the reconciler, then the session guard.
  // 3. Starts the IPC server when both endpoints are non-empty.
  // 4. Connects to the broker and requests a snapshot. A failed connect is
  //    logged; the engine still runs and commands report
  //    BrokerUnavailable until reconnect() succeeds.
  //
  // Idempotent.
  //
  // @throws StorageError if the ledger snapshot cannot be read.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Stops the IPC server thread, disconnects and stops the session guard,
  // drains the reconciler and saves the ledger snapshot. The server object
  // and its telemetry subscription outlive every publisher. Idempotent. A
  // failed save is logged.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_; }

  // Connects again after a lost session and refreshes positions, account
  // values and open orders from the broker.
  BrokerCall<bool> reconnect();

  // Raw JSON request -> JSON response; the IPC REP handler.
  std::string executeCommand(const std::string& request);

  const EngineConfig& config() const { return config_; }
  CommandProcessor& commands() { return commands_; }
  TradingApi& api() { return api_; }
  EventBus& eventBus() { return bus_; }
  OrderLedger& ledger() { return ledger_; }
  IdentityRegistry& registry() { return registry_; }
  SessionGuard& session() { return session_; }
  EventReconciler& reconciler() { return reconciler_; }

 private:
  void restoreLedger();
  void saveLedger();

  const EngineConfig config_;
  const ITimeProvider& time_provider_;

  EventBus bus_;
  OrderLedger ledger_;
  IdentityRegistry registry_;
  OrderLockTable locks_;
  SessionGuard session_;
  EventReconciler reconciler_;
  CommandProcessor commands_;
  TradingApi api_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  bool running_{false};
};

}  // namespace oms
