#include "oms/engine/oms_engine.hpp"
#include "oms/ledger/ledger_store.hpp"

#include <iostream>
#include <utility>

namespace oms {

OmsEngine::OmsEngine(EngineConfig config,
                     std::unique_ptr<IBrokerSession> broker,
                     const ITimeProvider& time_provider)
    : config_(std::move(config)),
      time_provider_(time_provider),
      ledger_(time_provider_, config_.default_list_limit),
      registry_(time_provider_, config_.unbound_event_window),
      session_(std::move(broker), time_provider_,
               config_.broker_call_timeout),
      reconciler_(ledger_, registry_, locks_, bus_, time_provider_, config_),
      commands_(ledger_, registry_, session_, locks_, bus_, time_provider_),
      api_(commands_, ledger_, session_, time_provider_) {}

OmsEngine::~OmsEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void OmsEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Persisted state before any traffic ------------------------------
  restoreLedger();
  registry_.seed(ledger_.maxOrderId());

  // ---  2) Event path: broker -> reconciler --------------------------------
  reconciler_.setConnectionHook(
      [this](bool connected, const std::string& detail) {
        if (connected) {
          session_.markConnectionRestored();
        } else {
          session_.markConnectionLost(detail);
        }
      });
  session_.attachEventSink(reconciler_.sink());
  reconciler_.start();
  session_.start();

  // ---  3) IPC server (commands + telemetry) -------------------------------
  if (!config_.ipc_command_endpoint.empty() &&
      !config_.ipc_telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& request) { return executeCommand(request); },
        config_.ipc_command_endpoint, config_.ipc_telemetry_endpoint);
    ipc_server_->start();

    telemetry_subscription_ = bus_.subscribe([this](const Event& event) {
      ipc_server_->pushTelemetry(event);
    });
  }

  running_ = true;

  // ---  4) Broker session LAST ---------------------------------------------
  const BrokerCall<bool> connected = reconnect();
  if (!connected.ok()) {
    std::cerr << "[OmsEngine] WARNING: starting without a broker session: "
              << connected.message << "\n";
  }

  std::cout << "[OmsEngine] started. Orders restored: "
            << ledger_.orderCount() << ", foreign order policy: "
            << toString(config_.foreign_order_policy) << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void OmsEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new requests --------------------------------------------------
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  2) Broker session, then the events it already produced -------------
  const BrokerCall<bool> disconnected = session_.disconnect();
  if (!disconnected.ok()) {
    std::cerr << "[OmsEngine] WARNING: " << disconnected.message << "\n";
  }
  session_.stop();
  reconciler_.stop();

  // Nothing publishes any more; the server can go.
  if (telemetry_subscription_) {
    bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  // ---  3) Persist -----------------------------------------------------------
  saveLedger();

  running_ = false;
  std::cout << "[OmsEngine] stopped. All threads joined.\n";
}

BrokerCall<bool> OmsEngine::reconnect() {
  BrokerCall<bool> connected = session_.connect();
  if (!connected.ok()) {
    return connected;
  }
  const BrokerCall<bool> snapshot = session_.requestSnapshot();
  if (!snapshot.ok()) {
    std::cerr << "[OmsEngine] WARNING: broker snapshot failed: "
              << snapshot.message << "\n";
  }
  return connected;
}

std::string OmsEngine::executeCommand(const std::string& request) {
  return api_.handle(request);
}

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------
void OmsEngine::restoreLedger() {
  if (config_.ledger_path.empty()) {
    return;
  }
  LedgerStore store(config_.ledger_path);
  if (!store.exists()) {
    std::cout << "[OmsEngine] No ledger snapshot at " << store.path()
              << "; starting empty.\n";
    return;
  }

  LedgerSnapshot snapshot = store.load();
  ledger_.restore(snapshot);
  for (const domain::Order& order : snapshot.orders) {
    if (order.broker_order_id) {
      snapshot.bindings.emplace_back(order.id, *order.broker_order_id);
    }
  }
  for (const auto& [order_id, broker_order_id] : snapshot.bindings) {
    const ErrorCode bound = registry_.bind(order_id, broker_order_id);
    if (bound != ErrorCode::None) {
      std::cerr << "[OmsEngine] WARNING: stored binding order_id=" << order_id
                << " -> broker_order_id=" << broker_order_id << " skipped: "
                << toString(bound) << "\n";
    }
  }
  std::cout << "[OmsEngine] Restored " << snapshot.orders.size()
            << " order(s), " << snapshot.fills.size() << " fill(s), "
            << registry_.bindings().size() << " binding(s) from "
            << store.path() << ".\n";
}

void OmsEngine::saveLedger() {
  if (config_.ledger_path.empty()) {
    return;
  }
  LedgerSnapshot snapshot = ledger_.snapshot();
  snapshot.bindings = registry_.bindings();
  try {
    LedgerStore(config_.ledger_path).save(snapshot);
  } catch (const StorageError& e) {
    std::cerr << "[OmsEngine] WARNING: ledger snapshot not saved: " << e.what()
              << "\n";
  }
}

}  // namespace oms
