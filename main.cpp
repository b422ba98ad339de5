// -----------------------------------------------------------------------------
// oms_engine - single executable entry point.
//
//   1) Load EngineConfig from the optional JSON file given as argv[1],
//      overridden by OMS_* environment variables.
//   2) Build the broker session. This build ships the in-process
//      SimulatedBroker; a gateway client implements the same IBrokerSession.
//   3) Start the OmsEngine. It restores the ledger snapshot, connects to the
//      broker and serves JSON requests on the IPC REP socket.
//   4) Log order, fill and session telemetry to the console.
//   5) Wait for SIGINT/SIGTERM, then stop (saves the ledger snapshot).
//
// Thread layout:
//   main thread        -> waits for a shutdown signal
//   broker-dispatch    -> submit/cancel/modify (SessionGuard)
//   broker-query       -> snapshot requests (SessionGuard)
//   reconciler         -> broker events into the ledger
//   ipc                -> REP requests + PUB telemetry
// -----------------------------------------------------------------------------

#include "oms/broker/simulated_broker.hpp"
#include "oms/config/engine_config.hpp"
#include "oms/domain/enum_codec.hpp"
#include "oms/domain/error_code.hpp"
#include "oms/engine/oms_engine.hpp"
#include "oms/events/event.hpp"
#include "oms/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Set from the signal handler, polled by main().
static volatile std::sig_atomic_t g_stop_requested = 0;

static void signal_handler(int /*signum*/) { g_stop_requested = 1; }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration. Invalid configuration is fatal.
  // -------------------------------------------------------------------------
  std::optional<std::string> config_path;
  if (argc > 1) {
    config_path = argv[1];
  }

  oms::EngineConfig config;
  try {
    config = oms::loadConfig(config_path);
  } catch (const oms::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock and broker session.
  // -------------------------------------------------------------------------
  oms::LiveTimeProvider clock;

  oms::SimulatedBroker::Options sim;
  sim.auto_ack = true;
  sim.auto_fill = config.sim_auto_fill;
  sim.market_price = config.sim_market_price;
  sim.account = config.default_account;
  sim.exchange = config.default_exchange;
  sim.currency = config.default_currency;
  auto broker = std::make_unique<oms::SimulatedBroker>(clock, sim);

  std::cout << "[main] Broker " << config.broker_host << ":"
            << config.broker_port << " client_id=" << config.broker_client_id
            << " (simulated)\n";

  // -------------------------------------------------------------------------
  // 3) Engine.
  // -------------------------------------------------------------------------
  oms::OmsEngine engine(config, std::move(broker), clock);

  engine.eventBus().subscribe<oms::OrderUpdateEvent>(
      [](const oms::OrderUpdateEvent& e) {
        std::cout << "[main] Order " << e.order.id << " " << e.order.symbol
                  << " " << oms::domain::toString(e.previous_status) << " -> "
                  << oms::domain::toString(e.order.status) << " filled="
                  << e.order.filled_qty << "/" << e.order.quantity << "\n";
      });
  engine.eventBus().subscribe<oms::FillRecordedEvent>(
      [](const oms::FillRecordedEvent& e) {
        std::cout << "[main] Fill " << e.fill.exec_id << " order "
                  << e.fill.order_id << " " << e.fill.filled_qty << " @ "
                  << e.fill.price << "\n";
      });
  engine.eventBus().subscribe<oms::SessionStatusEvent>(
      [](const oms::SessionStatusEvent& e) {
        std::cout << "[main] Broker session "
                  << (e.connected ? "up" : "down") << ": " << e.detail << "\n";
      });

  try {
    engine.start();
  } catch (const oms::StorageError& e) {
    std::cerr << "[main] Cannot load ledger snapshot: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Cannot bind IPC endpoints: " << e.what() << "\n";
    engine.stop();
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Run until interrupted.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested.\n";

  // -------------------------------------------------------------------------
  // 5) Clean shutdown.
  // -------------------------------------------------------------------------
  engine.stop();

  std::cout << "[main] Clean shutdown complete.\n";
  return 0;
}
