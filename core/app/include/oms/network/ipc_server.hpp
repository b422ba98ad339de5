#pragma once

#include "oms/concurrent/thread_safe_queue.hpp"
#include "oms/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace oms {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ command and telemetry endpoints
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON requests on a REP socket
//         and broadcasts engine events as JSON on a PUB socket.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (ipc_command_endpoint):
//      Each request string is passed to the command handler (bound to
//      TradingApi::handle()) and its result is sent back. The socket uses
//      ZMQ_RCVTIMEO so the thread alternates between requests and
//      telemetry.
//
//   2. PUB socket (ipc_telemetry_endpoint):
//      Broadcasts order updates, recorded fills, position changes and
//      session status. Events arrive through pushTelemetry() from whatever
//      thread published them on the EventBus; the queue keeps JSON encoding
//      and socket I/O off those threads.
//
// A REP socket must answer every request before it can receive the next
// one, so a handler that throws still produces an error reply.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue and the worker
//   thread. Owned by OmsEngine's host (main) via std::unique_ptr.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5555",
                     std::string pub_endpoint = "tcp://127.0.0.1:5556");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker.
  // Idempotent.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Joins the worker (within kPollTimeoutMs) and closes the sockets.
  void stop();

  bool isRunning() const { return running_.load(); }

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The JSON message for `event`, tagged with "type":
  //         order_update, fill, position_update or session_status.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();
  std::string dispatch(const std::string& request);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace oms
