#pragma once

#include "oms/broker/i_broker_session.hpp"
#include "oms/concurrent/thread_safe_queue.hpp"
#include "oms/domain/error_code.hpp"
#include "oms/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>

namespace oms {

// -----------------------------------------------------------------------------
// SessionHealth
// -----------------------------------------------------------------------------
struct SessionHealth {
  bool connected{false};
  std::uint64_t reconnect_count{0};
  std::uint64_t consecutive_timeouts{0};
  std::string last_error;
  std::int64_t last_change_ms{0};
};

// -----------------------------------------------------------------------------
// BrokerCall<T>: outcome of one guarded broker call
// -----------------------------------------------------------------------------
template <typename T>
struct BrokerCall {
  ErrorCode error{ErrorCode::None};
  std::string message;
  T value{};

  bool ok() const { return error == ErrorCode::None; }
};

// -----------------------------------------------------------------------------
// SessionGuard: the only gateway to the broker session
// -----------------------------------------------------------------------------
//
// @brief  Owns the IBrokerSession and turns every broker call into a
//         bounded, serialized, exception-free operation.
//
// @details
// Mutating calls (submit, cancel, modify) are queued to one dispatcher
// thread, so at most one is ever in flight against the socket. The caller
// waits on a future for at most `call_timeout`:
//   - result in time          -> ErrorCode::None
//   - BrokerError thrown      -> ErrorCode::BrokerUnavailable
//   - deadline passed         -> ErrorCode::BrokerTimeout. The call is not
//                                cancelled and may still land.
//
// Read-only calls (requestSnapshot) go to a second query thread, so a slow
// snapshot never delays an order and may overlap a mutating call.
//
// connect/disconnect take the session mutex exclusively, so they wait for
// the in-flight call and block new ones (each worker holds it shared while
// running a call). Acquiring it is itself bounded by call_timeout.
//
// Connection loss reported by the broker (markConnectionLost) flips health
// without failing queued work; those calls fail fast with BrokerUnavailable
// when the dispatcher reaches them.
//
// Thread model:
//   Every public method is safe from any thread. start()/stop() are called
//   by OmsEngine from the main thread.
//
// Ownership:
//   Owns the IBrokerSession via unique_ptr and both worker threads.
// -----------------------------------------------------------------------------
class SessionGuard {
 public:
  SessionGuard(std::unique_ptr<IBrokerSession> session,
               const ITimeProvider& time_provider,
               std::chrono::milliseconds call_timeout);

  // Stops the workers if still running.
  ~SessionGuard();

  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;
  SessionGuard(SessionGuard&&) = delete;
  SessionGuard& operator=(SessionGuard&&) = delete;

  // Wires the broker's event feed. Call before connect().
  void attachEventSink(BrokerEventSink sink);

  void start();
  void stop();

  BrokerCall<bool> connect();
  BrokerCall<bool> disconnect();
  bool isConnected() const;

  BrokerCall<std::optional<domain::BrokerOrderId>> submit(
      const SubmitRequest& request);
  BrokerCall<bool> cancel(domain::BrokerOrderId broker_order_id);
  BrokerCall<bool> modify(domain::BrokerOrderId broker_order_id,
                          const domain::ModifyRequest& changes);
  BrokerCall<bool> requestSnapshot();

  void markConnectionLost(const std::string& reason);
  void markConnectionRestored();

  SessionHealth health() const;
  std::chrono::milliseconds callTimeout() const { return call_timeout_; }

 private:
  using Task = std::function<void()>;

  // One queue + thread pair. Tasks run in FIFO order.
  struct Worker {
    const char* name{""};
    ThreadSafeQueue<Task> tasks;
    std::thread thread;
  };

  void runWorker(Worker& worker);

  // -------------------------------------------------------------------------
  // dispatch(worker, what, call)
  // -------------------------------------------------------------------------
  // Queues `call` on `worker` and waits up to call_timeout_ for it. The
  // promise is shared with the task so an abandoned (timed-out) caller does
  // not leave the worker writing into a destroyed future.
  // -------------------------------------------------------------------------
  template <typename T>
  BrokerCall<T> dispatch(Worker& worker, const char* what,
                         std::function<T(IBrokerSession&)> call);

  void recordSuccess();
  void recordFailure(ErrorCode code, const std::string& message);

  std::unique_ptr<IBrokerSession> session_;
  const ITimeProvider& time_provider_;
  const std::chrono::milliseconds call_timeout_;

  // Held shared by a worker while a call runs; unique by connect/disconnect.
  mutable std::shared_timed_mutex session_mutex_;

  Worker mutating_;
  Worker query_;
  std::atomic<bool> running_{false};

  mutable std::mutex health_mutex_;
  SessionHealth health_;
  bool ever_connected_{false};
};

// -----------------------------------------------------------------------------
// Template implementation: dispatch
// -----------------------------------------------------------------------------
template <typename T>
BrokerCall<T> SessionGuard::dispatch(Worker& worker, const char* what,
                                     std::function<T(IBrokerSession&)> call) {
  BrokerCall<T> result;

  if (!running_.load()) {
    result.error = ErrorCode::BrokerUnavailable;
    result.message = "broker session guard is not running";
    return result;
  }
  if (!isConnected()) {
    result.error = ErrorCode::BrokerUnavailable;
    result.message = std::string(what) + ": broker session is not connected";
    recordFailure(result.error, result.message);
    return result;
  }

  auto promise = std::make_shared<std::promise<T>>();
  std::future<T> future = promise->get_future();

  worker.tasks.push([this, promise, call = std::move(call)]() {
    try {
      std::shared_lock lock(session_mutex_);
      if (!session_->isConnected()) {
        throw BrokerError("broker session is not connected");
      }
      promise->set_value(call(*session_));
    } catch (const std::exception&) {
      promise->set_exception(std::current_exception());
    }
  });

  if (future.wait_for(call_timeout_) != std::future_status::ready) {
    result.error = ErrorCode::BrokerTimeout;
    result.message = std::string(what) + ": no broker response within " +
                     std::to_string(call_timeout_.count()) +
                     " ms; outcome unknown, re-query before retrying";
    recordFailure(result.error, result.message);
    return result;
  }

  try {
    result.value = future.get();
    recordSuccess();
  } catch (const BrokerError& e) {
    result.error = ErrorCode::BrokerUnavailable;
    result.message = std::string(what) + ": " + e.what();
    recordFailure(result.error, result.message);
  } catch (const std::future_error& e) {
    result.error = ErrorCode::BrokerUnavailable;
    result.message = std::string(what) + ": call abandoned (" + e.what() + ")";
    recordFailure(result.error, result.message);
  } catch (const std::exception& e) {
    result.error = ErrorCode::BrokerUnavailable;
    result.message = std::string(what) + ": unexpected broker failure: " +
                     e.what();
    recordFailure(result.error, result.message);
  }
  return result;
}

}  // namespace oms
