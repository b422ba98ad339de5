#include "oms/session/session_guard.hpp"

namespace oms {

namespace {

constexpr auto kWorkerPollInterval = std::chrono::milliseconds(50);

}  // namespace

SessionGuard::SessionGuard(std::unique_ptr<IBrokerSession> session,
                           const ITimeProvider& time_provider,
                           std::chrono::milliseconds call_timeout)
    : session_(std::move(session)),
      time_provider_(time_provider),
      call_timeout_(call_timeout) {
  mutating_.name = "broker-dispatch";
  query_.name = "broker-query";
}

SessionGuard::~SessionGuard() {
  stop();
}

void SessionGuard::attachEventSink(BrokerEventSink sink) {
  std::unique_lock lock(session_mutex_);
  session_->attachEventSink(std::move(sink));
}

// -----------------------------------------------------------------------------
// start / stop
// -----------------------------------------------------------------------------
void SessionGuard::start() {
  if (running_.exchange(true)) {
    return;
  }
  mutating_.thread = std::thread([this] { runWorker(mutating_); });
  query_.thread = std::thread([this] { runWorker(query_); });
  std::cout << "[SessionGuard] Started (call timeout "
            << call_timeout_.count() << " ms)\n";
}

void SessionGuard::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  for (Worker* worker : {&mutating_, &query_}) {
    if (worker->thread.joinable()) {
      worker->thread.join();
    }
    // Dropping queued tasks breaks their promises; waiting callers see
    // BrokerUnavailable instead of waiting out the timeout.
    worker->tasks.drain();
  }
  std::cout << "[SessionGuard] Stopped\n";
}

void SessionGuard::runWorker(Worker& worker) {
  while (running_.load()) {
    std::optional<Task> task = worker.tasks.pop_for(kWorkerPollInterval);
    if (task) {
      (*task)();
    }
  }
}

// -----------------------------------------------------------------------------
// connect / disconnect: exclusive access to the session
// -----------------------------------------------------------------------------
BrokerCall<bool> SessionGuard::connect() {
  BrokerCall<bool> result;
  std::unique_lock lock(session_mutex_, std::defer_lock);
  if (!lock.try_lock_for(call_timeout_)) {
    result.error = ErrorCode::BrokerTimeout;
    result.message = "connect: a broker call is still in flight";
    recordFailure(result.error, result.message);
    return result;
  }

  try {
    session_->connect();
  } catch (const BrokerError& e) {
    result.error = ErrorCode::BrokerUnavailable;
    result.message = std::string("connect: ") + e.what();
    lock.unlock();
    recordFailure(result.error, result.message);
    std::cerr << "[SessionGuard] WARNING: " << result.message << "\n";
    return result;
  }
  lock.unlock();

  {
    std::lock_guard health_lock(health_mutex_);
    if (ever_connected_ && !health_.connected) {
      ++health_.reconnect_count;
    }
    ever_connected_ = true;
    health_.connected = true;
    health_.consecutive_timeouts = 0;
    health_.last_change_ms = time_provider_.now_ms();
  }
  result.value = true;
  std::cout << "[SessionGuard] Broker session connected\n";
  return result;
}

BrokerCall<bool> SessionGuard::disconnect() {
  BrokerCall<bool> result;
  std::unique_lock lock(session_mutex_, std::defer_lock);
  if (!lock.try_lock_for(call_timeout_)) {
    result.error = ErrorCode::BrokerTimeout;
    result.message = "disconnect: a broker call is still in flight";
    recordFailure(result.error, result.message);
    return result;
  }

  try {
    session_->disconnect();
  } catch (const BrokerError& e) {
    result.error = ErrorCode::BrokerUnavailable;
    result.message = std::string("disconnect: ") + e.what();
    std::cerr << "[SessionGuard] WARNING: " << result.message << "\n";
  }
  lock.unlock();

  std::lock_guard health_lock(health_mutex_);
  health_.connected = false;
  health_.last_change_ms = time_provider_.now_ms();
  result.value = result.ok();
  return result;
}

bool SessionGuard::isConnected() const {
  std::shared_lock lock(session_mutex_, std::defer_lock);
  if (!lock.try_lock_for(call_timeout_)) {
    return false;
  }
  return session_->isConnected();
}

// -----------------------------------------------------------------------------
// Guarded calls
// -----------------------------------------------------------------------------
BrokerCall<std::optional<domain::BrokerOrderId>> SessionGuard::submit(
    const SubmitRequest& request) {
  return dispatch<std::optional<domain::BrokerOrderId>>(
      mutating_, "submit",
      [request](IBrokerSession& session) { return session.submit(request); });
}

BrokerCall<bool> SessionGuard::cancel(domain::BrokerOrderId broker_order_id) {
  return dispatch<bool>(mutating_, "cancel",
                        [broker_order_id](IBrokerSession& session) {
                          session.cancel(broker_order_id);
                          return true;
                        });
}

BrokerCall<bool> SessionGuard::modify(domain::BrokerOrderId broker_order_id,
                                      const domain::ModifyRequest& changes) {
  return dispatch<bool>(mutating_, "modify",
                        [broker_order_id, changes](IBrokerSession& session) {
                          session.modify(broker_order_id, changes);
                          return true;
                        });
}

BrokerCall<bool> SessionGuard::requestSnapshot() {
  return dispatch<bool>(query_, "snapshot", [](IBrokerSession& session) {
    session.requestSnapshot();
    return true;
  });
}

// -----------------------------------------------------------------------------
// Health
// -----------------------------------------------------------------------------
void SessionGuard::markConnectionLost(const std::string& reason) {
  std::lock_guard lock(health_mutex_);
  health_.connected = false;
  health_.last_error = "connection lost: " + reason;
  health_.last_change_ms = time_provider_.now_ms();
}

void SessionGuard::markConnectionRestored() {
  std::lock_guard lock(health_mutex_);
  if (!health_.connected) {
    ++health_.reconnect_count;
  }
  health_.connected = true;
  health_.last_change_ms = time_provider_.now_ms();
}

SessionHealth SessionGuard::health() const {
  std::lock_guard lock(health_mutex_);
  return health_;
}

void SessionGuard::recordSuccess() {
  std::lock_guard lock(health_mutex_);
  health_.consecutive_timeouts = 0;
}

void SessionGuard::recordFailure(ErrorCode code, const std::string& message) {
  std::lock_guard lock(health_mutex_);
  if (code == ErrorCode::BrokerTimeout) {
    ++health_.consecutive_timeouts;
  }
  health_.last_error = message;
}

}  // namespace oms
