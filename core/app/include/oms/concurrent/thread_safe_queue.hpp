#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Unbounded FIFO between threads. Users in the engine:
//   - SessionGuard: callers push broker-call tasks, each worker waits in
//     pop_for(); stop() drains whatever was never run.
//   - EventReconciler: the broker callback thread pushes BrokerEvents, the
//     reconciler thread waits in pop_for() and drains the rest on stop().
//   - IpcServer: EventBus subscribers push telemetry, the server thread
//     drains it once per poll cycle.
//
// Thread model: multiple producers, multiple consumers. Nothing blocks
// without a deadline so every consumer loop can observe its stop flag.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Appends one item and wakes one waiting consumer.
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  // @brief  Waits at most `timeout` for an item.
  // @return The front item, or std::nullopt if the queue stayed empty.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // @brief  Removes every queued item in one lock acquisition.
  // @return The items in FIFO order; empty if nothing was queued.
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard lock(mutex_);
      taken.swap(queue_);
    }
    std::vector<T> out;
    out.reserve(taken.size());
    for (auto& item : taken) {
      out.push_back(std::move(item));
    }
    return out;
  }

  // Snapshot only; another thread may push or pop right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace oms
