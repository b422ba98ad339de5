#pragma once

#include "oms/domain/order.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

namespace oms {

// -----------------------------------------------------------------------------
// OrderLockTable: one mutex per order id
// -----------------------------------------------------------------------------
//
// @brief  Serializes commands and reconciler updates for the same order
//         while letting different orders proceed in parallel.
//
// @details
// Entries are created on first use and kept for the life of the table. Each
// mutex is held through a shared_ptr so a caller keeps its mutex alive even
// while another thread inserts into the map (rehash moves the pointers, not
// the mutexes).
//
// Usage:
//   auto order_mutex = locks.mutexFor(id);
//   std::lock_guard lock(*order_mutex);
//
// Thread model: mutexFor() is safe from any thread.
// -----------------------------------------------------------------------------
class OrderLockTable {
 public:
  OrderLockTable() = default;

  OrderLockTable(const OrderLockTable&) = delete;
  OrderLockTable& operator=(const OrderLockTable&) = delete;

  std::shared_ptr<std::mutex> mutexFor(domain::OrderId id) {
    std::lock_guard lock(table_mutex_);
    auto& slot = mutexes_[id];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
    return slot;
  }

 private:
  std::mutex table_mutex_;
  std::unordered_map<domain::OrderId, std::shared_ptr<std::mutex>> mutexes_;
};

}  // namespace oms
