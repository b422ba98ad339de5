#pragma once

#include "oms/domain/order.hpp"
#include "oms/domain/order_status.hpp"

#include <cstdint>

namespace oms {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published after every order write that the ledger accepted:
//         placement, status transition, fill, modification, adoption.
//
// @details
// order is a full copy taken after the write. previous_status is the status
// before it; for a newly placed or adopted order it equals New.
//
// Thread model:
//   Published by CommandProcessor on the caller's thread and by
//   EventReconciler on its consumer thread. Plain data, safe to copy across
//   threads.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::New};
  std::int64_t timestamp_ms{0};
};

}  // namespace oms
