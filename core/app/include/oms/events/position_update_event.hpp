#pragma once

#include "oms/domain/position.hpp"

#include <cstdint>

namespace oms {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of one position row after a fill delta or a broker
//         snapshot was applied.
//
// @details
// removed is true when a flat snapshot deleted the key; position then holds
// the key with a zero quantity.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  bool removed{false};
  std::int64_t timestamp_ms{0};
};

}  // namespace oms
