#pragma once

#include "oms/domain/fill.hpp"

#include <cstdint>

namespace oms {

// -----------------------------------------------------------------------------
// FillRecordedEvent
// -----------------------------------------------------------------------------
// Published by EventReconciler once a fill has been appended to the ledger.
// Duplicate executions (same exec_id) never produce one.
// -----------------------------------------------------------------------------
struct FillRecordedEvent {
  domain::Fill fill;
  std::int64_t timestamp_ms{0};
};

}  // namespace oms
