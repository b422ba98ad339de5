#pragma once

#include <cstdint>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// SessionStatusEvent
// -----------------------------------------------------------------------------
// Published by EventReconciler when the broker reports the connection lost
// or restored. Outstanding commands are not failed; subscribers (telemetry)
// learn about it here and callers can poll SessionGuard::health().
// -----------------------------------------------------------------------------
struct SessionStatusEvent {
  bool connected{false};
  std::string detail;
  std::int64_t timestamp_ms{0};
};

}  // namespace oms
