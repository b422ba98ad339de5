#pragma once

#include <cstdint>

namespace oms {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Every timestamp the engine writes (order created/updated, fill
//         arrival, position as-of, audit log) and every deadline it checks
//         (unbound-event buffer expiry) comes from here.
//
// @details
//   - LiveTimeProvider       wall clock, used by the executable.
//   - SimulationTimeProvider set explicitly, used by tests to drive buffer
//                            expiry and snapshot/fill ordering
//                            deterministically.
//
// Implementations must be safe for concurrent reads from any thread.
//
// Ownership: components hold a const reference; the provider must outlive
// them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace oms
