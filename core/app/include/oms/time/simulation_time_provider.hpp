#pragma once

#include "oms/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace oms {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  now_ms() returns whatever the owner last set.
//
// @details
// Tests use it to place a position snapshot "before" or "after" a fill and
// to step past the unbound-event buffer window without sleeping.
//
// Thread model: single writer, many readers; both sides go through one
// std::atomic<int64_t>.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is the caller's responsibility.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace oms
