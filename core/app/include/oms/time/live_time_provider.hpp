#pragma once

#include "oms/time/i_time_provider.hpp"

namespace oms {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Stateless, safe from any thread.
// Owned by OmsEngine unless the caller injects its own provider.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace oms
