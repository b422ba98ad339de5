#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// Fill time formatting
// -----------------------------------------------------------------------------
// The engine stores epoch milliseconds everywhere. Fill records carry a
// broker-style text time; when a broker event does not supply one the
// reconciler formats the arrival time with format_fill_time().
//
// @brief  Formats epoch milliseconds as "YYYYMMDD-HH:MM:SS" in UTC, the
//         layout the broker uses in execution details.
// -----------------------------------------------------------------------------
inline std::string format_fill_time(std::int64_t ms) {
  const std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm utc{};
  gmtime_r(&secs, &utc);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d-%H:%M:%S", &utc);
  return std::string(buf, n);
}

}  // namespace oms
