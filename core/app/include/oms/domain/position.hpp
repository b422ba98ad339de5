#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// PositionKey: (account, symbol, sec_type, exchange, con_id)
// -----------------------------------------------------------------------------
// sec_type follows the broker's contract vocabulary ("STK", "OPT"). con_id
// is the broker contract id, 0 when unknown.
// -----------------------------------------------------------------------------
struct PositionKey {
  std::string account;
  std::string symbol;
  std::string sec_type;
  std::string exchange;
  std::int64_t con_id{0};

  bool operator==(const PositionKey& other) const {
    return std::tie(account, symbol, sec_type, exchange, con_id) ==
           std::tie(other.account, other.symbol, other.sec_type,
                    other.exchange, other.con_id);
  }
  bool operator!=(const PositionKey& other) const { return !(*this == other); }
};

struct PositionKeyHash {
  std::size_t operator()(const PositionKey& k) const {
    std::size_t h = std::hash<std::string>{}(k.account);
    auto mix = [&h](std::size_t v) {
      h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    mix(std::hash<std::string>{}(k.symbol));
    mix(std::hash<std::string>{}(k.sec_type));
    mix(std::hash<std::string>{}(k.exchange));
    mix(std::hash<std::int64_t>{}(k.con_id));
    return h;
  }
};

// -----------------------------------------------------------------------------
// Position: signed holding per key
// -----------------------------------------------------------------------------
//
// @details
// Sign convention for position:
//   positive → long, negative → short, zero → flat.
//
// avg_cost is the weighted average entry cost of the current holding. It is
// recomputed when the holding grows, left unchanged when it shrinks, and
// reset to the fill price when a fill crosses zero.
//
// as_of_ms is the time of the last write (snapshot or fill delta).
// -----------------------------------------------------------------------------
struct Position {
  PositionKey key;
  double position{0.0};
  double avg_cost{0.0};
  std::int64_t as_of_ms{0};
};

}  // namespace domain
}  // namespace oms
