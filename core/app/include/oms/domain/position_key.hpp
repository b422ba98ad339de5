#pragma once

#include "oms/domain/enum_codec.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/position.hpp"

#include <cstdint>
#include <sstream>
#include <string>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// positionKeyFor
// -----------------------------------------------------------------------------
//
// @brief  Builds the position key a fill on `instrument` contributes to.
//
// @details
// Stocks key on the plain symbol. Options without a broker contract id key
// on a local symbol "SYM YYYYMMDD R STRIKE" so different series of the same
// underlying never share a row. When con_id is known it already
// distinguishes the series, and the plain symbol is used.
// -----------------------------------------------------------------------------
inline PositionKey positionKeyFor(const std::string& symbol,
                                  const Instrument& instrument,
                                  const std::string& account,
                                  const std::string& exchange,
                                  std::int64_t con_id) {
  PositionKey key;
  key.account = account;
  key.sec_type = toString(assetClassOf(instrument));
  key.exchange = exchange;
  key.con_id = con_id;
  key.symbol = symbol;

  const auto* option = std::get_if<OptionContract>(&instrument);
  if (option != nullptr && con_id == 0) {
    std::ostringstream local;
    local << symbol << ' ' << option->expiry << ' ' << toString(option->right)
          << ' ' << option->strike;
    key.symbol = local.str();
  }
  return key;
}

}  // namespace domain
}  // namespace oms
