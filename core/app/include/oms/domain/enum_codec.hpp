#pragma once

#include "oms/domain/order.hpp"
#include "oms/domain/order_status.hpp"

#include <optional>
#include <string>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// Enum <-> wire string conversion
// -----------------------------------------------------------------------------
//
// @brief  One place that knows the exact strings existing API clients send
//         and expect back.
//
// @details
//   OrderStatus  NEW, PENDING_SUBMIT, SUBMITTED, ACKED, PARTIALLY_FILLED,
//                CANCEL_REQUESTED, FILLED, CANCELLED, REJECTED, ERROR
//   Side         BUY, SELL
//   OrderType    MKT, LMT, STP
//   TimeInForce  DAY, GTC
//   OptionRight  C, P
//   AssetClass   STK, OPT
//
// The parse functions are case-insensitive and return std::nullopt for
// anything else; callers turn that into a ValidationError.
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status);
const char* toString(Side side);
const char* toString(OrderType type);
const char* toString(TimeInForce tif);
const char* toString(OptionRight right);
const char* toString(AssetClass asset_class);

std::optional<OrderStatus> parseOrderStatus(const std::string& s);
std::optional<Side> parseSide(const std::string& s);
std::optional<OrderType> parseOrderType(const std::string& s);
std::optional<TimeInForce> parseTimeInForce(const std::string& s);
std::optional<OptionRight> parseOptionRight(const std::string& s);

}  // namespace domain
}  // namespace oms
