#pragma once

#include "oms/domain/account_value.hpp"
#include "oms/domain/fill.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/position.hpp"

#include <nlohmann/json.hpp>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// Storage encoding (nlohmann ADL hooks)
// -----------------------------------------------------------------------------
//
// @brief  Lossless JSON form of the domain records, used by the ledger
//         snapshot file and the audit log payloads.
//
// @details
// Absent optionals are written as null and read back as absent. Enums use
// the wire strings from enum_codec.hpp. from_json throws
// nlohmann::json::exception (missing key, wrong type) or
// std::invalid_argument (unknown enum string); the snapshot loader turns
// either into a StorageError naming the file.
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Fill& fill);
void from_json(const nlohmann::json& j, Fill& fill);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const AccountValue& value);
void from_json(const nlohmann::json& j, AccountValue& value);

}  // namespace domain

// -----------------------------------------------------------------------------
// Wire records
// -----------------------------------------------------------------------------
//
// @brief  The record shapes existing API clients consume. Field names and
//         encodings are fixed:
//
//   OrderRecord        order_id, broker_order_id, asset_class, symbol, side,
//                      quantity, status, avg_price, filled_qty, message
//                      (+ order_type, price, tif, and expiry/strike/right
//                      for options)
//   FillRecord         fill_id, order_id, exec_id, price, filled_qty,
//                      symbol, side, time, broker_order_id
//   PositionRecord     account, symbol, sec_type, exchange, con_id,
//                      position, avg_cost
//   AccountValueRecord account, tag, currency, value
//
// Absent numbers follow the proto default: a missing broker_order_id or
// avg_price is written as 0.
// -----------------------------------------------------------------------------
nlohmann::json toOrderRecord(const domain::Order& order);
nlohmann::json toFillRecord(const domain::Fill& fill);
nlohmann::json toPositionRecord(const domain::Position& position);
nlohmann::json toAccountValueRecord(const domain::AccountValue& value);

}  // namespace oms
