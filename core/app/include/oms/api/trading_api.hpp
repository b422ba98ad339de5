#pragma once

#include "oms/commands/command_processor.hpp"
#include "oms/ledger/order_ledger.hpp"
#include "oms/session/session_guard.hpp"
#include "oms/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// TradingApi
// -----------------------------------------------------------------------------
//
// @brief  JSON request/response front of the engine, one method per remote
//         operation.
//
// @details
// A request is an object {"method": <name>, "params": {...}}. Methods:
//
//   PlaceStockOrder   symbol, side, quantity, order_type?, price?, tif?
//   PlaceOptionOrder  as above plus expiry, strike, right
//   GetOrder          order_id
//   ListOrders        limit?
//   ListFills         order_id?, limit?
//   GetPositions
//   GetAccountValues
//   CancelOrder       order_id
//   ModifyOrder       order_id, quantity?, order_type?, price?, tif?
//   GetSessionHealth
//   GetAuditLog       since_seq?, limit?
//   Ping
//
// Optional numeric fields treat 0 like an absent field, and optional
// strings treat "" the same way, so clients built against the fixed record
// shapes can always send every field.
//
// A request that cannot be decoded produces
//   {"error": "ValidationError", "message": ...}
// and never reaches the command processor. NotFound on GetOrder uses the
// same shape.
//
// Thread model:
//   handle() and call() are safe from any thread; all state lives in the
//   referenced components.
// -----------------------------------------------------------------------------
class TradingApi {
 public:
  TradingApi(CommandProcessor& commands, OrderLedger& ledger,
             SessionGuard& session, const ITimeProvider& time_provider);

  TradingApi(const TradingApi&) = delete;
  TradingApi& operator=(const TradingApi&) = delete;

  // Decodes a raw request, dispatches it and encodes the response.
  std::string handle(const std::string& request);

  // -------------------------------------------------------------------------
  // call(method, params)
  // -------------------------------------------------------------------------
  // @throws nlohmann::json::exception or std::invalid_argument when params
  //         are malformed; handle() turns both into a ValidationError.
  // -------------------------------------------------------------------------
  nlohmann::json call(const std::string& method, const nlohmann::json& params);

  static nlohmann::json errorResponse(ErrorCode error,
                                      const std::string& message);

 private:
  nlohmann::json placeStockOrder(const nlohmann::json& params);
  nlohmann::json placeOptionOrder(const nlohmann::json& params);
  nlohmann::json getOrder(const nlohmann::json& params);
  nlohmann::json listOrders(const nlohmann::json& params);
  nlohmann::json listFills(const nlohmann::json& params);
  nlohmann::json getPositions();
  nlohmann::json getAccountValues();
  nlohmann::json cancelOrder(const nlohmann::json& params);
  nlohmann::json modifyOrder(const nlohmann::json& params);
  nlohmann::json getSessionHealth();
  nlohmann::json getAuditLog(const nlohmann::json& params);

  nlohmann::json place(const domain::OrderSpec& spec);

  CommandProcessor& commands_;
  OrderLedger& ledger_;
  SessionGuard& session_;
  const ITimeProvider& time_provider_;
};

}  // namespace oms
