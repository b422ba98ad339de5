#include "oms/api/trading_api.hpp"
#include "oms/codec/json_codec.hpp"
#include "oms/domain/enum_codec.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>

namespace oms {

namespace {

using nlohmann::json;

const json& requireField(const json& params, const char* name) {
  auto it = params.find(name);
  if (it == params.end() || it->is_null()) {
    throw std::invalid_argument(std::string("missing field '") + name + "'");
  }
  return *it;
}

std::string requireString(const json& params, const char* name) {
  const json& v = requireField(params, name);
  if (!v.is_string()) {
    throw std::invalid_argument(std::string("'") + name +
                                "' must be a string");
  }
  return v.get<std::string>();
}

std::int64_t requireInteger(const json& params, const char* name) {
  const json& v = requireField(params, name);
  if (!v.is_number_integer()) {
    throw std::invalid_argument(std::string("'") + name +
                                "' must be an integer");
  }
  return v.get<std::int64_t>();
}

double requireNumber(const json& params, const char* name) {
  const json& v = requireField(params, name);
  if (!v.is_number()) {
    throw std::invalid_argument(std::string("'") + name +
                                "' must be a number");
  }
  return v.get<double>();
}

// Absent, null, "" all mean "not given".
std::optional<std::string> optionalString(const json& params,
                                          const char* name) {
  auto it = params.find(name);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string("'") + name +
                                "' must be a string");
  }
  std::string s = it->get<std::string>();
  if (s.empty()) {
    return std::nullopt;
  }
  return s;
}

// Absent, null, 0 all mean "not given".
std::optional<std::int64_t> optionalInteger(const json& params,
                                            const char* name) {
  auto it = params.find(name);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    throw std::invalid_argument(std::string("'") + name +
                                "' must be an integer");
  }
  const auto v = it->get<std::int64_t>();
  if (v == 0) {
    return std::nullopt;
  }
  return v;
}

// Row limit for the list endpoints. Absent, null or not positive gives
// `fallback`; anything beyond int range is clamped rather than wrapped.
int optionalLimit(const json& params, int fallback) {
  auto it = params.find("limit");
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    throw std::invalid_argument("'limit' must be an integer");
  }
  constexpr std::uint64_t kMaxLimit = std::numeric_limits<int>::max();
  if (it->is_number_unsigned()) {
    const auto v = it->get<std::uint64_t>();
    return v == 0 ? fallback : static_cast<int>(std::min(v, kMaxLimit));
  }
  const auto v = it->get<std::int64_t>();
  if (v <= 0) {
    return fallback;
  }
  return static_cast<int>(
      std::min(static_cast<std::uint64_t>(v), kMaxLimit));
}

std::optional<double> optionalNumber(const json& params, const char* name) {
  auto it = params.find(name);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number()) {
    throw std::invalid_argument(std::string("'") + name +
                                "' must be a number");
  }
  const double v = it->get<double>();
  if (v == 0.0) {
    return std::nullopt;
  }
  return v;
}

template <typename T>
T parseEnum(const std::string& text, std::optional<T> (*parse)(const std::string&),
            const char* name) {
  if (auto value = parse(text)) {
    return *value;
  }
  throw std::invalid_argument(std::string("unsupported ") + name + " '" +
                              text + "'");
}

// Cancel/modify response. "status" is left out when the order is unknown.
json commandResponse(const CommandResult& r) {
  json j{{"ok", r.ok}, {"message", r.message}};
  if (r.status) {
    j["status"] = domain::toString(*r.status);
  }
  if (!r.ok) {
    j["error"] = toString(r.error);
  }
  return j;
}

domain::OrderSpec readCommonSpec(const json& params) {
  domain::OrderSpec spec;
  spec.symbol = requireString(params, "symbol");
  spec.side = parseEnum(requireString(params, "side"), &domain::parseSide,
                        "side");
  spec.quantity = requireInteger(params, "quantity");
  spec.order_type = parseEnum(optionalString(params, "order_type").value_or("MKT"),
                              &domain::parseOrderType, "order_type");
  spec.price = optionalNumber(params, "price");
  spec.tif = parseEnum(optionalString(params, "tif").value_or("DAY"),
                       &domain::parseTimeInForce, "tif");
  return spec;
}

json listOf(const char* key, json rows) {
  json j = json::object();
  j[key] = std::move(rows);
  return j;
}

}  // namespace

TradingApi::TradingApi(CommandProcessor& commands, OrderLedger& ledger,
                       SessionGuard& session,
                       const ITimeProvider& time_provider)
    : commands_(commands),
      ledger_(ledger),
      session_(session),
      time_provider_(time_provider) {}

json TradingApi::errorResponse(ErrorCode error, const std::string& message) {
  return json{{"error", toString(error)}, {"message", message}};
}

// -----------------------------------------------------------------------------
// handle(): raw request -> raw response
// -----------------------------------------------------------------------------
std::string TradingApi::handle(const std::string& request) {
  json response;
  try {
    const json parsed = json::parse(request);
    if (!parsed.is_object()) {
      throw std::invalid_argument("request must be a JSON object");
    }
    const std::string method = requireString(parsed, "method");
    auto params_it = parsed.find("params");
    const json params = (params_it == parsed.end() || params_it->is_null())
                            ? json::object()
                            : *params_it;
    if (!params.is_object()) {
      throw std::invalid_argument("'params' must be an object");
    }
    response = call(method, params);
  } catch (const json::exception& e) {
    response = errorResponse(ErrorCode::ValidationError, e.what());
  } catch (const std::invalid_argument& e) {
    response = errorResponse(ErrorCode::ValidationError, e.what());
  }
  return response.dump();
}

json TradingApi::call(const std::string& method, const json& params) {
  if (method == "PlaceStockOrder")  return placeStockOrder(params);
  if (method == "PlaceOptionOrder") return placeOptionOrder(params);
  if (method == "GetOrder")         return getOrder(params);
  if (method == "ListOrders")       return listOrders(params);
  if (method == "ListFills")        return listFills(params);
  if (method == "GetPositions")     return getPositions();
  if (method == "GetAccountValues") return getAccountValues();
  if (method == "CancelOrder")      return cancelOrder(params);
  if (method == "ModifyOrder")      return modifyOrder(params);
  if (method == "GetSessionHealth") return getSessionHealth();
  if (method == "GetAuditLog")      return getAuditLog(params);
  if (method == "Ping") {
    return json{{"pong", true}, {"ts_ms", time_provider_.now_ms()}};
  }
  throw std::invalid_argument("unknown method '" + method + "'");
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
json TradingApi::placeStockOrder(const json& params) {
  domain::OrderSpec spec = readCommonSpec(params);
  spec.instrument = domain::StockContract{};
  return place(spec);
}

json TradingApi::placeOptionOrder(const json& params) {
  domain::OrderSpec spec = readCommonSpec(params);
  domain::OptionContract option;
  option.expiry = requireString(params, "expiry");
  option.strike = requireNumber(params, "strike");
  option.right = parseEnum(requireString(params, "right"),
                           &domain::parseOptionRight, "right");
  spec.instrument = option;
  return place(spec);
}

json TradingApi::place(const domain::OrderSpec& spec) {
  const PlaceResult r = commands_.place(spec);
  json j{
      {"order_id", r.order_id},
      {"broker_order_id", r.broker_order_id.value_or(0)},
      {"status", domain::toString(r.status)},
      {"message", r.message},
  };
  if (!r.ok()) {
    j["error"] = toString(r.error);
  }
  return j;
}

json TradingApi::getOrder(const json& params) {
  const domain::OrderId id = requireInteger(params, "order_id");
  if (auto order = commands_.getOrder(id)) {
    return toOrderRecord(*order);
  }
  return errorResponse(ErrorCode::NotFound,
                       "order_id " + std::to_string(id) + " not found");
}

json TradingApi::listOrders(const json& params) {
  const int limit = optionalLimit(params, 0);
  json rows = json::array();
  for (const domain::Order& order : commands_.listOrders(limit)) {
    rows.push_back(toOrderRecord(order));
  }
  return listOf("orders", std::move(rows));
}

json TradingApi::listFills(const json& params) {
  const std::optional<domain::OrderId> order_id =
      optionalInteger(params, "order_id");
  const int limit = optionalLimit(params, 0);
  json rows = json::array();
  for (const domain::Fill& fill : commands_.listFills(order_id, limit)) {
    rows.push_back(toFillRecord(fill));
  }
  return listOf("fills", std::move(rows));
}

json TradingApi::cancelOrder(const json& params) {
  const domain::OrderId id = requireInteger(params, "order_id");
  return commandResponse(commands_.cancel(id));
}

json TradingApi::modifyOrder(const json& params) {
  const domain::OrderId id = requireInteger(params, "order_id");
  domain::ModifyRequest changes;
  changes.quantity = optionalInteger(params, "quantity");
  if (auto type = optionalString(params, "order_type")) {
    changes.order_type = parseEnum(*type, &domain::parseOrderType, "order_type");
  }
  changes.price = optionalNumber(params, "price");
  if (auto tif = optionalString(params, "tif")) {
    changes.tif = parseEnum(*tif, &domain::parseTimeInForce, "tif");
  }

  return commandResponse(commands_.modify(id, changes));
}

// -----------------------------------------------------------------------------
// Portfolio and diagnostics
// -----------------------------------------------------------------------------
json TradingApi::getPositions() {
  json rows = json::array();
  for (const domain::Position& p : commands_.listPositions()) {
    rows.push_back(toPositionRecord(p));
  }
  return listOf("positions", std::move(rows));
}

json TradingApi::getAccountValues() {
  json rows = json::array();
  for (const domain::AccountValue& v : commands_.listAccountValues()) {
    rows.push_back(toAccountValueRecord(v));
  }
  return listOf("account_values", std::move(rows));
}

json TradingApi::getSessionHealth() {
  const SessionHealth h = session_.health();
  return json{
      {"connected", h.connected},
      {"reconnect_count", h.reconnect_count},
      {"consecutive_timeouts", h.consecutive_timeouts},
      {"last_error", h.last_error},
      {"last_change_ms", h.last_change_ms},
  };
}

json TradingApi::getAuditLog(const json& params) {
  std::optional<std::uint64_t> since;
  if (auto seq = optionalInteger(params, "since_seq")) {
    if (*seq < 0) {
      throw std::invalid_argument("'since_seq' must not be negative");
    }
    since = static_cast<std::uint64_t>(*seq);
  }
  const int limit = optionalLimit(params, 1000);

  json rows = json::array();
  for (const AuditEntry& entry : ledger_.getLogs(since, limit)) {
    rows.push_back(json{{"seq", entry.seq},
                        {"ts_ms", entry.ts_ms},
                        {"event_type", entry.event_type},
                        {"payload", entry.payload}});
  }
  return listOf("logs", std::move(rows));
}

}  // namespace oms
