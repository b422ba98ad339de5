#include "oms/codec/json_codec.hpp"
#include "oms/domain/enum_codec.hpp"

#include <stdexcept>
#include <string>

namespace oms {

namespace {

template <typename T, typename Parser>
T parseEnum(const nlohmann::json& j, const char* key, Parser parser) {
  const std::string text = j.at(key).get<std::string>();
  auto value = parser(text);
  if (!value) {
    throw std::invalid_argument(std::string("unknown ") + key + " '" + text +
                                "'");
  }
  return *value;
}

template <typename T>
std::optional<T> optionalField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

template <typename T>
nlohmann::json nullable(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

void writeInstrument(nlohmann::json& j, const domain::Instrument& instrument) {
  j["asset_class"] = domain::toString(domain::assetClassOf(instrument));
  if (const auto* option = std::get_if<domain::OptionContract>(&instrument)) {
    j["expiry"] = option->expiry;
    j["strike"] = option->strike;
    j["right"] = domain::toString(option->right);
  }
}

domain::Instrument readInstrument(const nlohmann::json& j) {
  const std::string asset_class = j.value("asset_class", std::string("STK"));
  if (asset_class == "STK") {
    return domain::StockContract{};
  }
  if (asset_class != "OPT") {
    throw std::invalid_argument("unknown asset_class '" + asset_class + "'");
  }
  domain::OptionContract option;
  option.expiry = j.at("expiry").get<std::string>();
  option.strike = j.at("strike").get<double>();
  option.right = parseEnum<domain::OptionRight>(j, "right",
                                                domain::parseOptionRight);
  return option;
}

}  // namespace

namespace domain {

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& order) {
  j = nlohmann::json{
      {"order_id", order.id},
      {"broker_order_id", nullable(order.broker_order_id)},
      {"symbol", order.symbol},
      {"side", toString(order.side)},
      {"quantity", order.quantity},
      {"order_type", toString(order.order_type)},
      {"price", nullable(order.price)},
      {"tif", toString(order.tif)},
      {"status", toString(order.status)},
      {"filled_qty", order.filled_qty},
      {"avg_price", nullable(order.avg_price)},
      {"message", order.message},
      {"created_ms", order.created_ms},
      {"updated_ms", order.updated_ms},
      {"created_seq", order.created_seq},
  };
  j["pre_cancel_status"] =
      order.pre_cancel_status
          ? nlohmann::json(toString(*order.pre_cancel_status))
          : nlohmann::json(nullptr);
  j["adopted_filled_qty"] = order.adopted_filled_qty;
  j["commission"] = nullable(order.commission);
  j["commission_currency"] = order.commission_currency;
  j["realized_pnl"] = nullable(order.realized_pnl);
  writeInstrument(j, order.instrument);
}

void from_json(const nlohmann::json& j, Order& order) {
  order.id = j.at("order_id").get<OrderId>();
  order.broker_order_id = optionalField<BrokerOrderId>(j, "broker_order_id");
  order.instrument = readInstrument(j);
  order.symbol = j.at("symbol").get<std::string>();
  order.side = parseEnum<Side>(j, "side", parseSide);
  order.quantity = j.at("quantity").get<std::int64_t>();
  order.order_type = parseEnum<OrderType>(j, "order_type", parseOrderType);
  order.price = optionalField<double>(j, "price");
  order.tif = parseEnum<TimeInForce>(j, "tif", parseTimeInForce);
  order.status = parseEnum<OrderStatus>(j, "status", parseOrderStatus);
  order.filled_qty = j.at("filled_qty").get<std::int64_t>();
  order.avg_price = optionalField<double>(j, "avg_price");
  order.message = j.value("message", std::string());
  order.created_ms = j.value("created_ms", std::int64_t{0});
  order.updated_ms = j.value("updated_ms", std::int64_t{0});
  order.created_seq = j.value("created_seq", std::uint64_t{0});
  order.pre_cancel_status.reset();
  if (auto pre = optionalField<std::string>(j, "pre_cancel_status")) {
    order.pre_cancel_status = parseOrderStatus(*pre);
  }
  order.adopted_filled_qty = j.value("adopted_filled_qty", std::int64_t{0});
  order.commission = optionalField<double>(j, "commission");
  order.commission_currency = j.value("commission_currency", std::string());
  order.realized_pnl = optionalField<double>(j, "realized_pnl");
}

// -----------------------------------------------------------------------------
// Fill
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Fill& fill) {
  j = nlohmann::json{
      {"fill_id", fill.id},
      {"order_id", fill.order_id},
      {"exec_id", fill.exec_id},
      {"price", fill.price},
      {"filled_qty", fill.filled_qty},
      {"symbol", fill.symbol},
      {"side", toString(fill.side)},
      {"time", fill.time},
      {"broker_order_id", nullable(fill.broker_order_id)},
      {"commission", nullable(fill.commission)},
      {"commission_currency", fill.commission_currency},
      {"realized_pnl", nullable(fill.realized_pnl)},
      {"created_ms", fill.created_ms},
      {"created_seq", fill.created_seq},
  };
}

void from_json(const nlohmann::json& j, Fill& fill) {
  fill.id = j.at("fill_id").get<FillId>();
  fill.order_id = j.at("order_id").get<OrderId>();
  fill.exec_id = j.at("exec_id").get<std::string>();
  fill.price = j.at("price").get<double>();
  fill.filled_qty = j.at("filled_qty").get<std::int64_t>();
  fill.symbol = j.at("symbol").get<std::string>();
  fill.side = parseEnum<Side>(j, "side", parseSide);
  fill.time = j.value("time", std::string());
  fill.broker_order_id = optionalField<BrokerOrderId>(j, "broker_order_id");
  fill.commission = optionalField<double>(j, "commission");
  fill.commission_currency = j.value("commission_currency", std::string());
  fill.realized_pnl = optionalField<double>(j, "realized_pnl");
  fill.created_ms = j.value("created_ms", std::int64_t{0});
  fill.created_seq = j.value("created_seq", std::uint64_t{0});
}

// -----------------------------------------------------------------------------
// Position / AccountValue
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Position& position) {
  j = nlohmann::json{
      {"account", position.key.account},
      {"symbol", position.key.symbol},
      {"sec_type", position.key.sec_type},
      {"exchange", position.key.exchange},
      {"con_id", position.key.con_id},
      {"position", position.position},
      {"avg_cost", position.avg_cost},
      {"as_of_ms", position.as_of_ms},
  };
}

void from_json(const nlohmann::json& j, Position& position) {
  position.key.account = j.at("account").get<std::string>();
  position.key.symbol = j.at("symbol").get<std::string>();
  position.key.sec_type = j.at("sec_type").get<std::string>();
  position.key.exchange = j.value("exchange", std::string());
  position.key.con_id = j.value("con_id", std::int64_t{0});
  position.position = j.at("position").get<double>();
  position.avg_cost = j.value("avg_cost", 0.0);
  position.as_of_ms = j.value("as_of_ms", std::int64_t{0});
}

void to_json(nlohmann::json& j, const AccountValue& value) {
  j = nlohmann::json{
      {"account", value.account},
      {"tag", value.tag},
      {"currency", value.currency},
      {"value", value.value},
  };
}

void from_json(const nlohmann::json& j, AccountValue& value) {
  value.account = j.at("account").get<std::string>();
  value.tag = j.at("tag").get<std::string>();
  value.currency = j.value("currency", std::string());
  value.value = j.at("value").get<std::string>();
}

}  // namespace domain

// -----------------------------------------------------------------------------
// Wire records
// -----------------------------------------------------------------------------
nlohmann::json toOrderRecord(const domain::Order& order) {
  nlohmann::json j{
      {"order_id", order.id},
      {"broker_order_id", order.broker_order_id.value_or(0)},
      {"symbol", order.symbol},
      {"side", domain::toString(order.side)},
      {"quantity", order.quantity},
      {"order_type", domain::toString(order.order_type)},
      {"price", order.price.value_or(0.0)},
      {"tif", domain::toString(order.tif)},
      {"status", domain::toString(order.status)},
      {"avg_price", order.avg_price.value_or(0.0)},
      {"filled_qty", order.filled_qty},
      {"message", order.message},
      {"commission", nullable(order.commission)},
      {"realized_pnl", nullable(order.realized_pnl)},
  };
  writeInstrument(j, order.instrument);
  return j;
}

nlohmann::json toFillRecord(const domain::Fill& fill) {
  return nlohmann::json{
      {"fill_id", fill.id},
      {"order_id", fill.order_id},
      {"exec_id", fill.exec_id},
      {"price", fill.price},
      {"filled_qty", fill.filled_qty},
      {"symbol", fill.symbol},
      {"side", domain::toString(fill.side)},
      {"time", fill.time},
      {"broker_order_id", fill.broker_order_id.value_or(0)},
      {"commission", nullable(fill.commission)},
      {"commission_currency", fill.commission_currency},
      {"realized_pnl", nullable(fill.realized_pnl)},
  };
}

nlohmann::json toPositionRecord(const domain::Position& position) {
  return nlohmann::json{
      {"account", position.key.account},
      {"symbol", position.key.symbol},
      {"sec_type", position.key.sec_type},
      {"exchange", position.key.exchange},
      {"con_id", position.key.con_id},
      {"position", position.position},
      {"avg_cost", position.avg_cost},
  };
}

nlohmann::json toAccountValueRecord(const domain::AccountValue& value) {
  return nlohmann::json{
      {"account", value.account},
      {"tag", value.tag},
      {"currency", value.currency},
      {"value", value.value},
  };
}

}  // namespace oms
