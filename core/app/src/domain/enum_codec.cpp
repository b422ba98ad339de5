#include "oms/domain/enum_codec.hpp"
#include "oms/domain/error_code.hpp"

#include <algorithm>
#include <cctype>

namespace oms {

const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:                return "None";
    case ErrorCode::ValidationError:     return "ValidationError";
    case ErrorCode::NotFound:            return "NotFound";
    case ErrorCode::InvalidState:        return "InvalidState";
    case ErrorCode::InvalidModification: return "InvalidModification";
    case ErrorCode::BrokerUnavailable:   return "BrokerUnavailable";
    case ErrorCode::BrokerTimeout:       return "BrokerTimeout";
    case ErrorCode::UnknownOrder:        return "UnknownOrder";
    case ErrorCode::AlreadyBound:        return "AlreadyBound";
  }
  return "Unknown";
}

namespace domain {

namespace {

std::string upper(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

}  // namespace

const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::New:             return "NEW";
    case S::PendingSubmit:   return "PENDING_SUBMIT";
    case S::Submitted:       return "SUBMITTED";
    case S::Acked:           return "ACKED";
    case S::PartiallyFilled: return "PARTIALLY_FILLED";
    case S::CancelRequested: return "CANCEL_REQUESTED";
    case S::Filled:          return "FILLED";
    case S::Cancelled:       return "CANCELLED";
    case S::Rejected:        return "REJECTED";
    case S::Error:           return "ERROR";
  }
  return "UNKNOWN";
}

const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Market: return "MKT";
    case OrderType::Limit:  return "LMT";
    case OrderType::Stop:   return "STP";
  }
  return "UNKNOWN";
}

const char* toString(TimeInForce tif) {
  switch (tif) {
    case TimeInForce::Day: return "DAY";
    case TimeInForce::Gtc: return "GTC";
  }
  return "UNKNOWN";
}

const char* toString(OptionRight right) {
  switch (right) {
    case OptionRight::Call: return "C";
    case OptionRight::Put:  return "P";
  }
  return "UNKNOWN";
}

const char* toString(AssetClass asset_class) {
  switch (asset_class) {
    case AssetClass::Stock:  return "STK";
    case AssetClass::Option: return "OPT";
  }
  return "UNKNOWN";
}

std::optional<OrderStatus> parseOrderStatus(const std::string& s) {
  const std::string u = upper(s);
  using S = OrderStatus;
  if (u == "NEW")              return S::New;
  if (u == "PENDING_SUBMIT")   return S::PendingSubmit;
  if (u == "SUBMITTED")        return S::Submitted;
  if (u == "ACKED")            return S::Acked;
  if (u == "PARTIALLY_FILLED") return S::PartiallyFilled;
  if (u == "CANCEL_REQUESTED") return S::CancelRequested;
  if (u == "FILLED")           return S::Filled;
  if (u == "CANCELLED")        return S::Cancelled;
  if (u == "REJECTED")         return S::Rejected;
  if (u == "ERROR")            return S::Error;
  return std::nullopt;
}

std::optional<Side> parseSide(const std::string& s) {
  const std::string u = upper(s);
  if (u == "BUY")  return Side::Buy;
  if (u == "SELL") return Side::Sell;
  return std::nullopt;
}

std::optional<OrderType> parseOrderType(const std::string& s) {
  const std::string u = upper(s);
  if (u == "MKT") return OrderType::Market;
  if (u == "LMT") return OrderType::Limit;
  if (u == "STP") return OrderType::Stop;
  return std::nullopt;
}

std::optional<TimeInForce> parseTimeInForce(const std::string& s) {
  const std::string u = upper(s);
  if (u == "DAY") return TimeInForce::Day;
  if (u == "GTC") return TimeInForce::Gtc;
  return std::nullopt;
}

std::optional<OptionRight> parseOptionRight(const std::string& s) {
  const std::string u = upper(s);
  if (u == "C") return OptionRight::Call;
  if (u == "P") return OptionRight::Put;
  return std::nullopt;
}

}  // namespace domain
}  // namespace oms
