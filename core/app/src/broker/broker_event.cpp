#include "oms/broker/broker_event.hpp"

#include <type_traits>

namespace oms {

const char* brokerEventName(const BrokerEvent& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, BrokerAck>) return "Ack";
        else if constexpr (std::is_same_v<T, BrokerFill>) return "Fill";
        else if constexpr (std::is_same_v<T, BrokerStatus>) return "StatusChange";
        else if constexpr (std::is_same_v<T, BrokerCancelReject>) return "CancelRejected";
        else if constexpr (std::is_same_v<T, BrokerReject>) return "Reject";
        else if constexpr (std::is_same_v<T, BrokerErrorNotice>) return "Error";
        else if constexpr (std::is_same_v<T, BrokerCommissionReport>) return "CommissionReport";
        else if constexpr (std::is_same_v<T, PositionSnapshot>) return "PositionSnapshot";
        else if constexpr (std::is_same_v<T, AccountValueSnapshot>) return "AccountValueSnapshot";
        else if constexpr (std::is_same_v<T, OpenOrderSnapshot>) return "OpenOrderSnapshot";
        else if constexpr (std::is_same_v<T, ConnectionLost>) return "ConnectionLost";
        else return "ConnectionRestored";
      },
      event);
}

}  // namespace oms
