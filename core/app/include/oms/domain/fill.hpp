#pragma once

#include "oms/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// Fill: one broker execution against one order
// -----------------------------------------------------------------------------
//
// @brief  Immutable, append-only record of an execution.
//
// @details
// exec_id is the broker's execution id and the de-duplication key: the
// ledger refuses a second fill with the same (order_id, exec_id). fill_id is
// assigned by the ledger, monotonically, when the fill is appended.
//
// filled_qty is the increment of this execution, not the cumulative total.
// time is kept as the broker's own text timestamp; the engine never parses it.
// The commission fields stay empty until the broker's commission report for
// exec_id arrives; that report is the only later change a fill sees.
// -----------------------------------------------------------------------------
struct Fill {
  FillId id{0};
  OrderId order_id{0};
  std::string exec_id;
  double price{0.0};
  std::int64_t filled_qty{0};
  std::string symbol;
  Side side{Side::Buy};
  std::string time;
  std::optional<BrokerOrderId> broker_order_id;

  std::optional<double> commission;
  std::string commission_currency;
  std::optional<double> realized_pnl;

  std::int64_t created_ms{0};
  std::uint64_t created_seq{0};
};

}  // namespace domain
}  // namespace oms
