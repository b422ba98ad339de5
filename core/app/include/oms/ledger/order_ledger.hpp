#pragma once

#include "oms/domain/account_value.hpp"
#include "oms/domain/error_code.hpp"
#include "oms/domain/fill.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/position.hpp"
#include "oms/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// AuditEntry: one row of the append-only audit log
// -----------------------------------------------------------------------------
struct AuditEntry {
  std::uint64_t seq{0};
  std::int64_t ts_ms{0};
  std::string event_type;  // order_upsert, fill_append, position_upsert, ...
  nlohmann::json payload;
};

// -----------------------------------------------------------------------------
// PositionChange: one position row touched by a delta or snapshot
// -----------------------------------------------------------------------------
struct PositionChange {
  domain::Position position;
  bool removed{false};
};

// -----------------------------------------------------------------------------
// CommissionChange: a fill after its commission report, plus what it replaced
// -----------------------------------------------------------------------------
struct CommissionChange {
  domain::Fill fill;
  std::optional<double> previous_commission;
  std::optional<double> previous_realized_pnl;
};

// -----------------------------------------------------------------------------
// LedgerSnapshot: full ledger contents, for persistence
// -----------------------------------------------------------------------------
struct LedgerSnapshot {
  std::vector<domain::Order> orders;
  std::vector<domain::Fill> fills;
  std::vector<domain::Position> positions;
  std::vector<domain::AccountValue> account_values;
  std::vector<std::pair<domain::OrderId, domain::BrokerOrderId>> bindings;
};

// -----------------------------------------------------------------------------
// OrderLedger: the authoritative store of orders, fills, positions and
//              account values
// -----------------------------------------------------------------------------
//
// @brief  Owns the four tables and the audit log. Every other component
//         reads copies and writes through this class; nothing else holds a
//         reference into the tables.
//
// @details
// Tables and locking:
//   Each table has its own std::shared_mutex: many concurrent readers,
//   one writer per table. Writes to different tables do not block each
//   other, and no method holds two table locks at once. A fill that touches
//   both fills_ and positions_ is two separate writes; the reconciler
//   completes both before it takes the next event.
//
// Orders:
//   putOrder() inserts or replaces. On insert it assigns created_seq; on
//   replace it keeps the stored created_seq/created_ms and refuses a status
//   change the lifecycle graph does not allow, as well as a record that
//   violates filled_qty <= quantity. Orders are never deleted.
//
// Fills:
//   appendFill() assigns fill_id and refuses a second fill with the same
//   (order_id, exec_id). applyCommission() fills in the commission fields of
//   a recorded fill; a repeated report replaces the earlier figures.
//
// Positions:
//   applyFillDelta() moves a position by one execution and remembers the
//   delta. applyPositionSnapshot() replaces rows with broker figures but
//   re-applies any remembered delta newer than the snapshot, so a fill is
//   never lost to a snapshot that raced it. A flat snapshot removes the key
//   unless newer deltas remain. Deltas older than kDeltaRetentionMs behind
//   the newest one for the key are forgotten; a snapshot that late is
//   taken as already covering them.
//
//   avg_cost rules (signed quantities):
//     increasing  avg = (qty * avg + fill_qty * price) / (qty + fill_qty)
//     decreasing  avg unchanged
//     crossing 0  avg = price of the crossing fill
//
// Listing:
//   listOrders()/listFills() return newest first (created_seq descending,
//   id descending on ties). limit <= 0 means the default limit.
//
// The ledger never calls the broker and never publishes events.
//
// Thread model: every public method is safe from any thread.
// -----------------------------------------------------------------------------
class OrderLedger {
 public:
  OrderLedger(const ITimeProvider& time_provider, int default_list_limit,
              std::size_t audit_capacity = 100000);

  OrderLedger(const OrderLedger&) = delete;
  OrderLedger& operator=(const OrderLedger&) = delete;
  OrderLedger(OrderLedger&&) = delete;
  OrderLedger& operator=(OrderLedger&&) = delete;

  // Orders ------------------------------------------------------------------

  // -------------------------------------------------------------------------
  // putOrder(order)
  // -------------------------------------------------------------------------
  // @return ErrorCode::None when stored, ErrorCode::InvalidState when the
  //         record breaks the lifecycle graph or the quantity invariant.
  // -------------------------------------------------------------------------
  ErrorCode putOrder(domain::Order order);

  std::optional<domain::Order> getOrder(domain::OrderId id) const;
  std::vector<domain::Order> listOrders(int limit = 0) const;
  std::size_t orderCount() const;
  domain::OrderId maxOrderId() const;

  // Fills -------------------------------------------------------------------

  // -------------------------------------------------------------------------
  // appendFill(fill)
  // -------------------------------------------------------------------------
  // @return The stored fill (with fill_id assigned), or std::nullopt when
  //         (order_id, exec_id) was already recorded.
  // -------------------------------------------------------------------------
  std::optional<domain::Fill> appendFill(domain::Fill fill);

  bool hasFill(domain::OrderId order_id, const std::string& exec_id) const;

  // -------------------------------------------------------------------------
  // applyCommission(order_id, exec_id, commission, currency, realized_pnl)
  // -------------------------------------------------------------------------
  // @return The updated fill and its previous figures, or std::nullopt when
  //         no fill (order_id, exec_id) is recorded yet.
  // -------------------------------------------------------------------------
  std::optional<CommissionChange> applyCommission(
      domain::OrderId order_id, const std::string& exec_id, double commission,
      const std::string& currency, std::optional<double> realized_pnl);

  std::vector<domain::Fill> listFills(std::optional<domain::OrderId> order_id,
                                      int limit = 0) const;

  // Positions ---------------------------------------------------------------

  PositionChange applyFillDelta(const domain::PositionKey& key,
                                double signed_quantity, double price,
                                std::int64_t event_ms);

  std::vector<PositionChange> applyPositionSnapshot(
      const std::vector<domain::Position>& rows, std::int64_t as_of_ms);

  std::vector<domain::Position> listPositions() const;

  // Deltas still held for `key` against a later snapshot.
  std::size_t pendingDeltaCount(const domain::PositionKey& key) const;

  static constexpr std::int64_t kDeltaRetentionMs = 10 * 60 * 1000;

  // Account values ----------------------------------------------------------

  void upsertAccountValue(const domain::AccountValue& value);
  std::vector<domain::AccountValue> listAccountValues() const;

  // Audit log ---------------------------------------------------------------

  // -------------------------------------------------------------------------
  // getLogs(since_seq, limit)
  // -------------------------------------------------------------------------
  // @brief  Tail of the audit log: the last `limit` entries with
  //         seq > since_seq (all entries when since_seq is absent), oldest
  //         first. limit <= 0 means 1000.
  // -------------------------------------------------------------------------
  std::vector<AuditEntry> getLogs(std::optional<std::uint64_t> since_seq,
                                  int limit = 1000) const;

  // Persistence -------------------------------------------------------------

  // Bindings are not owned by the ledger; the snapshot leaves them empty.
  LedgerSnapshot snapshot() const;

  // Replaces the table contents. Startup only, before any other traffic.
  void restore(const LedgerSnapshot& snapshot);

 private:
  struct PositionDelta {
    double signed_quantity{0.0};
    double price{0.0};
    std::int64_t event_ms{0};
  };

  struct PositionSlot {
    domain::Position position;
    std::vector<PositionDelta> pending;  // deltas no snapshot has covered
  };

  static void applyToPosition(domain::Position& position,
                              double signed_quantity, double price);

  int effectiveLimit(int limit) const;
  void audit(const char* event_type, nlohmann::json payload);

  const ITimeProvider& time_provider_;
  const int default_list_limit_;
  const std::size_t audit_capacity_;

  mutable std::shared_mutex orders_mutex_;
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::uint64_t next_order_seq_{1};

  mutable std::shared_mutex fills_mutex_;
  std::vector<domain::Fill> fills_;
  std::unordered_map<domain::OrderId, std::unordered_set<std::string>>
      exec_ids_;
  domain::FillId next_fill_id_{1};

  mutable std::shared_mutex positions_mutex_;
  std::unordered_map<domain::PositionKey, PositionSlot,
                     domain::PositionKeyHash>
      positions_;

  mutable std::shared_mutex account_values_mutex_;
  std::unordered_map<domain::AccountValueKey, domain::AccountValue,
                     domain::AccountValueKeyHash>
      account_values_;

  mutable std::mutex audit_mutex_;
  std::deque<AuditEntry> audit_log_;
  std::uint64_t next_audit_seq_{1};
};

}  // namespace oms
