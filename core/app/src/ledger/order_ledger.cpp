#include "oms/ledger/order_ledger.hpp"
#include "oms/codec/json_codec.hpp"
#include "oms/domain/enum_codec.hpp"
#include "oms/state/order_state_machine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <tuple>

namespace oms {

namespace {

constexpr int kDefaultLogLimit = 1000;

// Newest first: created_seq descending, id descending on ties.
template <typename Record>
bool newerFirst(const Record& a, const Record& b) {
  if (a.created_seq != b.created_seq) {
    return a.created_seq > b.created_seq;
  }
  return a.id > b.id;
}

template <typename Record>
void keepNewest(std::vector<Record>& rows, int limit) {
  const auto n = std::min<std::size_t>(rows.size(), static_cast<std::size_t>(limit));
  std::partial_sort(rows.begin(), rows.begin() + n, rows.end(),
                    newerFirst<Record>);
  rows.resize(n);
}

}  // namespace

OrderLedger::OrderLedger(const ITimeProvider& time_provider,
                         int default_list_limit, std::size_t audit_capacity)
    : time_provider_(time_provider),
      default_list_limit_(default_list_limit > 0 ? default_list_limit : 100),
      audit_capacity_(audit_capacity > 0 ? audit_capacity : 1) {}

int OrderLedger::effectiveLimit(int limit) const {
  return limit > 0 ? limit : default_list_limit_;
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
ErrorCode OrderLedger::putOrder(domain::Order order) {
  if (order.quantity <= 0 || order.filled_qty < 0 ||
      order.filled_qty > order.quantity) {
    std::cerr << "[OrderLedger] WARNING: refusing order_id=" << order.id
              << ": filled_qty=" << order.filled_qty
              << " quantity=" << order.quantity << "\n";
    return ErrorCode::InvalidState;
  }

  {
    std::unique_lock lock(orders_mutex_);
    auto it = orders_.find(order.id);
    if (it == orders_.end()) {
      order.created_seq = next_order_seq_++;
      orders_.emplace(order.id, order);
    } else {
      const domain::Order& stored = it->second;
      if (stored.status != order.status &&
          !OrderStateMachine::isLegal(stored.status, order.status)) {
        std::cerr << "[OrderLedger] WARNING: refusing order_id=" << order.id
                  << " transition " << domain::toString(stored.status)
                  << " -> " << domain::toString(order.status) << "\n";
        return ErrorCode::InvalidState;
      }
      if (stored.broker_order_id && order.broker_order_id != stored.broker_order_id) {
        std::cerr << "[OrderLedger] WARNING: refusing order_id=" << order.id
                  << " broker_order_id change\n";
        return ErrorCode::InvalidState;
      }
      order.created_seq = stored.created_seq;
      order.created_ms = stored.created_ms;
      it->second = order;
    }
  }

  audit("order_upsert", nlohmann::json(order));
  return ErrorCode::None;
}

std::optional<domain::Order> OrderLedger::getOrder(domain::OrderId id) const {
  std::shared_lock lock(orders_mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Order> OrderLedger::listOrders(int limit) const {
  std::vector<domain::Order> rows;
  {
    std::shared_lock lock(orders_mutex_);
    rows.reserve(orders_.size());
    for (const auto& [id, order] : orders_) {
      rows.push_back(order);
    }
  }
  keepNewest(rows, effectiveLimit(limit));
  return rows;
}

std::size_t OrderLedger::orderCount() const {
  std::shared_lock lock(orders_mutex_);
  return orders_.size();
}

domain::OrderId OrderLedger::maxOrderId() const {
  std::shared_lock lock(orders_mutex_);
  domain::OrderId max_id = 0;
  for (const auto& [id, order] : orders_) {
    max_id = std::max(max_id, id);
  }
  return max_id;
}

// -----------------------------------------------------------------------------
// Fills
// -----------------------------------------------------------------------------
std::optional<domain::Fill> OrderLedger::appendFill(domain::Fill fill) {
  {
    std::unique_lock lock(fills_mutex_);
    auto& seen = exec_ids_[fill.order_id];
    if (!seen.insert(fill.exec_id).second) {
      return std::nullopt;
    }
    fill.id = next_fill_id_++;
    fill.created_seq = static_cast<std::uint64_t>(fill.id);
    fills_.push_back(fill);
  }

  audit("fill_append", nlohmann::json(fill));
  return fill;
}

bool OrderLedger::hasFill(domain::OrderId order_id,
                          const std::string& exec_id) const {
  std::shared_lock lock(fills_mutex_);
  auto it = exec_ids_.find(order_id);
  return it != exec_ids_.end() && it->second.count(exec_id) != 0;
}

std::optional<CommissionChange> OrderLedger::applyCommission(
    domain::OrderId order_id, const std::string& exec_id, double commission,
    const std::string& currency, std::optional<double> realized_pnl) {
  CommissionChange change;
  {
    std::unique_lock lock(fills_mutex_);
    auto it = std::find_if(fills_.begin(), fills_.end(),
                           [&](const domain::Fill& f) {
                             return f.order_id == order_id && f.exec_id == exec_id;
                           });
    if (it == fills_.end()) {
      return std::nullopt;
    }
    change.previous_commission = it->commission;
    change.previous_realized_pnl = it->realized_pnl;
    it->commission = commission;
    it->commission_currency = currency;
    it->realized_pnl = realized_pnl;
    change.fill = *it;
  }

  audit("fill_commission", nlohmann::json(change.fill));
  return change;
}

std::vector<domain::Fill> OrderLedger::listFills(
    std::optional<domain::OrderId> order_id, int limit) const {
  std::vector<domain::Fill> rows;
  {
    std::shared_lock lock(fills_mutex_);
    for (const auto& fill : fills_) {
      if (!order_id || fill.order_id == *order_id) {
        rows.push_back(fill);
      }
    }
  }
  keepNewest(rows, effectiveLimit(limit));
  return rows;
}

// -----------------------------------------------------------------------------
// applyToPosition: increase / decrease / cross-zero average cost rules
// -----------------------------------------------------------------------------
void OrderLedger::applyToPosition(domain::Position& pos,
                                  double signed_quantity, double price) {
  const double current = pos.position;
  const double next = current + signed_quantity;

  if (current == 0.0 || (current > 0.0) == (signed_quantity > 0.0)) {
    // Opening or increasing.
    pos.avg_cost = (current * pos.avg_cost + signed_quantity * price) / next;
  } else if (next != 0.0 && (current > 0.0) != (next > 0.0)) {
    // Crossed zero: the remainder opens at the fill price.
    pos.avg_cost = price;
  } else if (next == 0.0) {
    pos.avg_cost = 0.0;
  }
  pos.position = next;
}

PositionChange OrderLedger::applyFillDelta(const domain::PositionKey& key,
                                           double signed_quantity,
                                           double price,
                                           std::int64_t event_ms) {
  PositionChange change;
  {
    std::unique_lock lock(positions_mutex_);
    PositionSlot& slot = positions_[key];
    slot.position.key = key;
    applyToPosition(slot.position, signed_quantity, price);
    slot.position.as_of_ms = event_ms;
    slot.pending.push_back(PositionDelta{signed_quantity, price, event_ms});
    std::int64_t newest = event_ms;
    for (const auto& delta : slot.pending) {
      newest = std::max(newest, delta.event_ms);
    }
    const std::int64_t cutoff = newest - kDeltaRetentionMs;
    slot.pending.erase(
        std::remove_if(slot.pending.begin(), slot.pending.end(),
                       [cutoff](const PositionDelta& d) { return d.event_ms < cutoff; }),
        slot.pending.end());
    change.position = slot.position;
  }

  audit("position_upsert", nlohmann::json(change.position));
  return change;
}

// -----------------------------------------------------------------------------
// applyPositionSnapshot: broker figures + deltas newer than the snapshot
// -----------------------------------------------------------------------------
std::vector<PositionChange> OrderLedger::applyPositionSnapshot(
    const std::vector<domain::Position>& rows, std::int64_t as_of_ms) {
  std::vector<PositionChange> changes;
  {
    std::unique_lock lock(positions_mutex_);
    for (const auto& row : rows) {
      std::vector<PositionDelta> newer;
      auto it = positions_.find(row.key);
      if (it != positions_.end()) {
        for (const auto& delta : it->second.pending) {
          if (delta.event_ms > as_of_ms) {
            newer.push_back(delta);
          }
        }
      }

      domain::Position merged = row;
      merged.as_of_ms = as_of_ms;
      for (const auto& delta : newer) {
        applyToPosition(merged, delta.signed_quantity, delta.price);
        merged.as_of_ms = std::max(merged.as_of_ms, delta.event_ms);
      }

      if (merged.position == 0.0 && newer.empty()) {
        if (it != positions_.end()) {
          positions_.erase(it);
          changes.push_back(PositionChange{merged, true});
        }
        continue;
      }

      PositionSlot& slot = positions_[row.key];
      slot.position = merged;
      slot.pending = std::move(newer);
      changes.push_back(PositionChange{merged, false});
    }
  }

  for (const auto& change : changes) {
    audit(change.removed ? "position_remove" : "position_upsert",
          nlohmann::json(change.position));
  }
  return changes;
}

std::vector<domain::Position> OrderLedger::listPositions() const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::Position> rows;
  rows.reserve(positions_.size());
  for (const auto& [key, slot] : positions_) {
    rows.push_back(slot.position);
  }
  std::sort(rows.begin(), rows.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return std::tie(a.key.account, a.key.symbol, a.key.sec_type,
                              a.key.exchange, a.key.con_id) <
                     std::tie(b.key.account, b.key.symbol, b.key.sec_type,
                              b.key.exchange, b.key.con_id);
            });
  return rows;
}

std::size_t OrderLedger::pendingDeltaCount(const domain::PositionKey& key) const {
  std::shared_lock lock(positions_mutex_);
  auto it = positions_.find(key);
  return it == positions_.end() ? 0 : it->second.pending.size();
}

// -----------------------------------------------------------------------------
// Account values
// -----------------------------------------------------------------------------
void OrderLedger::upsertAccountValue(const domain::AccountValue& value) {
  {
    std::unique_lock lock(account_values_mutex_);
    account_values_[value.key()] = value;
  }
  audit("account_value_upsert", nlohmann::json(value));
}

std::vector<domain::AccountValue> OrderLedger::listAccountValues() const {
  std::shared_lock lock(account_values_mutex_);
  std::vector<domain::AccountValue> rows;
  rows.reserve(account_values_.size());
  for (const auto& [key, value] : account_values_) {
    rows.push_back(value);
  }
  std::sort(rows.begin(), rows.end(),
            [](const domain::AccountValue& a, const domain::AccountValue& b) {
              return std::tie(a.account, a.tag, a.currency) <
                     std::tie(b.account, b.tag, b.currency);
            });
  return rows;
}

// -----------------------------------------------------------------------------
// Audit log
// -----------------------------------------------------------------------------
void OrderLedger::audit(const char* event_type, nlohmann::json payload) {
  std::lock_guard lock(audit_mutex_);
  audit_log_.push_back(AuditEntry{next_audit_seq_++, time_provider_.now_ms(),
                                  event_type, std::move(payload)});
  while (audit_log_.size() > audit_capacity_) {
    audit_log_.pop_front();
  }
}

std::vector<AuditEntry> OrderLedger::getLogs(
    std::optional<std::uint64_t> since_seq, int limit) const {
  const std::size_t cap =
      static_cast<std::size_t>(limit > 0 ? limit : kDefaultLogLimit);
  std::lock_guard lock(audit_mutex_);

  auto first = audit_log_.begin();
  if (since_seq) {
    first = std::find_if(audit_log_.begin(), audit_log_.end(),
                         [&](const AuditEntry& e) { return e.seq > *since_seq; });
  }
  const auto available = static_cast<std::size_t>(std::distance(first, audit_log_.end()));
  if (available > cap) {
    first += static_cast<std::ptrdiff_t>(available - cap);
  }
  return std::vector<AuditEntry>(first, audit_log_.end());
}

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------
LedgerSnapshot OrderLedger::snapshot() const {
  LedgerSnapshot snap;
  {
    std::shared_lock lock(orders_mutex_);
    for (const auto& [id, order] : orders_) {
      snap.orders.push_back(order);
    }
  }
  std::sort(snap.orders.begin(), snap.orders.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.created_seq < b.created_seq;
            });
  {
    std::shared_lock lock(fills_mutex_);
    snap.fills = fills_;
  }
  snap.positions = listPositions();
  snap.account_values = listAccountValues();
  return snap;
}

void OrderLedger::restore(const LedgerSnapshot& snapshot) {
  {
    std::unique_lock lock(orders_mutex_);
    orders_.clear();
    next_order_seq_ = 1;
    for (const auto& order : snapshot.orders) {
      orders_[order.id] = order;
      next_order_seq_ = std::max(next_order_seq_, order.created_seq + 1);
    }
  }
  {
    std::unique_lock lock(fills_mutex_);
    fills_ = snapshot.fills;
    exec_ids_.clear();
    next_fill_id_ = 1;
    for (const auto& fill : fills_) {
      exec_ids_[fill.order_id].insert(fill.exec_id);
      next_fill_id_ = std::max(next_fill_id_, fill.id + 1);
    }
  }
  {
    std::unique_lock lock(positions_mutex_);
    positions_.clear();
    for (const auto& position : snapshot.positions) {
      positions_[position.key].position = position;
    }
  }
  {
    std::unique_lock lock(account_values_mutex_);
    account_values_.clear();
    for (const auto& value : snapshot.account_values) {
      account_values_[value.key()] = value;
    }
  }
  std::cout << "[OrderLedger] Restored " << snapshot.orders.size()
            << " orders, " << snapshot.fills.size() << " fills, "
            << snapshot.positions.size() << " positions\n";
}

}  // namespace oms
