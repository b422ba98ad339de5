#pragma once

#include "oms/broker/i_broker_session.hpp"
#include "oms/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// SimulatedBroker: in-process IBrokerSession
// -----------------------------------------------------------------------------
//
// @brief  Stands in for the brokerage gateway in simulation mode and in
//         tests. Keeps its own order book and position book and answers
//         every call with the event stream a real gateway would produce.
//
// @details
// Behaviour:
//   submit()   assigns broker ids sequentially from first_broker_order_id.
//              With auto_ack the BrokerAck is emitted before submit()
//              returns. With auto_fill a single full-quantity BrokerFill
//              follows at the limit/stop price, or at market_price for MKT.
//              Every execution is followed by a BrokerCommissionReport of
//              commission_per_share * quantity, at least min_commission.
//   cancel()   emits BrokerStatus "Cancelled", or BrokerCancelReject when
//              the order is already filled or unknown.
//   modify()   amends the book silently; unknown ids produce an error event.
//   requestSnapshot() emits one OpenOrderSnapshot per working order, then a
//              PositionSnapshot and an AccountValueSnapshot.
//
// Test hooks (fill, injectEvent, addForeignOrder, dropConnection) let a
// scenario script broker behaviour explicitly.
//
// Events are emitted synchronously on the calling thread, outside the
// internal mutex, in call order.
//
// Thread model: every public method is safe from any thread.
// -----------------------------------------------------------------------------
class SimulatedBroker final : public IBrokerSession {
 public:
  struct Options {
    domain::BrokerOrderId first_broker_order_id{1000};
    bool auto_ack{true};
    bool auto_fill{false};
    double market_price{100.0};
    std::string account{"DU000000"};
    std::string exchange{"SMART"};
    std::string currency{"USD"};
    double commission_per_share{0.005};
    double min_commission{1.0};
  };

  explicit SimulatedBroker(const ITimeProvider& time_provider);
  SimulatedBroker(const ITimeProvider& time_provider, Options options);

  SimulatedBroker(const SimulatedBroker&) = delete;
  SimulatedBroker& operator=(const SimulatedBroker&) = delete;

  // IBrokerSession
  void connect() override;
  void disconnect() override;
  bool isConnected() const override;
  std::optional<domain::BrokerOrderId> submit(
      const SubmitRequest& request) override;
  void cancel(domain::BrokerOrderId broker_order_id) override;
  void modify(domain::BrokerOrderId broker_order_id,
              const domain::ModifyRequest& changes) override;
  void requestSnapshot() override;
  void attachEventSink(BrokerEventSink sink) override;

  // -------------------------------------------------------------------------
  // Test hooks
  // -------------------------------------------------------------------------

  // Emits an execution of `quantity` at `price` against a working order.
  // Returns false if the order is unknown or not working.
  bool fill(domain::BrokerOrderId broker_order_id, std::int64_t quantity,
            double price);

  // Pushes an arbitrary event through the sink, bypassing the book.
  void injectEvent(BrokerEvent event);

  // Adds a working order that the engine never submitted, as if entered
  // through the broker's own UI. Returns its broker id.
  domain::BrokerOrderId addForeignOrder(const domain::OrderSpec& spec);

  // Marks the session down and emits ConnectionLost.
  void dropConnection(const std::string& reason);

  std::size_t submitCount() const;

 private:
  struct BookEntry {
    domain::BrokerOrderId broker_order_id{0};
    std::optional<domain::OrderId> client_order_id;
    domain::OrderSpec spec;
    std::string status{"Submitted"};
    std::int64_t filled_qty{0};
    double notional{0.0};
  };

  struct Holding {
    domain::PositionKey key;
    double quantity{0.0};
    double avg_cost{0.0};
  };

  // Called with mutex_ held; appends the fill and commission events.
  void applyExecution(BookEntry& entry, std::int64_t quantity, double price,
                      std::vector<BrokerEvent>& events);
  double fillPriceFor(const domain::OrderSpec& spec) const;
  void emit(const std::vector<BrokerEvent>& events);
  void requireConnected() const;

  const ITimeProvider& time_provider_;
  const Options options_;

  mutable std::mutex mutex_;
  bool connected_{false};
  bool ever_connected_{false};
  BrokerEventSink sink_;
  domain::BrokerOrderId next_broker_order_id_;
  std::uint64_t next_exec_seq_{1};
  std::size_t submit_count_{0};
  std::map<domain::BrokerOrderId, BookEntry> book_;
  std::map<std::string, Holding> holdings_;
};

}  // namespace oms
