#pragma once

#include "oms/broker/broker_event.hpp"
#include "oms/domain/order.hpp"

#include <functional>
#include <optional>

namespace oms {

// -----------------------------------------------------------------------------
// SubmitRequest
// -----------------------------------------------------------------------------
// The order as handed to the broker. client_order_id is the engine's
// OrderId; brokers that support a client reference echo it back on events.
// -----------------------------------------------------------------------------
struct SubmitRequest {
  domain::OrderId client_order_id{0};
  domain::OrderSpec spec;
};

using BrokerEventSink = std::function<void(BrokerEvent)>;

// -----------------------------------------------------------------------------
// IBrokerSession: the single connection to the brokerage gateway
// -----------------------------------------------------------------------------
//
// @brief  Abstract collaborator for the broker wire client. The engine owns
//         exactly one instance, and only SessionGuard calls it.
//
// @details
// Error contract:
//   Transport failures (not connected, socket closed, request refused) are
//   reported by throwing oms::BrokerError. Order-level outcomes (reject,
//   fill, cancel confirm) are never thrown; they arrive asynchronously
//   through the event sink.
//
// Calls may block on network I/O. SessionGuard bounds each call with the
// configured timeout, so an implementation does not need its own.
//
// Event delivery:
//   attachEventSink() is called once, before connect(). The implementation
//   invokes the sink from whatever thread its I/O runs on, in per-connection
//   order. The sink only enqueues and never blocks.
//
// Thread model:
//   SessionGuard never runs two mutating calls (submit, cancel, modify)
//   at once. isConnected() and requestSnapshot() may overlap them.
// -----------------------------------------------------------------------------
class IBrokerSession {
 public:
  virtual ~IBrokerSession() = default;

  virtual void connect() = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  // -------------------------------------------------------------------------
  // submit(request)
  // -------------------------------------------------------------------------
  // @return The broker order id when the broker assigns it synchronously,
  //         std::nullopt when it will only arrive with the ack.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::BrokerOrderId> submit(
      const SubmitRequest& request) = 0;

  virtual void cancel(domain::BrokerOrderId broker_order_id) = 0;

  // changes holds only the fields the client asked to change.
  virtual void modify(domain::BrokerOrderId broker_order_id,
                      const domain::ModifyRequest& changes) = 0;

  // Asks the broker to push PositionSnapshot, AccountValueSnapshot and one
  // OpenOrderSnapshot per working order. Read-only.
  virtual void requestSnapshot() = 0;

  virtual void attachEventSink(BrokerEventSink sink) = 0;
};

}  // namespace oms
