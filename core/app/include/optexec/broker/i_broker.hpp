#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/domain/order.hpp"
#include "optexec/domain/order_status.hpp"
#include "optexec/events/order_filled_event.hpp"

#include <functional>
#include <optional>

namespace optexec {
namespace broker {

// -----------------------------------------------------------------------------
// IBroker — abstract order gateway
// -----------------------------------------------------------------------------
//
// @brief  Everything the controllers need from a broker: place, cancel,
//         query, quote and a single fill callback.
//
// @details
// PaperBroker is the only implementation in this repository; a live broker
// adapter would implement the same interface and nothing upstream changes.
// ExecutionController, ExitController and RiskGovernor all hold an
// IBroker& injected by TradingEngine.
//
// Order ids are chosen by the caller (OrderRequest::id, drawn from the
// shared OrderIdGenerator) so that bookkeeping can be written before the
// request leaves the process. A request with id == kNoOrderId gets an id
// assigned by the broker.
//
// Fill reporting: every fill, partial or final, invokes the callback with a
// cumulative OrderFilledEvent. Receivers must apply only the part they have
// not seen yet (see OrderFilledEvent::fills).
//
// Thread model: implementations must be safe to call from any thread. The
// callback may run on whichever thread produced the fill (the placing
// thread for immediate market fills, the tick thread otherwise); it is
// never invoked with a broker-internal lock held.
// -----------------------------------------------------------------------------
class IBroker {
 public:
  using OrderFilledCallback = std::function<void(const OrderFilledEvent&)>;

  virtual ~IBroker() = default;

  // @return  the order id (request.id when set).
  // @throws  BrokerRejected when the broker refuses the request outright.
  virtual domain::OrderId placeOrder(const domain::OrderRequest& request) = 0;

  // @return  true if an open order was found and cancelled. false covers
  //          unknown ids and orders that already reached a terminal state.
  virtual bool cancelOrder(domain::OrderId id) = 0;

  // std::nullopt for ids the broker has never seen.
  virtual std::optional<domain::OrderStatus> getOrderStatus(
      domain::OrderId id) const = 0;

  // Last traded price, 0.0 when no quote is known.
  virtual double getLtp(const domain::Contract& contract) const = 0;

  virtual double getAccountBalance() const = 0;

  virtual void setOrderFilledCallback(OrderFilledCallback callback) = 0;
};

}  // namespace broker
}  // namespace optexec
