#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/domain/order.hpp"
#include "optexec/domain/signal.hpp"

#include <cstdint>
#include <limits>

namespace optexec {
namespace domain {

// -----------------------------------------------------------------------------
// ExitState
// -----------------------------------------------------------------------------
// Responsibility: The exit controller's per-position trigger state, keyed by
// the entry order id.
//
// @details
// Created once by ExitController::registerPosition(), mutated on ticks and
// candle closes, destroyed on exit. take_profit_price is +infinity when
// target exits are disabled. broker_stop_order_id / broker_target_order_id
// are kNoOrderId when that leg is monitored in software.
//
// Ownership: exclusively owned by ExitController; snapshots are copies.
// -----------------------------------------------------------------------------
struct ExitState {
  OrderId order_id{kNoOrderId};
  Contract contract;
  SignalType signal{SignalType::BuyCall};
  std::int64_t quantity{0};
  double entry_price{0.0};
  double entry_price_original{0.0};
  double stop_loss_price{0.0};
  double take_profit_price{std::numeric_limits<double>::infinity()};
  double highest_price{0.0};
  double lowest_price{0.0};
  bool breakeven_engaged{false};
  OrderId broker_stop_order_id{kNoOrderId};
  OrderId broker_target_order_id{kNoOrderId};
  double last_broker_stop_price{0.0};
};

}  // namespace domain
}  // namespace optexec
