#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/domain/fill.hpp"
#include "optexec/domain/order.hpp"
#include "optexec/events/event_types.hpp"

#include <cstdint>
#include <vector>

namespace optexec {

// -----------------------------------------------------------------------------
// OrderFilledEvent
// -----------------------------------------------------------------------------
//
// @brief  Broker callback payload: the cumulative fill state of one order.
//
// @details
// Reports are cumulative, not incremental. filled_quantity is the total
// filled so far and fill_price is the average over all of it. fills carries
// the per-slice breakdown when the broker has one (the paper broker always
// does); a consumer that tracks the highest sequence it has applied can
// therefore receive the same report any number of times, or an older report
// after a newer one, without double counting.
//
// When fills is empty the consumer falls back to the cumulative quantity:
// delta = filled_quantity - already_accounted.
//
// is_partial is true while filled_quantity < total_quantity.
// -----------------------------------------------------------------------------
struct OrderFilledEvent {
  domain::OrderId order_id{domain::kNoOrderId};
  domain::Contract contract;
  domain::Side side{domain::Side::Buy};
  double fill_price{0.0};              // Average over filled_quantity
  std::int64_t total_quantity{0};      // Order quantity
  std::int64_t filled_quantity{0};     // Cumulative filled quantity
  bool is_partial{false};
  std::vector<domain::Fill> fills;     // Cumulative per-slice breakdown
  Timestamp timestamp{};
};

}  // namespace optexec
