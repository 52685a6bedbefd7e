#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace optexec {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Responsibility: Unique identifier for an order within one session.
// Ids are issued by a single OrderIdGenerator shared by the execution
// controller (pre-generated entry ids) and the broker (exit orders), so the
// two never collide. 0 means "not assigned".
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

constexpr OrderId kNoOrderId = 0;

enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Market  — fill at the prevailing price.
// Limit   — BUY fills at LTP <= price, SELL fills at LTP >= price.
// Stop    — becomes a market order once LTP crosses trigger_price
//           (SELL: LTP <= trigger, BUY: LTP >= trigger).
// -----------------------------------------------------------------------------
enum class OrderKind {
  Market,
  Limit,
  Stop,
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Responsibility: What a caller asks the broker to do.
//
// @details
// When id is kNoOrderId the broker assigns one. The execution controller
// always pre-generates the id of an entry order so that a fill callback
// arriving before placeOrder() returns can still be matched to its
// OpenPosition.
// -----------------------------------------------------------------------------
struct OrderRequest {
  OrderId id{kNoOrderId};
  Contract contract;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  OrderKind kind{OrderKind::Market};
  double limit_price{0.0};     // Limit orders only
  double trigger_price{0.0};   // Stop orders only
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The broker's view of a placed order: the request plus its
// lifecycle status and cumulative fill.
//
// Ownership: mutated only by the owning broker; everyone else receives
// copies.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{kNoOrderId};
  Contract contract;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  OrderKind kind{OrderKind::Market};
  double limit_price{0.0};
  double trigger_price{0.0};
  OrderStatus status{OrderStatus::Pending};
  std::int64_t filled_quantity{0};
  double average_fill_price{0.0};
  std::int64_t placed_at_ms{0};
};

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline const char* orderKindToString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market: return "MARKET";
    case OrderKind::Limit:  return "LIMIT";
    case OrderKind::Stop:   return "STOP";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace optexec
