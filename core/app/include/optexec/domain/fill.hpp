#pragma once

#include "optexec/domain/order.hpp"

#include <cstdint>

namespace optexec {
namespace domain {

// -----------------------------------------------------------------------------
// Fill
// -----------------------------------------------------------------------------
// Responsibility: One execution slice of an order.
//
// @details
// Append-only. sequence is 1-based per order and strictly increasing, which
// lets a consumer tell which slices it has already applied regardless of how
// often (or in which order) the cumulative fill report is delivered. The
// quantities of all fills of one order sum to at most the order quantity.
// -----------------------------------------------------------------------------
struct Fill {
  OrderId order_id{kNoOrderId};
  std::int64_t quantity{0};
  double price{0.0};
  std::uint32_t sequence{0};
  std::int64_t time_ms{0};
};

}  // namespace domain
}  // namespace optexec
