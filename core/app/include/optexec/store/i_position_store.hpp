#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/domain/exit_reason.hpp"
#include "optexec/domain/order.hpp"
#include "optexec/domain/position.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace optexec {
namespace store {

// -----------------------------------------------------------------------------
// IPositionStore — aggregate position bookkeeping
// -----------------------------------------------------------------------------
//
// @brief  Folds entry and exit fills into one AggregatePosition per symbol.
//
// @details
// Callers deliver each fill exactly once; the store does not deduplicate.
// ExecutionController feeds entry fill deltas, ExitController feeds exit
// fills and marks. Readers get value copies, never references into the
// store's table.
// -----------------------------------------------------------------------------
class IPositionStore {
 public:
  virtual ~IPositionStore() = default;

  virtual void applyEntryFill(const domain::Contract& contract,
                              domain::OrderId order_id, std::int64_t quantity,
                              double price) = 0;

  virtual void applyExitFill(const domain::Contract& contract,
                             domain::OrderId exit_order_id,
                             std::int64_t quantity, double price,
                             domain::ExitReason reason) = 0;

  virtual void markToMarket(const domain::Contract& contract,
                            double last_price) = 0;

  // Latest aggregate (open or most recently closed) for symbol.
  virtual std::optional<domain::AggregatePosition> position(
      const std::string& symbol) const = 0;
};

}  // namespace store
}  // namespace optexec
