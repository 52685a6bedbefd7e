#pragma once

#include "optexec/domain/contract.hpp"
#include "optexec/domain/exit_reason.hpp"
#include "optexec/domain/order.hpp"
#include "optexec/domain/signal.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace optexec {
namespace domain {

// -----------------------------------------------------------------------------
// OpenPosition
// -----------------------------------------------------------------------------
// Responsibility: The execution controller's working view of one entry
// order, from submission until the exit controller reports the exit.
//
// @details
// quantity_filled and average_entry_price are maintained from fill deltas
// only. applied_sequence is the highest Fill::sequence already applied;
// accounted_quantity is the cumulative quantity already applied. Together
// they make re-delivery of a cumulative fill report a no-op.
//
// after_exit marks a snapshot of fills that arrived once the position had
// already been exited. Such a snapshot describes only those late fills:
// quantity_filled and average_entry_price cover the residual to flatten.
//
// Ownership: exclusively owned by ExecutionController. Other components
// receive copies (snapshots) and never write back.
// -----------------------------------------------------------------------------
struct OpenPosition {
  OrderId order_id{kNoOrderId};
  Contract contract;
  SignalType signal{SignalType::BuyCall};
  OrderKind entry_kind{OrderKind::Market};
  double limit_price{0.0};
  std::int64_t quantity_requested{0};
  std::int64_t quantity_filled{0};
  double average_entry_price{0.0};
  OrderStatus status{OrderStatus::Pending};
  std::uint32_t applied_sequence{0};
  std::int64_t accounted_quantity{0};
  std::int64_t created_at_ms{0};
  bool after_exit{false};
};

enum class AggregateStatus {
  Open,
  Closed,
};

// -----------------------------------------------------------------------------
// AggregatePosition
// -----------------------------------------------------------------------------
// Responsibility: Per-symbol position in the ledger, built from entry and
// exit fills of possibly several orders.
//
// Invariants:
//   open_quantity == opened_quantity - closed_quantity >= 0
//   average_entry_price is quantity-weighted over every entry fill
//   average_exit_price is quantity-weighted over every exit fill
//   status == Closed exactly when open_quantity reached 0 after an exit
// -----------------------------------------------------------------------------
struct AggregatePosition {
  std::string symbol;
  Contract contract;
  AggregateStatus status{AggregateStatus::Open};
  std::int64_t open_quantity{0};
  std::int64_t opened_quantity{0};
  std::int64_t closed_quantity{0};
  double average_entry_price{0.0};
  double average_exit_price{0.0};
  double last_price{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double net_pnl{0.0};
  std::vector<OrderId> entry_order_ids;
  std::vector<OrderId> exit_order_ids;
  std::optional<ExitReason> last_exit_reason;
};

}  // namespace domain
}  // namespace optexec
