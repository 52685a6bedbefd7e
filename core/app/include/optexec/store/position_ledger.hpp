#pragma once

#include "optexec/domain/position.hpp"
#include "optexec/store/i_position_store.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace optexec {
namespace store {

// -----------------------------------------------------------------------------
// PositionLedger — per-symbol aggregate positions and PnL
// -----------------------------------------------------------------------------
//
// @brief  Reconciles entry and exit fills into one AggregatePosition per
//         symbol and computes realized, unrealized and net PnL.
//
// @details
// Positions are long-only option buys, so the math reduces to two cases:
//
//   Entry fill (increasing):
//     avg_entry = (open × avg_entry + qty × price) / (open + qty)
//     opened += qty
//
//   Exit fill (decreasing, clamped to the open quantity):
//     q          = min(qty, open)
//     realized  += (price − avg_entry) × q
//     avg_exit   = (closed × avg_exit + q × price) / (closed + q)
//     closed    += q
//     status     = CLOSED exactly when opened − closed reaches 0
//
// An entry fill for a symbol whose aggregate is CLOSED starts a fresh
// aggregate; the closed one moves to closedPositions().
//
// The weighted average does not depend on the order fills arrive in, but
// the ledger does no deduplication. ExecutionController only forwards fill
// deltas, which is what makes a replayed broker event a no-op.
//
// Thread model:
//   Written from the execution loop (entry fills) and the market loop
//   (marks, exit fills); read by the IPC thread. Writers take a
//   unique_lock, readers a shared_lock. Nothing is called out while the
//   lock is held.
//
// Ownership: owned by TradingEngine; referenced by the controllers through
// IPositionStore.
// -----------------------------------------------------------------------------
class PositionLedger final : public IPositionStore {
 public:
  PositionLedger() = default;

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // quantity <= 0 is ignored.
  void applyEntryFill(const domain::Contract& contract,
                      domain::OrderId order_id, std::int64_t quantity,
                      double price) override;

  // No-op (with a warning) when the symbol has no OPEN aggregate.
  void applyExitFill(const domain::Contract& contract,
                     domain::OrderId exit_order_id, std::int64_t quantity,
                     double price, domain::ExitReason reason) override;

  // No-op when the symbol has no OPEN aggregate or no known entry price.
  void markToMarket(const domain::Contract& contract,
                    double last_price) override;

  std::optional<domain::AggregatePosition> position(
      const std::string& symbol) const override;

  // Current aggregate per symbol, open and closed, as value copies.
  std::vector<domain::AggregatePosition> getSnapshots() const;

  // Every CLOSED aggregate: those superseded by a later entry on the same
  // symbol (oldest first), then the symbols whose current aggregate is
  // closed.
  std::vector<domain::AggregatePosition> closedPositions() const;

  // Realized PnL over every aggregate the ledger has seen this session.
  double realizedPnl() const;

 private:
  static void refreshPnl(domain::AggregatePosition& pos);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::AggregatePosition> positions_;
  std::vector<domain::AggregatePosition> closed_history_;
};

}  // namespace store
}  // namespace optexec
