#include "optexec/store/position_ledger.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace optexec {
namespace store {

// -----------------------------------------------------------------------------
// applyEntryFill: open or grow the symbol's aggregate
// -----------------------------------------------------------------------------
void PositionLedger::applyEntryFill(const domain::Contract& contract,
                                    domain::OrderId order_id,
                                    std::int64_t quantity, double price) {
  if (quantity <= 0) {
    return;
  }

  std::unique_lock lock(mutex_);

  auto it = positions_.find(contract.symbol);
  if (it != positions_.end() &&
      it->second.status == domain::AggregateStatus::Closed) {
    closed_history_.push_back(std::move(it->second));
    positions_.erase(it);
    it = positions_.end();
  }

  if (it == positions_.end()) {
    domain::AggregatePosition fresh;
    fresh.symbol = contract.symbol;
    fresh.contract = contract;
    fresh.status = domain::AggregateStatus::Open;
    fresh.average_entry_price = price;
    fresh.opened_quantity = quantity;
    fresh.open_quantity = quantity;
    fresh.last_price = price;
    fresh.entry_order_ids.push_back(order_id);
    refreshPnl(fresh);
    positions_.emplace(contract.symbol, std::move(fresh));
    return;
  }

  domain::AggregatePosition& pos = it->second;
  const double open = static_cast<double>(pos.open_quantity);
  const double qty = static_cast<double>(quantity);
  pos.average_entry_price =
      (open * pos.average_entry_price + qty * price) / (open + qty);
  pos.opened_quantity += quantity;
  pos.open_quantity = pos.opened_quantity - pos.closed_quantity;

  if (std::find(pos.entry_order_ids.begin(), pos.entry_order_ids.end(),
                order_id) == pos.entry_order_ids.end()) {
    pos.entry_order_ids.push_back(order_id);
  }
  refreshPnl(pos);
}

// -----------------------------------------------------------------------------
// applyExitFill: clamp, realize, close at zero
// -----------------------------------------------------------------------------
void PositionLedger::applyExitFill(const domain::Contract& contract,
                                   domain::OrderId exit_order_id,
                                   std::int64_t quantity, double price,
                                   domain::ExitReason reason) {
  if (quantity <= 0) {
    return;
  }

  std::unique_lock lock(mutex_);

  auto it = positions_.find(contract.symbol);
  if (it == positions_.end() ||
      it->second.status != domain::AggregateStatus::Open) {
    std::cerr << "[PositionLedger] WARNING: exit fill for " << contract.symbol
              << " (order " << exit_order_id
              << ") has no open position. Ignored.\n";
    return;
  }

  domain::AggregatePosition& pos = it->second;
  const std::int64_t closing = std::min(quantity, pos.open_quantity);
  if (closing < quantity) {
    std::cerr << "[PositionLedger] WARNING: exit of " << quantity << " on "
              << contract.symbol << " clamped to open quantity " << closing
              << ".\n";
  }
  if (closing <= 0) {
    return;
  }

  pos.realized_pnl +=
      (price - pos.average_entry_price) * static_cast<double>(closing);

  const double closed_before = static_cast<double>(pos.closed_quantity);
  pos.average_exit_price =
      (closed_before * pos.average_exit_price +
       static_cast<double>(closing) * price) /
      (closed_before + static_cast<double>(closing));
  pos.closed_quantity += closing;
  pos.open_quantity = pos.opened_quantity - pos.closed_quantity;
  pos.last_price = price;
  pos.last_exit_reason = reason;
  pos.exit_order_ids.push_back(exit_order_id);

  if (pos.open_quantity == 0) {
    pos.status = domain::AggregateStatus::Closed;
  }
  refreshPnl(pos);
}

// -----------------------------------------------------------------------------
// markToMarket
// -----------------------------------------------------------------------------
void PositionLedger::markToMarket(const domain::Contract& contract,
                                  double last_price) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(contract.symbol);
  if (it == positions_.end() ||
      it->second.status != domain::AggregateStatus::Open ||
      it->second.average_entry_price <= 0.0) {
    return;
  }
  it->second.last_price = last_price;
  refreshPnl(it->second);
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
std::optional<domain::AggregatePosition> PositionLedger::position(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::AggregatePosition> PositionLedger::getSnapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::AggregatePosition> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

std::vector<domain::AggregatePosition> PositionLedger::closedPositions()
    const {
  std::shared_lock lock(mutex_);
  std::vector<domain::AggregatePosition> result = closed_history_;
  for (const auto& [symbol, pos] : positions_) {
    if (pos.status == domain::AggregateStatus::Closed) {
      result.push_back(pos);
    }
  }
  return result;
}

double PositionLedger::realizedPnl() const {
  std::shared_lock lock(mutex_);
  double total = 0.0;
  for (const auto& pos : closed_history_) {
    total += pos.realized_pnl;
  }
  for (const auto& [symbol, pos] : positions_) {
    total += pos.realized_pnl;
  }
  return total;
}

// Open quantity is valued at the last price; a closed aggregate has none.
void PositionLedger::refreshPnl(domain::AggregatePosition& pos) {
  if (pos.open_quantity > 0 && pos.average_entry_price > 0.0) {
    pos.unrealized_pnl = (pos.last_price - pos.average_entry_price) *
                         static_cast<double>(pos.open_quantity);
  } else {
    pos.unrealized_pnl = 0.0;
  }
  pos.net_pnl = pos.realized_pnl + pos.unrealized_pnl;
}

}  // namespace store
}  // namespace optexec
