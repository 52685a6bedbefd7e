#include "optexec/risk/risk_governor.hpp"
#include "optexec/errors.hpp"
#include "optexec/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace optexec {
namespace risk {

RiskGovernor::RiskGovernor(const broker::IBroker& broker,
                           const config::RiskConfig& cfg,
                           const ITimeProvider& time,
                           ViolationSink on_violation)
    : broker_(broker),
      cfg_(cfg),
      time_(time),
      on_violation_(std::move(on_violation)) {}

// -----------------------------------------------------------------------------
// ensureOpeningCapital: first caller reads the broker balance
// -----------------------------------------------------------------------------
double RiskGovernor::ensureOpeningCapital() {
  {
    std::lock_guard lock(mutex_);
    if (opening_capital_) {
      return *opening_capital_;
    }
  }

  // Broker read outside the lock; if two threads race, the first store wins.
  const double balance = broker_.getAccountBalance();

  std::lock_guard lock(mutex_);
  if (!opening_capital_) {
    opening_capital_ = balance;
    std::cout << "[RiskGovernor] Opening capital captured: " << balance
              << "\n";
  }
  return *opening_capital_;
}

double RiskGovernor::availableCapital() {
  const double opening = ensureOpeningCapital();
  std::lock_guard lock(mutex_);
  return std::max(0.0, opening + realized_pnl_);
}

// -----------------------------------------------------------------------------
// sizeOrder
// -----------------------------------------------------------------------------
std::int64_t RiskGovernor::sizeOrder(double entry_price,
                                     std::int64_t lot_size,
                                     config::SizingMode mode, double value) {
  if (entry_price <= 0.0 || lot_size <= 0) {
    return 0;
  }

  switch (mode) {
    case config::SizingMode::FixedLot: {
      const auto lots = static_cast<std::int64_t>(std::floor(value));
      return std::max<std::int64_t>(0, lots) * lot_size;
    }
    case config::SizingMode::Percent: {
      const double capital = availableCapital();
      const double budget = capital * value / 100.0;
      const double lot_cost = entry_price * static_cast<double>(lot_size);
      const auto lots = static_cast<std::int64_t>(std::floor(budget / lot_cost));
      if (lots <= 0) {
        return 0;
      }
      return lots * lot_size;
    }
  }

  throw InvalidConfiguration("unknown position sizing mode " +
                             std::to_string(static_cast<int>(mode)));
}

std::int64_t RiskGovernor::sizeOrder(double entry_price,
                                     std::int64_t lot_size) {
  return sizeOrder(entry_price, lot_size, cfg_.sizing_mode, cfg_.sizing_value);
}

// -----------------------------------------------------------------------------
// onPositionOpened
// -----------------------------------------------------------------------------
void RiskGovernor::onPositionOpened(domain::OrderId order_id,
                                    const domain::OpenPosition& position) {
  std::lock_guard lock(mutex_);
  positions_[order_id] = position;
}

// -----------------------------------------------------------------------------
// onPositionClosed: book PnL, drop registration, evaluate kill switch
// -----------------------------------------------------------------------------
double RiskGovernor::onPositionClosed(domain::OrderId order_id,
                                      double exit_price,
                                      std::int64_t quantity,
                                      std::optional<double> entry_price) {
  double pnl = 0.0;
  double realized = 0.0;
  bool tripped = false;

  {
    std::lock_guard lock(mutex_);

    auto it = positions_.find(order_id);
    if (it == positions_.end()) {
      std::cerr << "[RiskGovernor] WARNING: close for unregistered order "
                << order_id << "; booking PnL anyway.\n";
    }

    double entry = exit_price;
    if (entry_price && *entry_price > 0.0) {
      entry = *entry_price;
    } else if (it != positions_.end() &&
               it->second.average_entry_price > 0.0) {
      entry = it->second.average_entry_price;
    } else {
      std::cerr << "[RiskGovernor] CRITICAL: no entry price for order "
                << order_id << "; booking zero PnL at exit price "
                << exit_price << ".\n";
    }

    pnl = (exit_price - entry) * static_cast<double>(quantity);
    realized_pnl_ += pnl;
    realized = realized_pnl_;

    if (it != positions_.end()) {
      positions_.erase(it);
    }

    if (std::abs(realized_pnl_) >= cfg_.max_daily_loss &&
        trading_enabled_.exchange(false)) {
      tripped = true;
    }
  }

  std::cout << "[RiskGovernor] Closed order " << order_id << " pnl=" << pnl
            << " realized=" << realized << "\n";

  if (tripped) {
    std::cerr << "[RiskGovernor] CRITICAL: daily PnL limit reached (realized="
              << realized << ", limit=" << cfg_.max_daily_loss
              << "). ALL TRADING HALTED.\n";
    if (on_violation_) {
      RiskViolationEvent violation;
      violation.reason = "Max Daily Loss Reached";
      violation.current_value = realized;
      violation.limit_value = cfg_.max_daily_loss;
      violation.timestamp = ms_to_timestamp(time_.now_ms());
      on_violation_(violation);
    }
  }

  return pnl;
}

// -----------------------------------------------------------------------------
// haltTrading: manual kill switch
// -----------------------------------------------------------------------------
void RiskGovernor::haltTrading(const std::string& reason) {
  if (!trading_enabled_.exchange(false)) {
    return;
  }
  const double realized = realizedPnl();
  std::cerr << "[RiskGovernor] CRITICAL: " << reason
            << ". ALL TRADING HALTED.\n";
  if (on_violation_) {
    RiskViolationEvent violation;
    violation.reason = reason;
    violation.current_value = realized;
    violation.limit_value = cfg_.max_daily_loss;
    violation.timestamp = ms_to_timestamp(time_.now_ms());
    on_violation_(violation);
  }
}

double RiskGovernor::realizedPnl() const {
  std::lock_guard lock(mutex_);
  return realized_pnl_;
}

std::optional<double> RiskGovernor::openingCapital() const {
  std::lock_guard lock(mutex_);
  return opening_capital_;
}

std::size_t RiskGovernor::trackedPositions() const {
  std::lock_guard lock(mutex_);
  return positions_.size();
}

}  // namespace risk
}  // namespace optexec
