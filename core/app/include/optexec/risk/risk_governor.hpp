#pragma once

#include "optexec/broker/i_broker.hpp"
#include "optexec/config/engine_config.hpp"
#include "optexec/domain/position.hpp"
#include "optexec/events/risk_violation_event.hpp"
#include "optexec/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace optexec {
namespace risk {

// -----------------------------------------------------------------------------
// RiskGovernor — capital, position sizing and the daily-loss kill switch
// -----------------------------------------------------------------------------
//
// @brief  Answers "may we trade?" and "how much?", and accumulates realized
//         PnL across closed positions.
//
// @details
// State:
//   opening capital  captured lazily from IBroker::getAccountBalance() the
//                    first time capital is needed, then fixed for the
//                    session.
//   realized PnL     sum of (exit − entry) × qty over closed positions.
//   trading enabled  starts true; flips to false once and never back.
//
// Kill switch:
//   After every close, if |realized PnL| >= max_daily_loss trading is
//   disabled and a RiskViolationEvent is handed to the violation sink. The
//   check is on magnitude, so a large profit halts trading too. The
//   operator can also halt manually (haltTrading()).
//
// Sizing (sizeOrder):
//   fixed_lot  value × lot_size
//   percent    floor((capital × value / 100) / (entry × lot)) × lot,
//              0 when not even one lot is affordable
//   entry <= 0 always sizes to 0.
//
// Thread model:
//   canTakeNewTrade() is a lock-free atomic read. Everything else takes the
//   internal mutex. The broker is never called with the mutex held. The
//   violation sink is called after the mutex is released.
//
// Ownership: holds a reference to the broker (owned by TradingEngine).
// -----------------------------------------------------------------------------
class RiskGovernor {
 public:
  using ViolationSink = std::function<void(const RiskViolationEvent&)>;

  RiskGovernor(const broker::IBroker& broker, const config::RiskConfig& cfg,
               const ITimeProvider& time, ViolationSink on_violation = {});

  RiskGovernor(const RiskGovernor&) = delete;
  RiskGovernor& operator=(const RiskGovernor&) = delete;
  RiskGovernor(RiskGovernor&&) = delete;
  RiskGovernor& operator=(RiskGovernor&&) = delete;

  // opening capital + realized PnL, floored at 0.
  double availableCapital();

  bool canTakeNewTrade() const { return trading_enabled_.load(); }

  bool allowMultiplePositions() const { return cfg_.allow_multiple_positions; }

  // -------------------------------------------------------------------------
  // sizeOrder(entry_price, lot_size, mode, value)
  // -------------------------------------------------------------------------
  // @return quantity in contracts, always a multiple of lot_size (or 0).
  // @throws InvalidConfiguration for a mode outside SizingMode.
  // -------------------------------------------------------------------------
  std::int64_t sizeOrder(double entry_price, std::int64_t lot_size,
                         config::SizingMode mode, double value);

  // Sizes with the configured mode and value.
  std::int64_t sizeOrder(double entry_price, std::int64_t lot_size);

  // Registers a filled (or partially filled) entry. Re-registering the same
  // order id refreshes the stored snapshot.
  void onPositionOpened(domain::OrderId order_id,
                        const domain::OpenPosition& position);

  // -------------------------------------------------------------------------
  // onPositionClosed(order_id, exit_price, quantity, entry_price)
  // -------------------------------------------------------------------------
  // @brief  Realizes (exit − entry) × quantity and evaluates the kill switch.
  //
  // @param  entry_price  When absent, the registered position's average
  //                      entry is used; when that is unknown too the exit
  //                      price stands in and the close books zero PnL.
  //
  // @return the PnL booked for this close.
  //
  // @details
  // A close for an order that was never registered is still booked (with a
  // warning): losing PnL is worse than booking an unexpected close.
  // -------------------------------------------------------------------------
  double onPositionClosed(domain::OrderId order_id, double exit_price,
                          std::int64_t quantity,
                          std::optional<double> entry_price = std::nullopt);

  // Operator kill switch. Idempotent.
  void haltTrading(const std::string& reason);

  double realizedPnl() const;

  std::optional<double> openingCapital() const;

  std::size_t trackedPositions() const;

 private:
  double ensureOpeningCapital();

  const broker::IBroker& broker_;
  const config::RiskConfig cfg_;
  const ITimeProvider& time_;
  ViolationSink on_violation_;

  std::atomic<bool> trading_enabled_{true};

  mutable std::mutex mutex_;
  std::optional<double> opening_capital_;
  double realized_pnl_{0.0};
  std::unordered_map<domain::OrderId, domain::OpenPosition> positions_;
};

}  // namespace risk
}  // namespace optexec
