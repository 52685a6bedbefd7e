#pragma once

#include "optexec/broker/i_broker.hpp"
#include "optexec/concurrent/order_id_generator.hpp"
#include "optexec/config/engine_config.hpp"
#include "optexec/domain/exit_reason.hpp"
#include "optexec/domain/exit_state.hpp"
#include "optexec/domain/position.hpp"
#include "optexec/events/event.hpp"
#include "optexec/execution/execution_controller.hpp"
#include "optexec/market/market_clock.hpp"
#include "optexec/risk/risk_governor.hpp"
#include "optexec/store/i_position_store.hpp"
#include "optexec/store/i_trade_journal.hpp"
#include "optexec/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace optexec {
namespace execution {

// -----------------------------------------------------------------------------
// ExitController — stop-loss, target, trailing stop and square-off
// -----------------------------------------------------------------------------
//
// @brief  Tracks one ExitState per filled entry and turns price action into
//         exactly one exit per position.
//
// @details
// Lifecycle per position: REGISTERED -> tracking -> EXITED.
//
// Exit legs:
//   With use_broker_exit_orders, registration places a SELL STOP at the
//   stop price and (when targets are enabled) a SELL LIMIT at the target.
//   A leg the broker refuses, or that the broker later cancels on its own
//   (an expired target limit), is watched in software instead. Each leg
//   falls back independently and only for that position. A leg is
//   forgotten once it can no longer fill: cancelled, rejected, or fully
//   filled.
//
// Ticks (onTick):
//   Raise/lower the watermarks, mark the ledger, and check the software
//   legs: LTP <= stop -> SL, LTP >= target -> TP.
//
// Candle close (onCandleClose), in priority order:
//   a) breakeven: once (LTP − original entry) / original entry reaches
//      breakeven_trigger_percent, the stop moves up to the original entry
//      and the breakeven latch engages for good.
//   b) trailing: while the latch is off, stop = max(stop, LTP × (1 − sl%)).
//   A broker stop that moved by at least stop_update_threshold_percent is
//   cancelled and re-placed at the new trigger. A cancel the broker refuses
//   means the old stop is executing; it is not re-placed.
//
// Exits:
//   exitPosition() is idempotent: the first caller removes the ExitState
//   and marks the order exited under the lock; everyone after that is a
//   no-op, and a later registerPosition() for the order is ignored.
//   ExecutionController::onOrderExit() then supplies the quantity and
//   average entry as of the exit, which may include fills not yet
//   registered here. A software exit sells all of it with a MARKET SELL;
//   an exit driven by a broker leg fill sells only what the leg did not
//   cover. The entry price is resolved through ExitState, the original
//   entry, ExecutionController and the ledger, falling back to the exit
//   price itself (zero PnL, logged CRITICAL). Then: best-effort cancel of
//   the remaining legs, ledger exit fill, RiskGovernor::onPositionClosed,
//   journal, PositionClosedEvent.
//
// Late entry fills:
//   An entry fill that arrives after its position was exited is handed to
//   exitLateFill(), which sells it at LTP and books it under the reason of
//   the original exit.
//
// Thread model:
//   onTick/onCandleClose run on the market loop, registerPosition and
//   onExitOrderFilled on the execution loop, checkSquareoff on the engine
//   scheduler. One mutex guards the tables and is never held across a
//   broker, controller, governor, ledger or journal call.
//
// Ownership: collaborators are references owned by TradingEngine; journal
// and event sink are optional.
// -----------------------------------------------------------------------------
class ExitController {
 public:
  using EventSink = std::function<void(const Event&)>;

  ExitController(broker::IBroker& broker, ExecutionController& execution,
                 risk::RiskGovernor& risk, store::IPositionStore& store,
                 OrderIdGenerator& ids, const market::MarketClock& clock,
                 const ITimeProvider& time, const config::ExitConfig& cfg,
                 store::ITradeJournal* journal = nullptr,
                 EventSink sink = {});

  ExitController(const ExitController&) = delete;
  ExitController& operator=(const ExitController&) = delete;
  ExitController(ExitController&&) = delete;
  ExitController& operator=(ExitController&&) = delete;

  // -------------------------------------------------------------------------
  // registerPosition(position)
  // -------------------------------------------------------------------------
  // @throws InvalidState when the position has no positive entry price or
  //         filled quantity.
  //
  // @details
  // Registering an order id that is already tracked (a later partial fill)
  // refreshes quantity and entry, raises the stop if the new entry implies
  // a higher one, and re-places the broker legs for the new quantity.
  // An order that has already been exited is not registered again.
  // -------------------------------------------------------------------------
  void registerPosition(const domain::OpenPosition& position);

  void onTick(const MarketDataEvent& tick);

  void onCandleClose(const CandleEvent& candle);

  // Exits everything at LTP once the clock reports square-off time.
  void checkSquareoff();

  // Software exit: places a MARKET SELL, then books the close.
  // @return false when the position was not (or no longer) tracked.
  bool exitPosition(domain::OrderId order_id, double exit_price,
                    domain::ExitReason reason);

  // Fill report for an order this controller placed (see ownsOrder()).
  void onExitOrderFilled(const OrderFilledEvent& event);

  // Sells and books entry fills that arrived after their position was
  // exited (an ExecutionController snapshot with after_exit set).
  // @return false when there was nothing to sell.
  bool exitLateFill(const domain::OpenPosition& late);

  // Exits every tracked position at LTP, or at its entry price when no
  // quote is available. Used on shutdown and by the operator.
  std::size_t closeAllPositions(domain::ExitReason reason);

  // True for an exit order this controller placed that may still report
  // fills.
  bool ownsOrder(domain::OrderId order_id) const;

  // Exit orders that may still report fills.
  std::size_t exitOrderCount() const;

  bool isTracked(domain::OrderId order_id) const;

  std::optional<domain::ExitState> exitState(domain::OrderId order_id) const;

  std::vector<domain::ExitState> trackedPositions() const;

 private:
  enum class LegKind { Stop, Target, Market };

  struct ExitLeg {
    domain::OrderId entry_order_id{domain::kNoOrderId};
    LegKind kind{LegKind::Market};
    std::int64_t quantity{0};
  };

  struct Breach {
    domain::OrderId order_id{domain::kNoOrderId};
    double price{0.0};
    domain::ExitReason reason{domain::ExitReason::StopLoss};
  };

  // Places a SELL leg for state.quantity; returns kNoOrderId when the
  // broker refused it.
  domain::OrderId placeLeg(const domain::ExitState& state, LegKind kind);

  void placeBrokerLegs(domain::OrderId order_id);

  void replaceBrokerStop(domain::OrderId order_id);

  // Clears legs the broker has cancelled or rejected on its own.
  void refreshLegHealth(const std::vector<domain::ExitState>& states);

  // sold_by_leg is what the filled broker leg exit_order_id sells; 0 (and
  // kNoOrderId) for a software exit.
  bool exitPositionInternal(domain::OrderId order_id, double exit_price,
                            domain::ExitReason reason,
                            domain::OrderId exit_order_id,
                            std::int64_t sold_by_leg);

  // Ledger, governor, journal, log and PositionClosedEvent for one close.
  void bookClose(domain::OrderId order_id, const domain::Contract& contract,
                 std::int64_t quantity, double entry, double exit_price,
                 domain::ExitReason reason, domain::OrderId exit_order_id);

  double resolveEntryPrice(const domain::ExitState& state,
                           double exit_price) const;

  // Best effort. @return true when the broker cancelled the leg.
  bool cancelLeg(domain::OrderId leg_id, const char* what);

  void forgetLeg(domain::OrderId leg_id);

  broker::IBroker& broker_;
  ExecutionController& execution_;
  risk::RiskGovernor& risk_;
  store::IPositionStore& store_;
  OrderIdGenerator& ids_;
  const market::MarketClock& clock_;
  const ITimeProvider& time_;
  const config::ExitConfig cfg_;
  store::ITradeJournal* journal_;
  EventSink sink_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::OrderId, domain::ExitState> states_;
  std::unordered_map<domain::OrderId, ExitLeg> exit_orders_;
  // Exited entry orders and the reason they were closed.
  std::unordered_map<domain::OrderId, domain::ExitReason> exited_;
};

}  // namespace execution
}  // namespace optexec
