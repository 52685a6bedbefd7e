#pragma once

#include "optexec/config/engine_config.hpp"
#include "optexec/domain/signal.hpp"
#include "optexec/eventbus/event_bus.hpp"
#include "optexec/events/event_types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace optexec {
namespace strategy {

// -----------------------------------------------------------------------------
// EmaCrossoverStrategy
// -----------------------------------------------------------------------------
// Responsibility: Turns closed candles of the underlying into BUY_CE/BUY_PE
// signals on fast/slow EMA crossovers.
//
// @details
// Nothing is computed until slow_period closes have been seen. At that
// point each EMA is seeded with the simple average of its last N closes;
// afterwards ema = (close − prev) × 2/(N+1) + prev. A signal needs the
// previous pair of EMAs:
//   prev_fast <= prev_slow && fast > slow   -> BUY_CE (bullish)
//   prev_fast >= prev_slow && fast < slow   -> BUY_PE (bearish)
//
// The strategy never calls execution: it publishes SignalEvent on its bus
// and the engine forwards it to the execution loop while the session is
// open.
//
// Thread model: subscribes to CandleEvent on the market loop's bus; all
// state is touched on that thread only.
// -----------------------------------------------------------------------------
class EmaCrossoverStrategy {
 public:
  // @throws InvalidConfiguration unless 1 <= fast_period < slow_period.
  EmaCrossoverStrategy(EventBus& bus, const config::StrategyConfig& cfg);

  ~EmaCrossoverStrategy();

  EmaCrossoverStrategy(const EmaCrossoverStrategy&) = delete;
  EmaCrossoverStrategy& operator=(const EmaCrossoverStrategy&) = delete;
  EmaCrossoverStrategy(EmaCrossoverStrategy&&) = delete;
  EmaCrossoverStrategy& operator=(EmaCrossoverStrategy&&) = delete;

  // -------------------------------------------------------------------------
  // onClose(close)
  // -------------------------------------------------------------------------
  // @brief  Feeds one candle close and returns the crossover it produced,
  //         if any. The bus subscription calls this and publishes the result.
  // -------------------------------------------------------------------------
  std::optional<domain::SignalType> onClose(double close);

  std::optional<double> fastEma() const { return fast_ema_; }
  std::optional<double> slowEma() const { return slow_ema_; }

 private:
  void onCandle(const CandleEvent& candle);

  double seed(int period) const;

  EventBus& bus_;
  EventBus::SubscriptionId subscription_id_{0};
  const config::StrategyConfig cfg_;

  std::deque<double> closes_;
  std::size_t closes_seen_{0};
  std::optional<double> fast_ema_;
  std::optional<double> slow_ema_;
};

}  // namespace strategy
}  // namespace optexec
