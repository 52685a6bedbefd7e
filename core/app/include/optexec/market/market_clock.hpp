#pragma once

#include "optexec/config/engine_config.hpp"
#include "optexec/time/i_time_provider.hpp"

namespace optexec {
namespace market {

// -----------------------------------------------------------------------------
// MarketClock — session hours and square-off time
// -----------------------------------------------------------------------------
//
// @brief  Answers session questions in exchange-local time derived from an
//         ITimeProvider and a fixed UTC offset.
//
// @details
// Using the injected provider (not the wall clock) keeps the answers
// consistent with replayed market data: under SimulationTimeProvider the
// session opens and square-off fires at the tick timestamps.
//
//   isMarketOpen()     weekday (unless trade_weekends) and
//                      open_minute <= local minute < close_minute
//   isSquareoffTime()  local minute >= squareoff_minute
//
// Thread model: stateless apart from const references; safe from any thread.
// -----------------------------------------------------------------------------
class MarketClock {
 public:
  MarketClock(const ITimeProvider& time, const config::MarketConfig& market,
              int squareoff_minute);

  bool isMarketOpen() const;

  bool isSquareoffTime() const;

  // Exchange-local minute of day, 0..1439.
  int minuteOfDay() const;

  int squareoffMinute() const { return squareoff_minute_; }

 private:
  const ITimeProvider& time_;
  const config::MarketConfig market_;
  const int squareoff_minute_;
};

}  // namespace market
}  // namespace optexec
