#pragma once

#include "optexec/eventbus/event_bus.hpp"
#include "optexec/events/event_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace optexec {
namespace market {

// -----------------------------------------------------------------------------
// CandleAggregator
// -----------------------------------------------------------------------------
// Responsibility: Buckets ticks of one instrument (the underlying) into
// fixed-timeframe OHLC candles and publishes each candle once it is closed.
//
// @details
// bucket = ts_sec − (ts_sec mod timeframe_sec). A candle closes when the
// first tick of a later bucket arrives; that tick opens the next candle.
// Ticks for other tokens and ticks with price <= 0 are ignored. A tick
// older than the current bucket is folded into the current candle rather
// than reopening a closed one.
//
// Thread model: subscribes to MarketDataEvent on the market loop's bus and
// publishes CandleEvent on the same bus, so it runs on that loop's thread
// only. The accessor currentCandle() is for tests on the same thread.
// -----------------------------------------------------------------------------
class CandleAggregator {
 public:
  CandleAggregator(EventBus& bus, std::string token,
                   std::int64_t timeframe_sec);

  // Unsubscribes from the bus.
  ~CandleAggregator();

  CandleAggregator(const CandleAggregator&) = delete;
  CandleAggregator& operator=(const CandleAggregator&) = delete;
  CandleAggregator(CandleAggregator&&) = delete;
  CandleAggregator& operator=(CandleAggregator&&) = delete;

  // The candle being built, if any tick has arrived yet.
  std::optional<CandleEvent> currentCandle() const { return current_; }

  std::uint64_t closedCount() const { return closed_count_; }

 private:
  void onMarketData(const MarketDataEvent& tick);

  EventBus& bus_;
  EventBus::SubscriptionId subscription_id_{0};
  const std::string token_;
  const std::int64_t timeframe_sec_;

  std::optional<CandleEvent> current_;
  std::int64_t current_bucket_{0};
  std::uint64_t closed_count_{0};
};

}  // namespace market
}  // namespace optexec
