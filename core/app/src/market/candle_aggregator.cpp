#include "optexec/market/candle_aggregator.hpp"
#include "optexec/errors.hpp"
#include "optexec/time/time_utils.hpp"

#include <algorithm>
#include <utility>

namespace optexec {
namespace market {

CandleAggregator::CandleAggregator(EventBus& bus, std::string token,
                                   std::int64_t timeframe_sec)
    : bus_(bus), token_(std::move(token)), timeframe_sec_(timeframe_sec) {
  if (timeframe_sec_ <= 0) {
    throw InvalidConfiguration("candle timeframe must be > 0 seconds");
  }
  subscription_id_ = bus_.subscribe<MarketDataEvent>(
      [this](const MarketDataEvent& e) { onMarketData(e); });
}

CandleAggregator::~CandleAggregator() { bus_.unsubscribe(subscription_id_); }

// -----------------------------------------------------------------------------
// onMarketData: extend, or close and roll over
// -----------------------------------------------------------------------------
void CandleAggregator::onMarketData(const MarketDataEvent& tick) {
  if (tick.token != token_ || tick.price <= 0.0) {
    return;
  }

  const std::int64_t ts_sec = timestamp_to_ms(tick.timestamp) / 1000;
  const std::int64_t bucket = ts_sec - (ts_sec % timeframe_sec_);

  if (current_ && bucket <= current_bucket_) {
    CandleEvent& c = *current_;
    c.high = std::max(c.high, tick.price);
    c.low = std::min(c.low, tick.price);
    c.close = tick.price;
    ++c.tick_count;
    return;
  }

  std::optional<CandleEvent> closed = std::exchange(current_, CandleEvent{});
  current_bucket_ = bucket;

  CandleEvent& c = *current_;
  c.symbol = tick.symbol;
  c.bucket_start = ms_to_timestamp(bucket * 1000);
  c.open = c.high = c.low = c.close = tick.price;
  c.tick_count = 1;

  if (closed) {
    ++closed_count_;
    bus_.publish(*closed);
  }
}

}  // namespace market
}  // namespace optexec
