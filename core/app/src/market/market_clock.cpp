#include "optexec/market/market_clock.hpp"
#include "optexec/time/time_utils.hpp"

namespace optexec {
namespace market {

namespace {

constexpr int kSaturday = 5;

}  // namespace

MarketClock::MarketClock(const ITimeProvider& time,
                         const config::MarketConfig& market,
                         int squareoff_minute)
    : time_(time), market_(market), squareoff_minute_(squareoff_minute) {}

bool MarketClock::isMarketOpen() const {
  const std::int64_t now = time_.now_ms();
  if (!market_.trade_weekends &&
      local_weekday(now, market_.utc_offset_minutes) >= kSaturday) {
    return false;
  }
  const int minute = local_minute_of_day(now, market_.utc_offset_minutes);
  return minute >= market_.open_minute && minute < market_.close_minute;
}

bool MarketClock::isSquareoffTime() const {
  return minuteOfDay() >= squareoff_minute_;
}

int MarketClock::minuteOfDay() const {
  return local_minute_of_day(time_.now_ms(), market_.utc_offset_minutes);
}

}  // namespace market
}  // namespace optexec
