// =============================================================================
// market_test.cpp
// =============================================================================
// Unit tests for the market-side helpers: optexec::market::CandleAggregator
// and optexec::market::MarketClock.
//
// Validates:
//   - Ticks fold into OHLC buckets aligned to the timeframe
//   - A candle is published only when the next bucket starts
//   - Other tokens and non-positive prices are ignored
//   - Session hours, weekends and the square-off minute in exchange time
// =============================================================================

#include "optexec/errors.hpp"
#include "optexec/eventbus/event_bus.hpp"
#include "optexec/market/candle_aggregator.hpp"
#include "optexec/market/market_clock.hpp"
#include "optexec/time/simulation_time_provider.hpp"
#include "optexec/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

// Monday 2024-01-01 10:00 IST (04:30 UTC), on a minute boundary.
constexpr std::int64_t kMondayTenAm = 1'704'083'400'000;
constexpr std::int64_t kMinute = 60'000;
constexpr std::int64_t kDay = 24 * 60 * kMinute;

optexec::MarketDataEvent tickAt(const std::string& token, double price,
                                std::int64_t ms) {
  optexec::MarketDataEvent e;
  e.symbol = "NIFTY";
  e.token = token;
  e.price = price;
  e.timestamp = optexec::ms_to_timestamp(ms);
  return e;
}

}  // namespace

class CandleAggregatorTest : public ::testing::Test {
 protected:
  CandleAggregatorTest() {
    bus.subscribe<optexec::CandleEvent>(
        [this](const optexec::CandleEvent& c) { candles.push_back(c); });
  }

  optexec::EventBus bus;
  std::vector<optexec::CandleEvent> candles;
};

// -----------------------------------------------------------------------------
// 1. Four ticks in one minute, then one in the next: one closed candle.
// -----------------------------------------------------------------------------
TEST_F(CandleAggregatorTest, ClosesCandleOnNextBucket) {
  optexec::market::CandleAggregator agg(bus, "26000", 60);

  bus.publish(tickAt("26000", 100.0, kMondayTenAm));
  bus.publish(tickAt("26000", 105.0, kMondayTenAm + 10'000));
  bus.publish(tickAt("26000", 98.0, kMondayTenAm + 20'000));
  bus.publish(tickAt("26000", 102.0, kMondayTenAm + 50'000));
  EXPECT_TRUE(candles.empty());

  bus.publish(tickAt("26000", 103.0, kMondayTenAm + kMinute));

  ASSERT_EQ(candles.size(), 1u);
  const optexec::CandleEvent& c = candles[0];
  EXPECT_DOUBLE_EQ(c.open, 100.0);
  EXPECT_DOUBLE_EQ(c.high, 105.0);
  EXPECT_DOUBLE_EQ(c.low, 98.0);
  EXPECT_DOUBLE_EQ(c.close, 102.0);
  EXPECT_EQ(c.tick_count, 4u);
  EXPECT_EQ(optexec::timestamp_to_ms(c.bucket_start), kMondayTenAm);
  EXPECT_EQ(agg.closedCount(), 1u);

  ASSERT_TRUE(agg.currentCandle().has_value());
  EXPECT_DOUBLE_EQ(agg.currentCandle()->open, 103.0);
}

// -----------------------------------------------------------------------------
// 2. Buckets align to the timeframe, not to the first tick.
// -----------------------------------------------------------------------------
TEST_F(CandleAggregatorTest, BucketsAlignToTimeframe) {
  optexec::market::CandleAggregator agg(bus, "26000", 300);

  bus.publish(tickAt("26000", 100.0, kMondayTenAm + 2 * kMinute));
  bus.publish(tickAt("26000", 101.0, kMondayTenAm + 4 * kMinute));
  EXPECT_TRUE(candles.empty());

  bus.publish(tickAt("26000", 102.0, kMondayTenAm + 5 * kMinute));
  ASSERT_EQ(candles.size(), 1u);
  EXPECT_EQ(optexec::timestamp_to_ms(candles[0].bucket_start), kMondayTenAm);
  EXPECT_EQ(candles[0].tick_count, 2u);
}

// -----------------------------------------------------------------------------
// 3. A late tick from an earlier bucket folds into the current candle.
// -----------------------------------------------------------------------------
TEST_F(CandleAggregatorTest, LateTickFoldsIntoCurrentCandle) {
  optexec::market::CandleAggregator agg(bus, "26000", 60);

  bus.publish(tickAt("26000", 100.0, kMondayTenAm));
  bus.publish(tickAt("26000", 110.0, kMondayTenAm + kMinute));
  bus.publish(tickAt("26000", 90.0, kMondayTenAm + 30'000));

  ASSERT_EQ(candles.size(), 1u);
  auto current = agg.currentCandle();
  ASSERT_TRUE(current.has_value());
  EXPECT_DOUBLE_EQ(current->low, 90.0);
  EXPECT_EQ(current->tick_count, 2u);
}

TEST_F(CandleAggregatorTest, IgnoresOtherTokensAndBadPrices) {
  optexec::market::CandleAggregator agg(bus, "26000", 60);

  bus.publish(tickAt("40001", 100.0, kMondayTenAm));
  bus.publish(tickAt("26000", 0.0, kMondayTenAm));
  bus.publish(tickAt("26000", -1.0, kMondayTenAm));
  EXPECT_FALSE(agg.currentCandle().has_value());
}

TEST_F(CandleAggregatorTest, RejectsNonPositiveTimeframe) {
  EXPECT_THROW(optexec::market::CandleAggregator(bus, "26000", 0),
               optexec::InvalidConfiguration);
}

// -----------------------------------------------------------------------------
// 4. Destroying the aggregator unsubscribes it.
// -----------------------------------------------------------------------------
TEST_F(CandleAggregatorTest, DestructorUnsubscribes) {
  const std::size_t before = bus.subscriberCount();
  {
    optexec::market::CandleAggregator agg(bus, "26000", 60);
    EXPECT_EQ(bus.subscriberCount(), before + 1);
  }
  EXPECT_EQ(bus.subscriberCount(), before);
}

// =============================================================================
// MarketClock
// =============================================================================
class MarketClockTest : public ::testing::Test {
 protected:
  optexec::SimulationTimeProvider time{kMondayTenAm};
  optexec::config::MarketConfig market;  // 09:15-15:15, UTC+05:30
  optexec::market::MarketClock clock{time, market, 15 * 60 + 10};
};

TEST_F(MarketClockTest, OpenDuringSession) {
  EXPECT_TRUE(clock.isMarketOpen());
  EXPECT_EQ(clock.minuteOfDay(), 10 * 60);
}

TEST_F(MarketClockTest, ClosedOutsideSession) {
  time.advance_time(kMondayTenAm - 61 * kMinute);  // 08:59
  EXPECT_FALSE(clock.isMarketOpen());

  time.advance_time(kMondayTenAm - 45 * kMinute);  // 09:15
  EXPECT_TRUE(clock.isMarketOpen());

  time.advance_time(kMondayTenAm + 315 * kMinute);  // 15:15, close is exclusive
  EXPECT_FALSE(clock.isMarketOpen());
}

TEST_F(MarketClockTest, WeekendsClosedUnlessEnabled) {
  time.advance_time(kMondayTenAm + 5 * kDay);  // Saturday 10:00
  EXPECT_FALSE(clock.isMarketOpen());

  optexec::config::MarketConfig weekend = market;
  weekend.trade_weekends = true;
  optexec::market::MarketClock weekend_clock(time, weekend, 15 * 60 + 10);
  EXPECT_TRUE(weekend_clock.isMarketOpen());
}

TEST_F(MarketClockTest, SquareoffFromConfiguredMinute) {
  EXPECT_FALSE(clock.isSquareoffTime());

  time.advance_time(kMondayTenAm + 309 * kMinute);  // 15:09
  EXPECT_FALSE(clock.isSquareoffTime());

  time.advance_time(kMondayTenAm + 310 * kMinute);  // 15:10
  EXPECT_TRUE(clock.isSquareoffTime());
  EXPECT_EQ(clock.squareoffMinute(), 15 * 60 + 10);
}
