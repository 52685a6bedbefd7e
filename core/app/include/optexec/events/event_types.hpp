#pragma once

#include "optexec/domain/signal.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace optexec {

using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// MarketDataEvent
// -----------------------------------------------------------------------------
// One last-traded-price update for one instrument. token identifies the
// instrument (contracts are matched by token); symbol is informational.
// -----------------------------------------------------------------------------
struct MarketDataEvent {
  std::string symbol;
  std::string token;
  double price{0.0};          // Last traded price
  double volume{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// CandleEvent
// -----------------------------------------------------------------------------
// A closed OHLC bar of the underlying. bucket_start is the aligned start of
// the bar's interval (e.g. 09:15:00 for the 09:15 one-minute bar).
// -----------------------------------------------------------------------------
struct CandleEvent {
  std::string symbol;
  Timestamp bucket_start{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  std::uint64_t tick_count{0};
};

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Strategy output: open a long option position of the given type, sized at
// the option's LTP. spot_price is the underlying close that produced it.
// -----------------------------------------------------------------------------
struct SignalEvent {
  std::string strategy_id;
  domain::SignalType signal{domain::SignalType::BuyCall};
  double spot_price{0.0};
  Timestamp timestamp{};
};

}  // namespace optexec
