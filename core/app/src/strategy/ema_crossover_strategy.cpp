#include "optexec/strategy/ema_crossover_strategy.hpp"
#include "optexec/errors.hpp"

#include <iostream>
#include <numeric>

namespace optexec {
namespace strategy {

EmaCrossoverStrategy::EmaCrossoverStrategy(EventBus& bus,
                                           const config::StrategyConfig& cfg)
    : bus_(bus), cfg_(cfg) {
  if (cfg_.fast_period < 1 || cfg_.fast_period >= cfg_.slow_period) {
    throw InvalidConfiguration("strategy: need 1 <= fast_period < slow_period");
  }
  subscription_id_ = bus_.subscribe<CandleEvent>(
      [this](const CandleEvent& c) { onCandle(c); });
}

EmaCrossoverStrategy::~EmaCrossoverStrategy() {
  bus_.unsubscribe(subscription_id_);
}

// -----------------------------------------------------------------------------
// onCandle: update EMAs and publish a crossover
// -----------------------------------------------------------------------------
void EmaCrossoverStrategy::onCandle(const CandleEvent& candle) {
  const std::optional<domain::SignalType> signal = onClose(candle.close);
  if (!signal) {
    return;
  }

  std::cout << "[EmaCrossoverStrategy] " << domain::signalToString(*signal)
            << " on " << candle.symbol << " close=" << candle.close
            << " fast=" << *fast_ema_ << " slow=" << *slow_ema_ << "\n";

  SignalEvent event;
  event.strategy_id = cfg_.id;
  event.signal = *signal;
  event.spot_price = candle.close;
  event.timestamp = candle.bucket_start;
  bus_.publish(event);
}

std::optional<domain::SignalType> EmaCrossoverStrategy::onClose(double close) {
  closes_.push_back(close);
  if (closes_.size() > static_cast<std::size_t>(cfg_.slow_period)) {
    closes_.pop_front();
  }
  ++closes_seen_;

  if (closes_seen_ < static_cast<std::size_t>(cfg_.slow_period)) {
    return std::nullopt;
  }

  const std::optional<double> prev_fast = fast_ema_;
  const std::optional<double> prev_slow = slow_ema_;

  if (!prev_fast || !prev_slow) {
    fast_ema_ = seed(cfg_.fast_period);
    slow_ema_ = seed(cfg_.slow_period);
    return std::nullopt;
  }

  const double fast_k = 2.0 / (cfg_.fast_period + 1);
  const double slow_k = 2.0 / (cfg_.slow_period + 1);
  fast_ema_ = (close - *prev_fast) * fast_k + *prev_fast;
  slow_ema_ = (close - *prev_slow) * slow_k + *prev_slow;

  if (*prev_fast <= *prev_slow && *fast_ema_ > *slow_ema_) {
    return domain::SignalType::BuyCall;
  }
  if (*prev_fast >= *prev_slow && *fast_ema_ < *slow_ema_) {
    return domain::SignalType::BuyPut;
  }
  return std::nullopt;
}

// Simple average of the last `period` closes.
double EmaCrossoverStrategy::seed(int period) const {
  const auto begin = closes_.end() - period;
  return std::accumulate(begin, closes_.end(), 0.0) / period;
}

}  // namespace strategy
}  // namespace optexec
