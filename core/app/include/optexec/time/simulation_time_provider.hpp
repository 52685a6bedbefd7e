#pragma once

#include "optexec/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace optexec {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time only moves when told to.
//
// @details
// In a replayed session the MarketDataGateway calls advance_time() with each
// tick's timestamp before the tick is dispatched, so candles, order timeouts
// and the square-off check all follow the data rather than the wall clock.
// Tests use advance_by() to step past a deadline.
//
// Monotonicity is the caller's responsibility; advance_time() stores the
// value it is given.
//
// Thread model: single writer (gateway thread or test), many readers.
// std::atomic provides the visibility guarantee without a lock.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace optexec
