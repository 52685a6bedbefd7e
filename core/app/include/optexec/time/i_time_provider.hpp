#pragma once

#include <cstdint>

namespace optexec {

// -----------------------------------------------------------------------------
// ITimeProvider — injectable source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the current time as epoch milliseconds.
//
// @details
// Every time-dependent decision in the engine reads this interface instead
// of the system clock: order placement timestamps, the LIMIT entry timeout,
// the market session window and the square-off check. Live runs inject
// LiveTimeProvider; replayed sessions and unit tests inject
// SimulationTimeProvider and move time explicitly, which is how a 30 second
// order timeout or a 15:15 square-off is tested without waiting.
//
// Thread-safety contract: implementations must support concurrent now_ms()
// calls from any thread.
//
// Ownership: components hold a const reference; the provider outlives them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace optexec
