#pragma once

#include "optexec/time/i_time_provider.hpp"

namespace optexec {

// -----------------------------------------------------------------------------
// LiveTimeProvider
// -----------------------------------------------------------------------------
// Wall-clock time from std::chrono::system_clock. Used when the engine is
// fed by a live market data stream. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace optexec
