#include "optexec/time/live_time_provider.hpp"

#include <chrono>

namespace optexec {

// -----------------------------------------------------------------------------
// now_ms: system_clock truncated to milliseconds since epoch
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace optexec
