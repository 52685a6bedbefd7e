#pragma once

#include "optexec/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace optexec {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// Bridges ITimeProvider's epoch milliseconds and the Timestamp carried by
// events, and derives the local wall-clock fields the session clock needs.
// Stateless; safe from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

constexpr std::int64_t kMillisPerMinute = 60 * 1000;
constexpr std::int64_t kMillisPerDay = 24 * 60 * kMillisPerMinute;

// -------------------------------------------------------------------------
// local_minute_of_day
// -------------------------------------------------------------------------
// @brief  Minutes since local midnight for an epoch time and a fixed UTC
//         offset (e.g. +330 for IST). No DST handling; exchange sessions
//         this engine targets use a fixed offset.
// -------------------------------------------------------------------------
inline int local_minute_of_day(std::int64_t epoch_ms, int utc_offset_minutes) {
  std::int64_t local_ms = epoch_ms + utc_offset_minutes * kMillisPerMinute;
  std::int64_t in_day = local_ms % kMillisPerDay;
  if (in_day < 0) {
    in_day += kMillisPerDay;
  }
  return static_cast<int>(in_day / kMillisPerMinute);
}

// -------------------------------------------------------------------------
// local_weekday
// -------------------------------------------------------------------------
// @brief  0 = Monday ... 6 = Sunday. 1970-01-01 was a Thursday (3).
// -------------------------------------------------------------------------
inline int local_weekday(std::int64_t epoch_ms, int utc_offset_minutes) {
  std::int64_t local_ms = epoch_ms + utc_offset_minutes * kMillisPerMinute;
  std::int64_t days = local_ms / kMillisPerDay;
  if (local_ms < 0 && local_ms % kMillisPerDay != 0) {
    --days;
  }
  std::int64_t weekday = (days + 3) % 7;
  if (weekday < 0) {
    weekday += 7;
  }
  return static_cast<int>(weekday);
}

}  // namespace optexec
