#pragma once

#include <cstdint>

namespace tradegate {

// -----------------------------------------------------------------------------
// Calendar helpers on epoch milliseconds
// -----------------------------------------------------------------------------
//
// @brief  Minute-of-day arithmetic used by session-phase detection.
//
// @details
// The engine has no time-zone database. US equity sessions are evaluated in
// a fixed UTC-5 offset (Eastern Standard Time); during daylight saving the
// detected phase runs one hour late, which errs toward the thinner, more
// restrictive phases at the open and close.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMsPerMinute = 60 * 1000;
inline constexpr int kMinutesPerDay = 24 * 60;
inline constexpr int kEasternOffsetMinutes = -5 * 60;

// Minutes since 00:00 in a zone `offset_minutes` away from UTC, 0..1439.
inline int minute_of_day(std::int64_t epoch_ms, int offset_minutes = 0) {
  const std::int64_t minutes = epoch_ms / kMsPerMinute + offset_minutes;
  const std::int64_t m = minutes % kMinutesPerDay;
  return static_cast<int>(m < 0 ? m + kMinutesPerDay : m);
}

inline int utc_hour(std::int64_t epoch_ms) {
  return minute_of_day(epoch_ms) / 60;
}

inline int eastern_minute_of_day(std::int64_t epoch_ms) {
  return minute_of_day(epoch_ms, kEasternOffsetMinutes);
}

}  // namespace tradegate
