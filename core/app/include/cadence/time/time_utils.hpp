#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cadence {

// -----------------------------------------------------------------------------
// Timestamp / Duration
// -----------------------------------------------------------------------------
// Timestamp is the wall-clock instant used by every time window. Duration is
// the unit of next-change estimates; the clock resolves milliseconds, so
// estimates never claim finer precision than the clock can deliver.
//
// Timestamp counts milliseconds like the clock does, which keeps
// Timestamp::min() and Timestamp::max() some 292 million years away from any
// real date. They stand for "unbounded" on the left and right respectively.
// A window that will never occur again rolls forward to an interval starting
// at Timestamp::max().
// -----------------------------------------------------------------------------
using Duration = std::chrono::milliseconds;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Duration>;

// Smallest positive estimate: one clock tick.
constexpr Duration kMinimumResolution{1};

inline constexpr Timestamp kNegativeInfinity = Timestamp::min();
inline constexpr Timestamp kPositiveInfinity = Timestamp::max();

// -------------------------------------------------------------------------
// ms_to_timestamp
// -------------------------------------------------------------------------
// @brief  Converts epoch milliseconds to a Timestamp (time_point).
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// -------------------------------------------------------------------------
// timestamp_to_ms
// -------------------------------------------------------------------------
// @brief  Converts a Timestamp (time_point) to epoch milliseconds.
// -------------------------------------------------------------------------
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return tp.time_since_epoch().count();
}

// -------------------------------------------------------------------------
// saturating_add
// -------------------------------------------------------------------------
// @brief  Returns t + d, or kPositiveInfinity when the sum is not
//         representable.
//
// @details
// Window edges are computed by adding offsets and periods to instants that
// may already be far in the future after a long roll-forward. Saturating
// keeps those edges ordered instead of wrapping around. `d` must not be
// negative.
// -------------------------------------------------------------------------
inline Timestamp saturating_add(Timestamp t, Duration d) {
  if (t >= Timestamp{} && d > kPositiveInfinity - t) {
    return kPositiveInfinity;
  }
  return t + d;
}

// -------------------------------------------------------------------------
// distance
// -------------------------------------------------------------------------
// @brief  Returns (to - from) as a Duration, or zero when `to` is not after
//         `from`.
//
// @details
// Estimates are lower bounds on how long a scheduler may sleep, so a
// negative distance is meaningless and is clamped. `to` may be
// kPositiveInfinity, which yields a very large but finite Duration.
// -------------------------------------------------------------------------
inline Duration distance(Timestamp from, Timestamp to) {
  if (to <= from) {
    return Duration::zero();
  }
  if (from < Timestamp{} && to > kPositiveInfinity + from.time_since_epoch()) {
    return Duration::max();
  }
  return to - from;
}

// -------------------------------------------------------------------------
// utc_ms
// -------------------------------------------------------------------------
// @brief  Epoch milliseconds of a proleptic Gregorian UTC date and time.
//
// @param  year, month (1-12), day (1-31), hour, minute, second
//
// @details
// Uses the days-from-civil algorithm so no locale or TZ environment is
// consulted. Intended for tests and configuration, where calendar instants
// must be exact and reproducible on every host.
// -------------------------------------------------------------------------
std::int64_t utc_ms(int year, unsigned month, unsigned day, unsigned hour = 0,
                    unsigned minute = 0, unsigned second = 0);

// -------------------------------------------------------------------------
// format_timestamp
// -------------------------------------------------------------------------
// @brief  Renders a Timestamp as "YYYY-MM-DD HH:MM:SS" in UTC.
//
// @details
// kNegativeInfinity and kPositiveInfinity render as "-inf" and "+inf".
// -------------------------------------------------------------------------
std::string format_timestamp(Timestamp tp);

// -------------------------------------------------------------------------
// format_duration
// -------------------------------------------------------------------------
// @brief  Renders a Duration as "[Nd ]HH:MM:SS[.mmm]".
// -------------------------------------------------------------------------
std::string format_duration(Duration d);

}  // namespace cadence
