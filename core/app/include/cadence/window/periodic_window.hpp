#pragma once

#include "cadence/window/time_window.hpp"

#include <chrono>
#include <memory>

namespace cadence {

// -----------------------------------------------------------------------------
// PeriodicWindow: a span that recurs every fixed period
// -----------------------------------------------------------------------------
//
// @brief  Contains t when t's phase within the period lies in
//         [start_offset, end_offset).
//
// @details
// Phase is measured from an anchor instant: the epoch for daily windows and
// Monday 1970-01-05 00:00 UTC for weekly windows, so every calendar day (or
// week) starts a new period. All arithmetic is UTC at millisecond
// resolution.
//
// Offsets behave like clock-face positions:
//   - start < end   → ordinary span, e.g. daily 08:00-17:00.
//   - start > end   → span wraps across the period boundary, e.g. daily
//                     22:00-06:00 covers the night.
//   - start == end  → the whole period; the window is always true and
//                     rollForward never finds an end.
//
// Example:
//   auto office = PeriodicWindow::daily(std::chrono::hours(8),
//                                       std::chrono::hours(17));
//   office->rollForward(<Mon 07:00>)  → [Mon 08:00, Mon 17:00)
//   office->rollForward(<Mon 09:30>)  → [Mon 09:30, Mon 17:00)
//   office->rollForward(<Mon 18:00>)  → [Tue 08:00, Tue 17:00)
// -----------------------------------------------------------------------------
class PeriodicWindow final : public TimeWindow {
 public:
  enum class Kind { Daily, Weekly, Custom };

  static constexpr Duration kDay = std::chrono::hours(24);
  static constexpr Duration kWeek = std::chrono::hours(24 * 7);

  // @throws std::invalid_argument when period <= 0 or an offset lies outside
  //         [0, period).
  PeriodicWindow(Duration period, Duration start_offset, Duration end_offset,
                 Timestamp anchor = Timestamp{}, Kind kind = Kind::Custom);

  // Offsets from midnight UTC.
  static std::shared_ptr<const PeriodicWindow> daily(Duration start_of_day,
                                                     Duration end_of_day);

  // Offsets from Monday 00:00 UTC.
  static std::shared_ptr<const PeriodicWindow> weekly(Duration start_of_week,
                                                      Duration end_of_week);

  bool contains(Timestamp t) const override;
  Interval rollForward(Timestamp t) const override;
  bool isUnbounded() const override { return start_ == end_; }
  std::string describe() const override;

  Duration period() const { return period_; }
  Duration startOffset() const { return start_; }
  Duration endOffset() const { return end_; }
  Kind kind() const { return kind_; }

 private:
  // Position of t inside its period, in [0, period).
  Duration phaseOf(Timestamp t) const;

  // Length of one occurrence (the whole period when start == end).
  Duration span() const;

  Duration period_;
  Duration start_;
  Duration end_;
  Timestamp anchor_;
  Kind kind_;
};

}  // namespace cadence
