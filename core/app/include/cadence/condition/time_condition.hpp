#pragma once

#include "cadence/condition/condition.hpp"
#include "cadence/window/time_window.hpp"

#include <memory>

namespace cadence {

// -----------------------------------------------------------------------------
// TimeCondition: true while "now" lies inside a time window
// -----------------------------------------------------------------------------
//
// @brief  Binds exactly one TimeWindow; evaluate() is window.contains(now).
//
// @details
// The window is fixed at construction, either from window parameters
// (daily(), weekly(), between()) or from an existing window (fromWindow()).
//
// Next-change estimate:
//   rollForward(now).left - now
// i.e. the wait until the next occurrence starts. While now is inside the
// window the occurrence is already under way and the estimate is zero.
//
// Example:
//   auto office = TimeCondition::daily(std::chrono::hours(8),
//                                      std::chrono::hours(17));
//   SimulationTimeProvider clock{utc_ms(2024, 1, 1, 7, 0)};
//   office->evaluate(clock);                          // false
//   office->estimateTimeToNextPossibleChange(now);    // 1 h
// -----------------------------------------------------------------------------
class TimeCondition : public Condition, public IChangeEstimator {
 public:
  // @throws std::invalid_argument on a null window.
  explicit TimeCondition(WindowPtr window);

  static std::shared_ptr<const TimeCondition> fromWindow(WindowPtr window);

  // Offsets from midnight UTC; start > end wraps across midnight.
  static std::shared_ptr<const TimeCondition> daily(Duration start_of_day,
                                                    Duration end_of_day);

  // Offsets from Monday 00:00 UTC.
  static std::shared_ptr<const TimeCondition> weekly(Duration start_of_week,
                                                     Duration end_of_week);

  // One fixed span [start, end).
  static std::shared_ptr<const TimeCondition> between(Timestamp start,
                                                      Timestamp end);

  bool evaluate(const ITimeProvider& clock) const override;
  WindowPtr cycle() const override { return window_; }
  bool isTemporal() const override { return true; }
  std::string describe() const override;

  Duration estimateTimeToNextPossibleChange(Timestamp now) const override;

  const WindowPtr& window() const { return window_; }

 private:
  WindowPtr window_;
};

}  // namespace cadence
