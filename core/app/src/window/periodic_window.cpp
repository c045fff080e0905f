#include "cadence/window/periodic_window.hpp"

#include <cstdio>
#include <stdexcept>

namespace cadence {

namespace {

// Monday 1970-01-05 00:00 UTC; the epoch itself was a Thursday.
const Timestamp kFirstMonday = Timestamp{} + std::chrono::hours(24 * 4);

const char* const kWeekdayNames[] = {"Mon", "Tue", "Wed", "Thu",
                                     "Fri", "Sat", "Sun"};

std::string hhmm(Duration offset_in_day) {
  const auto minutes =
      std::chrono::duration_cast<std::chrono::minutes>(offset_in_day).count();
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d",
                static_cast<int>(minutes / 60), static_cast<int>(minutes % 60));
  return buf;
}

std::string weekday_hhmm(Duration offset_in_week) {
  const auto day = offset_in_week / PeriodicWindow::kDay;
  return std::string(kWeekdayNames[day]) + " " +
         hhmm(offset_in_week - day * PeriodicWindow::kDay);
}

}  // namespace

PeriodicWindow::PeriodicWindow(Duration period, Duration start_offset,
                               Duration end_offset, Timestamp anchor,
                               Kind kind)
    : period_(period),
      start_(start_offset),
      end_(end_offset),
      anchor_(anchor),
      kind_(kind) {
  if (period_ <= Duration::zero()) {
    throw std::invalid_argument("PeriodicWindow: period must be positive");
  }
  if (start_ < Duration::zero() || start_ >= period_ ||
      end_ < Duration::zero() || end_ >= period_) {
    throw std::invalid_argument(
        "PeriodicWindow: offsets must lie within [0, period)");
  }
}

std::shared_ptr<const PeriodicWindow> PeriodicWindow::daily(
    Duration start_of_day, Duration end_of_day) {
  return std::make_shared<const PeriodicWindow>(kDay, start_of_day, end_of_day,
                                                Timestamp{}, Kind::Daily);
}

std::shared_ptr<const PeriodicWindow> PeriodicWindow::weekly(
    Duration start_of_week, Duration end_of_week) {
  return std::make_shared<const PeriodicWindow>(
      kWeek, start_of_week, end_of_week, kFirstMonday, Kind::Weekly);
}

Duration PeriodicWindow::phaseOf(Timestamp t) const {
  const auto since_anchor =
      std::chrono::floor<Duration>(t - anchor_) % period_;
  return since_anchor < Duration::zero() ? since_anchor + period_
                                         : since_anchor;
}

Duration PeriodicWindow::span() const {
  if (start_ == end_) {
    return period_;
  }
  return start_ < end_ ? end_ - start_ : period_ - start_ + end_;
}

bool PeriodicWindow::contains(Timestamp t) const {
  if (start_ == end_) {
    return true;
  }
  const Duration phase = phaseOf(t);
  if (start_ < end_) {
    return start_ <= phase && phase < end_;
  }
  return phase >= start_ || phase < end_;
}

// -----------------------------------------------------------------------------
// rollForward(): locate the period containing t, then pick the occurrence
// -----------------------------------------------------------------------------
Interval PeriodicWindow::rollForward(Timestamp t) const {
  if (t == kPositiveInfinity) {
    return Interval::never();
  }
  if (start_ == end_) {
    return {t, kPositiveInfinity};
  }

  const Duration phase = phaseOf(t);
  const Timestamp period_start =
      anchor_ + (std::chrono::floor<Duration>(t - anchor_) - phase);

  if (contains(t)) {
    // For a wrapping span entered before midnight, the occurrence ends in
    // the following period.
    const bool ends_next_period = start_ > end_ && phase >= start_;
    const Timestamp right = saturating_add(
        period_start, end_ + (ends_next_period ? period_ : Duration::zero()));
    return {t, right};
  }

  const Timestamp left = saturating_add(
      period_start, start_ + (phase < start_ ? Duration::zero() : period_));
  if (left == kPositiveInfinity) {
    return Interval::never();
  }
  return {left, saturating_add(left, span())};
}

std::string PeriodicWindow::describe() const {
  switch (kind_) {
    case Kind::Daily:
      return "daily " + hhmm(start_) + "-" + hhmm(end_);
    case Kind::Weekly:
      return "weekly " + weekday_hhmm(start_) + "-" + weekday_hhmm(end_);
    case Kind::Custom:
      break;
  }
  return "every " + format_duration(period_) + " from +" +
         format_duration(start_) + " to +" + format_duration(end_);
}

}  // namespace cadence
