#pragma once

#include "cadence/time/time_utils.hpp"

namespace cadence {

// -----------------------------------------------------------------------------
// Interval: one concrete occurrence of a time window
// -----------------------------------------------------------------------------
//
// @brief  Half-open span [left, right) of wall-clock time.
//
// @details
// TimeWindow::rollForward() answers with an Interval: the occurrence that is
// in progress at the query instant (left clamped to that instant) or the
// next one to start. Either edge may be infinite:
//   - left  == kNegativeInfinity  → started "forever ago"
//   - right == kPositiveInfinity  → never ends
//   - left  == kPositiveInfinity  → the window never occurs again
//
// Plain value type; copy freely.
// -----------------------------------------------------------------------------
struct Interval {
  Timestamp left{kNegativeInfinity};
  Timestamp right{kPositiveInfinity};

  bool contains(Timestamp t) const { return left <= t && t < right; }

  bool empty() const { return left >= right; }

  // True when the owning window has no occurrence left at all.
  bool isNever() const { return left == kPositiveInfinity; }

  static Interval never() { return {kPositiveInfinity, kPositiveInfinity}; }
};

inline bool operator==(const Interval& a, const Interval& b) {
  return a.left == b.left && a.right == b.right;
}

inline bool operator!=(const Interval& a, const Interval& b) {
  return !(a == b);
}

}  // namespace cadence
