#pragma once

#include "cadence/time/time_utils.hpp"
#include "cadence/window/interval.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cadence {

class TimeWindow;

// Windows are immutable and shared between the conditions built on them.
using WindowPtr = std::shared_ptr<const TimeWindow>;

// -----------------------------------------------------------------------------
// TimeWindow: a set of instants, possibly unbounded, possibly recurring
// -----------------------------------------------------------------------------
//
// @brief  Abstract base for every time window the engine understands.
//
// @details
// A window is closed under:
//   - membership        contains(t)
//   - complement        complement()
//   - union             union_of({a, b, ...})        → AnyWindow
//   - intersection      intersection_of({a, b, ...}) → AllWindow
//
// and can roll itself forward: rollForward(t) returns the occurrence that
// contains t (with left clamped to t) or, when t is outside the window, the
// next occurrence to start after t. The distance from t to that left edge is
// what TimeCondition reports as its next-change estimate.
//
// The unbounded window (StaticInterval with both edges infinite) is the
// answer for "cannot be determined": it contains every instant, it is the
// identity for intersection and it absorbs every union.
//
// Ownership:
//   Always create windows through std::make_shared (the factories below and
//   the static create() helpers do so). complement() relies on
//   shared_from_this() to reference the window it negates.
//
// Thread model:
//   Immutable after construction; every member function is const and safe to
//   call concurrently.
// -----------------------------------------------------------------------------
class TimeWindow : public std::enable_shared_from_this<TimeWindow> {
 public:
  virtual ~TimeWindow() = default;

  virtual bool contains(Timestamp t) const = 0;

  // -------------------------------------------------------------------------
  // rollForward(t)
  // -------------------------------------------------------------------------
  // @brief  Returns the occurrence of this window at or after t.
  //
  // @return Interval with left >= t. left == t exactly when contains(t).
  //         Interval::never() when no occurrence remains.
  // -------------------------------------------------------------------------
  virtual Interval rollForward(Timestamp t) const = 0;

  // -------------------------------------------------------------------------
  // complement()
  // -------------------------------------------------------------------------
  // @brief  Returns the window containing exactly the instants this one
  //         does not.
  //
  // @details
  // The default wraps this window in a ComplementWindow. ComplementWindow
  // overrides it to hand back the original window, so complementing twice
  // yields the very same object.
  // -------------------------------------------------------------------------
  virtual WindowPtr complement() const;

  virtual bool isUnbounded() const { return false; }

  virtual std::string describe() const = 0;
};

// The window that contains every instant.
WindowPtr unbounded_window();

// -------------------------------------------------------------------------
// union_of / intersection_of
// -------------------------------------------------------------------------
// @brief  Algebraic combination of windows.
//
// @details
// Nested unions (intersections) are flattened into one AnyWindow
// (AllWindow). The unbounded window absorbs a union and is dropped from an
// intersection. A single remaining operand is returned as-is. An empty
// intersection is the unbounded window.
//
// @throws std::invalid_argument on a null operand, or on an empty union.
// -------------------------------------------------------------------------
WindowPtr union_of(const std::vector<WindowPtr>& windows);
WindowPtr intersection_of(const std::vector<WindowPtr>& windows);

}  // namespace cadence
