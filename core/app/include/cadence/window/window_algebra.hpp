#pragma once

#include "cadence/window/time_window.hpp"

#include <vector>

namespace cadence {

// Upper bound on the number of roll-forward hops a composite window takes
// while searching for its next occurrence. When the bound is hit the search
// stops and reports the instant it reached: nothing in the window can start
// before it, so the answer is still a valid lower bound. AnyWindow instead
// treats coverage that is still unbroken after the bound as open-ended.
constexpr int kMaxRollSteps = 4096;

// -----------------------------------------------------------------------------
// AnyWindow: union of windows
// -----------------------------------------------------------------------------
// Contains t when any member does. rollForward picks the member occurrence
// that starts first and stretches its right edge across members that overlap
// or touch it.
// -----------------------------------------------------------------------------
class AnyWindow final : public TimeWindow {
 public:
  explicit AnyWindow(std::vector<WindowPtr> windows);

  bool contains(Timestamp t) const override;
  Interval rollForward(Timestamp t) const override;
  std::string describe() const override;

  const std::vector<WindowPtr>& windows() const { return windows_; }

 private:
  std::vector<WindowPtr> windows_;
};

// -----------------------------------------------------------------------------
// AllWindow: intersection of windows
// -----------------------------------------------------------------------------
//
// @brief  Contains t when every member does.
//
// @details
// rollForward alternates between members: roll every member forward from a
// cursor, move the cursor to the latest left edge, and stop once every
// member's occurrence covers the cursor. The intersection occurrence is then
// [cursor, earliest right edge). Members that never occur again make the
// whole intersection never occur again.
// -----------------------------------------------------------------------------
class AllWindow final : public TimeWindow {
 public:
  explicit AllWindow(std::vector<WindowPtr> windows);

  bool contains(Timestamp t) const override;
  Interval rollForward(Timestamp t) const override;
  std::string describe() const override;

  const std::vector<WindowPtr>& windows() const { return windows_; }

 private:
  std::vector<WindowPtr> windows_;
};

// -----------------------------------------------------------------------------
// ComplementWindow: every instant the wrapped window does not contain
// -----------------------------------------------------------------------------
// complement() returns the wrapped window itself.
// -----------------------------------------------------------------------------
class ComplementWindow final : public TimeWindow {
 public:
  explicit ComplementWindow(WindowPtr inner);

  bool contains(Timestamp t) const override;
  Interval rollForward(Timestamp t) const override;
  WindowPtr complement() const override { return inner_; }
  std::string describe() const override;

  const WindowPtr& inner() const { return inner_; }

 private:
  WindowPtr inner_;
};

}  // namespace cadence
