#include "cadence/window/window_algebra.hpp"

#include <algorithm>
#include <stdexcept>

namespace cadence {

namespace {

std::string join(const std::vector<WindowPtr>& windows, const char* sep) {
  std::string out = "(";
  for (std::size_t i = 0; i < windows.size(); ++i) {
    if (i != 0) {
      out += sep;
    }
    out += windows[i]->describe();
  }
  out += ")";
  return out;
}

void require_members(const std::vector<WindowPtr>& windows, const char* who) {
  if (windows.empty()) {
    throw std::invalid_argument(std::string(who) + ": no member windows");
  }
  for (const auto& window : windows) {
    if (!window) {
      throw std::invalid_argument(std::string(who) + ": null member window");
    }
  }
}

}  // namespace

// =============================================================================
// AnyWindow
// =============================================================================

AnyWindow::AnyWindow(std::vector<WindowPtr> windows)
    : windows_(std::move(windows)) {
  require_members(windows_, "AnyWindow");
}

bool AnyWindow::contains(Timestamp t) const {
  return std::any_of(windows_.begin(), windows_.end(),
                     [t](const WindowPtr& w) { return w->contains(t); });
}

Interval AnyWindow::rollForward(Timestamp t) const {
  Interval best = Interval::never();
  for (const auto& window : windows_) {
    const Interval next = window->rollForward(t);
    if (next.left < best.left ||
        (next.left == best.left && next.right > best.right)) {
      best = next;
    }
  }
  if (best.isNever()) {
    return best;
  }

  // Stretch across members that continue the occurrence without a gap.
  // Coverage still unbroken after kMaxRollSteps hops is taken as open-ended,
  // e.g. two spans that together cover the whole day.
  int step = 0;
  for (; step < kMaxRollSteps && best.right != kPositiveInfinity; ++step) {
    Timestamp extended = best.right;
    for (const auto& window : windows_) {
      if (window->contains(best.right)) {
        extended = std::max(extended, window->rollForward(best.right).right);
      }
    }
    if (extended == best.right) {
      break;
    }
    best.right = extended;
  }
  if (step == kMaxRollSteps) {
    best.right = kPositiveInfinity;
  }
  return best;
}

std::string AnyWindow::describe() const { return join(windows_, " | "); }

// =============================================================================
// AllWindow
// =============================================================================

AllWindow::AllWindow(std::vector<WindowPtr> windows)
    : windows_(std::move(windows)) {
  require_members(windows_, "AllWindow");
}

bool AllWindow::contains(Timestamp t) const {
  return std::all_of(windows_.begin(), windows_.end(),
                     [t](const WindowPtr& w) { return w->contains(t); });
}

Interval AllWindow::rollForward(Timestamp t) const {
  Timestamp cursor = t;
  std::vector<Interval> occurrences(windows_.size());

  for (int step = 0; step < kMaxRollSteps; ++step) {
    Timestamp latest_left = cursor;
    for (std::size_t i = 0; i < windows_.size(); ++i) {
      occurrences[i] = windows_[i]->rollForward(cursor);
      if (occurrences[i].isNever()) {
        return Interval::never();
      }
      latest_left = std::max(latest_left, occurrences[i].left);
    }

    const bool all_cover =
        std::all_of(occurrences.begin(), occurrences.end(),
                    [latest_left](const Interval& occ) {
                      return occ.contains(latest_left);
                    });
    if (all_cover) {
      Timestamp right = kPositiveInfinity;
      for (const auto& occ : occurrences) {
        right = std::min(right, occ.right);
      }
      return {latest_left, right};
    }

    if (latest_left == cursor) {
      // A member reported an empty occurrence; no progress is possible.
      break;
    }
    cursor = latest_left;
  }

  // Nothing can start before the cursor; report it as a lower bound.
  return {cursor, cursor};
}

std::string AllWindow::describe() const { return join(windows_, " & "); }

// =============================================================================
// ComplementWindow
// =============================================================================

ComplementWindow::ComplementWindow(WindowPtr inner) : inner_(std::move(inner)) {
  if (!inner_) {
    throw std::invalid_argument("ComplementWindow: null inner window");
  }
}

bool ComplementWindow::contains(Timestamp t) const {
  return !inner_->contains(t);
}

Interval ComplementWindow::rollForward(Timestamp t) const {
  if (t == kPositiveInfinity) {
    return Interval::never();
  }

  // Walk past every inner occurrence covering the cursor; adjacent inner
  // occurrences leave no gap for the complement. An inner occurrence whose
  // right edge saturated never ends, so the complement never starts.
  Timestamp cursor = t;
  for (int step = 0; step < kMaxRollSteps && inner_->contains(cursor);
       ++step) {
    const Interval occ = inner_->rollForward(cursor);
    if (occ.right == kPositiveInfinity) {
      return Interval::never();
    }
    if (occ.right <= cursor) {
      break;
    }
    cursor = occ.right;
  }
  if (inner_->contains(cursor)) {
    return {cursor, cursor};
  }

  return {cursor, inner_->rollForward(cursor).left};
}

std::string ComplementWindow::describe() const {
  return "~" + inner_->describe();
}

}  // namespace cadence
