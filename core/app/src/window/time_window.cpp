#include "cadence/window/time_window.hpp"
#include "cadence/window/static_interval.hpp"
#include "cadence/window/window_algebra.hpp"

#include <memory>
#include <stdexcept>

namespace cadence {

// -----------------------------------------------------------------------------
// complement(): generic wrapper, undone by ComplementWindow::complement()
// -----------------------------------------------------------------------------
WindowPtr TimeWindow::complement() const {
  return std::make_shared<const ComplementWindow>(shared_from_this());
}

// -----------------------------------------------------------------------------
// unbounded_window(): one shared instance is enough, windows are immutable
// -----------------------------------------------------------------------------
WindowPtr unbounded_window() {
  static const WindowPtr kUnbounded = std::make_shared<const StaticInterval>();
  return kUnbounded;
}

// -----------------------------------------------------------------------------
// union_of(): flatten, absorb into unbounded, collapse singletons
// -----------------------------------------------------------------------------
WindowPtr union_of(const std::vector<WindowPtr>& windows) {
  if (windows.empty()) {
    throw std::invalid_argument("union_of: at least one window is required");
  }

  std::vector<WindowPtr> members;
  for (const auto& window : windows) {
    if (!window) {
      throw std::invalid_argument("union_of: null window");
    }
    if (window->isUnbounded()) {
      return unbounded_window();
    }
    if (const auto* any = dynamic_cast<const AnyWindow*>(window.get())) {
      members.insert(members.end(), any->windows().begin(),
                     any->windows().end());
    } else {
      members.push_back(window);
    }
  }

  if (members.size() == 1) {
    return members.front();
  }
  return std::make_shared<const AnyWindow>(std::move(members));
}

// -----------------------------------------------------------------------------
// intersection_of(): flatten, drop unbounded members, collapse singletons
// -----------------------------------------------------------------------------
WindowPtr intersection_of(const std::vector<WindowPtr>& windows) {
  std::vector<WindowPtr> members;
  for (const auto& window : windows) {
    if (!window) {
      throw std::invalid_argument("intersection_of: null window");
    }
    if (window->isUnbounded()) {
      continue;
    }
    if (const auto* all = dynamic_cast<const AllWindow*>(window.get())) {
      members.insert(members.end(), all->windows().begin(),
                     all->windows().end());
    } else {
      members.push_back(window);
    }
  }

  if (members.empty()) {
    return unbounded_window();
  }
  if (members.size() == 1) {
    return members.front();
  }
  return std::make_shared<const AllWindow>(std::move(members));
}

}  // namespace cadence
