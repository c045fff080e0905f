#pragma once

#include "cadence/window/time_window.hpp"

#include <memory>

namespace cadence {

// -----------------------------------------------------------------------------
// StaticInterval: one fixed, non-recurring span of time
// -----------------------------------------------------------------------------
//
// @brief  The window [start, end). Default-constructed it is unbounded on
//         both sides, which is the "could be true at any time" window.
//
// @details
// A fixed interval rolls forward to itself while it lies ahead, to
// [t, end) while t is inside, and to Interval::never() once it has passed.
//
// @throws std::invalid_argument when end < start.
// -----------------------------------------------------------------------------
class StaticInterval final : public TimeWindow {
 public:
  StaticInterval() = default;
  StaticInterval(Timestamp start, Timestamp end);

  static std::shared_ptr<const StaticInterval> create(Timestamp start,
                                                      Timestamp end) {
    return std::make_shared<const StaticInterval>(start, end);
  }

  bool contains(Timestamp t) const override;
  Interval rollForward(Timestamp t) const override;
  bool isUnbounded() const override;
  std::string describe() const override;

  Timestamp start() const { return start_; }
  Timestamp end() const { return end_; }

 private:
  Timestamp start_{kNegativeInfinity};
  Timestamp end_{kPositiveInfinity};
};

}  // namespace cadence
