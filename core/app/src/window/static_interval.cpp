#include "cadence/window/static_interval.hpp"

#include <stdexcept>

namespace cadence {

StaticInterval::StaticInterval(Timestamp start, Timestamp end)
    : start_(start), end_(end) {
  if (end_ < start_) {
    throw std::invalid_argument("StaticInterval: end precedes start");
  }
}

bool StaticInterval::contains(Timestamp t) const {
  return start_ <= t && t < end_;
}

Interval StaticInterval::rollForward(Timestamp t) const {
  if (t < start_) {
    return {start_, end_};
  }
  if (t < end_) {
    return {t, end_};
  }
  return Interval::never();
}

bool StaticInterval::isUnbounded() const {
  return start_ == kNegativeInfinity && end_ == kPositiveInfinity;
}

std::string StaticInterval::describe() const {
  if (isUnbounded()) {
    return "always";
  }
  return "[" + format_timestamp(start_) + ", " + format_timestamp(end_) + ")";
}

}  // namespace cadence
