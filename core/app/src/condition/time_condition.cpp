#include "cadence/condition/time_condition.hpp"
#include "cadence/window/periodic_window.hpp"
#include "cadence/window/static_interval.hpp"

#include <stdexcept>

namespace cadence {

TimeCondition::TimeCondition(WindowPtr window) : window_(std::move(window)) {
  if (!window_) {
    throw std::invalid_argument("TimeCondition: null window");
  }
}

std::shared_ptr<const TimeCondition> TimeCondition::fromWindow(
    WindowPtr window) {
  return std::make_shared<const TimeCondition>(std::move(window));
}

std::shared_ptr<const TimeCondition> TimeCondition::daily(
    Duration start_of_day, Duration end_of_day) {
  return fromWindow(PeriodicWindow::daily(start_of_day, end_of_day));
}

std::shared_ptr<const TimeCondition> TimeCondition::weekly(
    Duration start_of_week, Duration end_of_week) {
  return fromWindow(PeriodicWindow::weekly(start_of_week, end_of_week));
}

std::shared_ptr<const TimeCondition> TimeCondition::between(Timestamp start,
                                                            Timestamp end) {
  return fromWindow(StaticInterval::create(start, end));
}

bool TimeCondition::evaluate(const ITimeProvider& clock) const {
  return window_->contains(now_of(clock));
}

std::string TimeCondition::describe() const {
  return "<is " + window_->describe() + ">";
}

Duration TimeCondition::estimateTimeToNextPossibleChange(Timestamp now) const {
  return distance(now, window_->rollForward(now).left);
}

}  // namespace cadence
