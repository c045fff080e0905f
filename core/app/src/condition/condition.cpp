#include "cadence/condition/condition.hpp"
#include "cadence/condition/constant_conditions.hpp"

#include <memory>

namespace cadence {

WindowPtr Condition::cycle() const { return unbounded_window(); }

const IChangeEstimator* Condition::changeEstimator() const {
  return dynamic_cast<const IChangeEstimator*>(this);
}

const IChangeEstimator* change_estimator(const Condition& condition) {
  return condition.changeEstimator();
}

ConditionPtr always_true() {
  static const ConditionPtr kTrue = std::make_shared<const AlwaysTrue>();
  return kTrue;
}

ConditionPtr always_false() {
  static const ConditionPtr kFalse = std::make_shared<const AlwaysFalse>();
  return kFalse;
}

}  // namespace cadence
