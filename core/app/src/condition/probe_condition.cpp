#include "cadence/condition/probe_condition.hpp"
#include "cadence/condition/condition_errors.hpp"

#include <stdexcept>

namespace cadence {

ProbeCondition::ProbeCondition(std::string name, Probe probe)
    : name_(std::move(name)), probe_(std::move(probe)) {
  if (!probe_) {
    throw std::invalid_argument("ProbeCondition '" + name_ +
                                "': empty probe callback");
  }
}

std::shared_ptr<const ProbeCondition> ProbeCondition::create(std::string name,
                                                             Probe probe) {
  return std::make_shared<const ProbeCondition>(std::move(name),
                                                std::move(probe));
}

bool ProbeCondition::evaluate(const ITimeProvider& /*clock*/) const {
  try {
    return probe_();
  } catch (const ConditionEvaluationError&) {
    throw;
  } catch (const std::exception& e) {
    throw ConditionEvaluationError(name_, e.what());
  }
}

}  // namespace cadence
