#pragma once

#include "cadence/condition/condition.hpp"

#include <functional>
#include <memory>
#include <string>

namespace cadence {

// -----------------------------------------------------------------------------
// ProbeCondition: a condition backed by an external check
// -----------------------------------------------------------------------------
//
// @brief  Evaluates a named callback, e.g. "enough free RAM" or "upstream
//         job finished".
//
// @details
// The callback belongs to the caller and may fail. Any std::exception it
// throws is rethrown as ConditionEvaluationError naming the probe, so a
// failing check can never masquerade as false. A callback that already
// throws ConditionEvaluationError is passed through untouched.
//
// The engine imposes no timeout; a slow probe blocks evaluate() for as long
// as it runs.
// -----------------------------------------------------------------------------
class ProbeCondition final : public Condition {
 public:
  using Probe = std::function<bool()>;

  // @throws std::invalid_argument on an empty callback.
  ProbeCondition(std::string name, Probe probe);

  static std::shared_ptr<const ProbeCondition> create(std::string name,
                                                      Probe probe);

  bool evaluate(const ITimeProvider& clock) const override;
  std::string describe() const override { return name_; }

  const std::string& name() const { return name_; }

 private:
  std::string name_;
  Probe probe_;
};

}  // namespace cadence
