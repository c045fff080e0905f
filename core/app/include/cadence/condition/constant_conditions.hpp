#pragma once

#include "cadence/condition/condition.hpp"

namespace cadence {

// -----------------------------------------------------------------------------
// AlwaysTrue / AlwaysFalse
// -----------------------------------------------------------------------------
// Zero-argument constants. Identities of the condition algebra and the
// parser's answer to "true" and "false". Both are stateless, so the shared
// instances returned by always_true() and always_false() serve every caller.
// -----------------------------------------------------------------------------
class AlwaysTrue final : public Condition {
 public:
  bool evaluate(const ITimeProvider&) const override { return true; }
  std::string describe() const override { return "true"; }
};

class AlwaysFalse final : public Condition {
 public:
  bool evaluate(const ITimeProvider&) const override { return false; }
  std::string describe() const override { return "false"; }
};

ConditionPtr always_true();
ConditionPtr always_false();

}  // namespace cadence
