#pragma once

#include "cadence/time/i_time_provider.hpp"
#include "cadence/time/time_utils.hpp"
#include "cadence/window/time_window.hpp"

#include <memory>
#include <string>

namespace cadence {

class Condition;
class IChangeEstimator;

// Conditions are immutable values; one instance may sit in several trees.
using ConditionPtr = std::shared_ptr<const Condition>;

// -----------------------------------------------------------------------------
// Condition: base contract of every scheduling condition
// -----------------------------------------------------------------------------
//
// @brief  A lazily evaluated boolean predicate, optionally carrying temporal
//         structure.
//
// @details
// A scheduler holds one (possibly composite) condition per task. On each
// tick it calls evaluate(); when the answer is false it may ask for the
// condition's cycle() or, through IChangeEstimator, how long it can sleep
// before the answer could change.
//
// Composition goes through the free functions and_(), or_() and not_()
// declared in composite.hpp. They always build new objects; operands are
// never modified.
//
// Error contract:
//   evaluate() throws ConditionEvaluationError when the truth value cannot be
//   determined. It never turns such a failure into false.
//
// Thread model:
//   Subclasses hold no mutable state; evaluate() may run concurrently on the
//   same instance from several threads. "Now" comes from the clock argument
//   and is never cached.
// -----------------------------------------------------------------------------
class Condition {
 public:
  virtual ~Condition() = default;

  // -------------------------------------------------------------------------
  // evaluate(clock)
  // -------------------------------------------------------------------------
  // @brief  Returns the condition's truth value at clock.now_ms().
  //
  // @throws ConditionEvaluationError when the value cannot be determined.
  // -------------------------------------------------------------------------
  virtual bool evaluate(const ITimeProvider& clock) const = 0;

  // -------------------------------------------------------------------------
  // cycle()
  // -------------------------------------------------------------------------
  // @brief  The window during which this condition could possibly be true.
  //
  // @details
  // Conditions without temporal structure answer with the unbounded window:
  // as far as time is concerned they could be true at any instant.
  // -------------------------------------------------------------------------
  virtual WindowPtr cycle() const;

  // True for conditions whose truth is fully determined by cycle().
  virtual bool isTemporal() const { return false; }

  // -------------------------------------------------------------------------
  // changeEstimator()
  // -------------------------------------------------------------------------
  // @brief  This condition's IChangeEstimator, or nullptr when it cannot
  //         estimate.
  //
  // @details
  // The default answers from the dynamic type: a condition that derives from
  // IChangeEstimator has the capability. Wrappers whose capability depends
  // on what they wrap override it.
  // -------------------------------------------------------------------------
  virtual const IChangeEstimator* changeEstimator() const;

  virtual std::string describe() const = 0;
};

// -----------------------------------------------------------------------------
// IChangeEstimator: optional capability of a condition
// -----------------------------------------------------------------------------
//
// @brief  Implemented by conditions that can bound how long their truth value
//         will stay unchanged.
//
// @details
// estimateTimeToNextPossibleChange(now) is a lower bound on the time a
// scheduler may sleep before re-checking is worthwhile. Zero means "check
// again immediately". Callers discover the capability with
// change_estimator(); conditions that do not implement it are treated as
// having no temporal structure at all.
// -----------------------------------------------------------------------------
class IChangeEstimator {
 public:
  virtual ~IChangeEstimator() = default;

  virtual Duration estimateTimeToNextPossibleChange(Timestamp now) const = 0;
};

// Returns condition.changeEstimator(), or nullptr if it has none.
const IChangeEstimator* change_estimator(const Condition& condition);

// Reads the clock once and converts it to a Timestamp.
inline Timestamp now_of(const ITimeProvider& clock) {
  return ms_to_timestamp(clock.now_ms());
}

}  // namespace cadence
