#pragma once

#include "cadence/condition/condition.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace cadence {

// -----------------------------------------------------------------------------
// CompositeCondition: a condition built from sub-conditions
// -----------------------------------------------------------------------------
//
// @brief  Owns an ordered, non-empty sequence of children.
//
// @details
// Any and All hold one or more children; Not holds exactly one. Children are
// shared pointers to immutable conditions, so the same child may appear in
// several composites without any coordination.
// -----------------------------------------------------------------------------
class CompositeCondition : public Condition {
 public:
  using Transform = std::function<ConditionPtr(const ConditionPtr&)>;

  const std::vector<ConditionPtr>& children() const { return children_; }
  std::size_t size() const { return children_.size(); }
  const ConditionPtr& operator[](std::size_t index) const {
    return children_[index];
  }

  // -------------------------------------------------------------------------
  // apply(transform)
  // -------------------------------------------------------------------------
  // @brief  Rebuilds this tree with `transform` applied to every leaf.
  //
  // @details
  // Composite children are rebuilt recursively; every other child is
  // replaced by transform(child). Each level is rebuilt through its own
  // create(), so the result is normalised again: an Any leaf mapped to an Any
  // is flattened into its parent, and a Not leaf mapped to a Not collapses.
  // The original tree is left untouched.
  //
  // @throws std::invalid_argument when transform returns nullptr.
  // -------------------------------------------------------------------------
  ConditionPtr apply(const Transform& transform) const;

 protected:
  // @throws std::invalid_argument on an empty sequence or a null child.
  explicit CompositeCondition(std::vector<ConditionPtr> children);

  // Same combinator over new children.
  virtual ConditionPtr rebuild(std::vector<ConditionPtr> children) const = 0;

  std::vector<ConditionPtr> children_;
};

// -----------------------------------------------------------------------------
// Any: logical OR
// -----------------------------------------------------------------------------
//
// @brief  True when at least one child is true.
//
// @details
// Flattening: an Any passed as an argument contributes its children instead
// of being nested, so Any(Any(a, b), c) and Any(a, Any(b, c)) both hold
// [a, b, c] in that order.
//
// evaluate():   children in order, stops at the first true one. A later
//               child that would throw is never reached.
// estimate:     minimum over the children; a child without IChangeEstimator
//               counts as zero.
// cycle():      union of the children's windows when every child is
//               temporal, else unbounded.
// -----------------------------------------------------------------------------
class Any final : public CompositeCondition, public IChangeEstimator {
 public:
  explicit Any(std::vector<ConditionPtr> conditions);

  static std::shared_ptr<const Any> create(
      std::vector<ConditionPtr> conditions);

  bool evaluate(const ITimeProvider& clock) const override;
  WindowPtr cycle() const override;
  std::string describe() const override;

  Duration estimateTimeToNextPossibleChange(Timestamp now) const override;

 protected:
  ConditionPtr rebuild(std::vector<ConditionPtr> children) const override;
};

// -----------------------------------------------------------------------------
// All: logical AND
// -----------------------------------------------------------------------------
//
// @brief  True when every child is true.
//
// @details
// Flattening mirrors Any.
//
// evaluate():   children in order, stops at the first false one.
// estimate:     maximum over the children; a child without IChangeEstimator
//               counts as kMinimumResolution, never zero, so it cannot hide
//               a real constraint from its siblings.
// cycle():      intersection of every child's window. Non-temporal children
//               contribute the unbounded window, which is the identity.
// -----------------------------------------------------------------------------
class All final : public CompositeCondition, public IChangeEstimator {
 public:
  explicit All(std::vector<ConditionPtr> conditions);

  static std::shared_ptr<const All> create(
      std::vector<ConditionPtr> conditions);

  bool evaluate(const ITimeProvider& clock) const override;
  WindowPtr cycle() const override;
  std::string describe() const override;

  Duration estimateTimeToNextPossibleChange(Timestamp now) const override;

 protected:
  ConditionPtr rebuild(std::vector<ConditionPtr> children) const override;
};

// -----------------------------------------------------------------------------
// Not: logical negation
// -----------------------------------------------------------------------------
//
// @brief  True when its single child is false.
//
// @details
// Double negation is removed structurally: Not::create() on a Not returns
// the original wrapped condition, the very same object. The constructor
// takes a Token only Not can make, so no Not(Not(x)) can ever be built.
//
// Delegation: isTemporal() and wrapped() expose the child, and describe()
// decorates the child's own rendering. Domain accessors of the child (a
// TimeCondition's window, a ProbeCondition's name) are reached through
// wrapped(). Evaluation and the window/estimate algebra are inverted
// explicitly:
//   cycle():  complement of the child's window when the child is temporal,
//             else unbounded.
//   estimate: roll-forward distance of that complement. Only offered when
//             the child is temporal; over any other child changeEstimator()
//             returns nullptr.
// -----------------------------------------------------------------------------
class Not final : public CompositeCondition, public IChangeEstimator {
  // User-provided, so `{}` cannot stand in for it outside Not.
  struct Token {
    explicit Token() {}
  };

 public:
  Not(Token, ConditionPtr condition);

  // @throws std::invalid_argument on a null condition.
  static ConditionPtr create(ConditionPtr condition);

  const ConditionPtr& wrapped() const { return children_.front(); }

  bool evaluate(const ITimeProvider& clock) const override;
  WindowPtr cycle() const override;
  bool isTemporal() const override { return wrapped()->isTemporal(); }
  std::string describe() const override;
  const IChangeEstimator* changeEstimator() const override;

  Duration estimateTimeToNextPossibleChange(Timestamp now) const override;

 protected:
  ConditionPtr rebuild(std::vector<ConditionPtr> children) const override;
};

// -------------------------------------------------------------------------
// and_ / or_ / not_
// -------------------------------------------------------------------------
// @brief  Named combinators; each returns a new condition and leaves its
//         operands untouched.
//
//   and_(a, b)  → All(a, b)   (flattened)
//   or_(a, b)   → Any(a, b)   (flattened)
//   not_(a)     → Not(a), or the wrapped condition when a is itself a Not
// -------------------------------------------------------------------------
ConditionPtr and_(ConditionPtr a, ConditionPtr b);
ConditionPtr or_(ConditionPtr a, ConditionPtr b);
ConditionPtr not_(ConditionPtr a);

}  // namespace cadence
