#include "cadence/condition/composite.hpp"

#include <algorithm>
#include <stdexcept>

namespace cadence {

namespace {

// Splices the children of every argument of type T into one flat list.
template <typename T>
std::vector<ConditionPtr> flatten(std::vector<ConditionPtr> conditions) {
  std::vector<ConditionPtr> flat;
  flat.reserve(conditions.size());
  for (auto& condition : conditions) {
    if (const auto* same = dynamic_cast<const T*>(condition.get())) {
      flat.insert(flat.end(), same->children().begin(),
                  same->children().end());
    } else {
      flat.push_back(std::move(condition));
    }
  }
  return flat;
}

std::string join(const std::vector<ConditionPtr>& children, const char* sep) {
  std::string out = "(";
  for (std::size_t i = 0; i < children.size(); ++i) {
    if (i != 0) {
      out += sep;
    }
    out += children[i]->describe();
  }
  out += ")";
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// CompositeCondition
// -----------------------------------------------------------------------------
CompositeCondition::CompositeCondition(std::vector<ConditionPtr> children)
    : children_(std::move(children)) {
  if (children_.empty()) {
    throw std::invalid_argument("composite condition needs a child");
  }
  for (const auto& child : children_) {
    if (!child) {
      throw std::invalid_argument("composite condition given a null child");
    }
  }
}

// -----------------------------------------------------------------------------
// apply(): map leaves, rebuild every level through its own combinator
// -----------------------------------------------------------------------------
ConditionPtr CompositeCondition::apply(const Transform& transform) const {
  std::vector<ConditionPtr> mapped;
  mapped.reserve(children_.size());
  for (const auto& child : children_) {
    if (const auto* composite =
            dynamic_cast<const CompositeCondition*>(child.get())) {
      mapped.push_back(composite->apply(transform));
    } else {
      mapped.push_back(transform(child));
    }
  }
  return rebuild(std::move(mapped));
}

// =============================================================================
// Any
// =============================================================================

Any::Any(std::vector<ConditionPtr> conditions)
    : CompositeCondition(flatten<Any>(std::move(conditions))) {}

std::shared_ptr<const Any> Any::create(std::vector<ConditionPtr> conditions) {
  return std::make_shared<const Any>(std::move(conditions));
}

bool Any::evaluate(const ITimeProvider& clock) const {
  for (const auto& child : children_) {
    if (child->evaluate(clock)) {
      return true;
    }
  }
  return false;
}

WindowPtr Any::cycle() const {
  const bool determinable =
      std::all_of(children_.begin(), children_.end(),
                  [](const ConditionPtr& c) { return c->isTemporal(); });
  if (!determinable) {
    return unbounded_window();
  }

  std::vector<WindowPtr> windows;
  windows.reserve(children_.size());
  for (const auto& child : children_) {
    windows.push_back(child->cycle());
  }
  return union_of(windows);
}

std::string Any::describe() const { return join(children_, " | "); }

ConditionPtr Any::rebuild(std::vector<ConditionPtr> children) const {
  return create(std::move(children));
}

Duration Any::estimateTimeToNextPossibleChange(Timestamp now) const {
  // Any branch flipping is enough to re-check the whole disjunction.
  Duration soonest = Duration::max();
  for (const auto& child : children_) {
    const IChangeEstimator* estimator = change_estimator(*child);
    const Duration estimate =
        estimator ? estimator->estimateTimeToNextPossibleChange(now)
                  : Duration::zero();
    soonest = std::min(soonest, estimate);
  }
  return soonest;
}

// =============================================================================
// All
// =============================================================================

All::All(std::vector<ConditionPtr> conditions)
    : CompositeCondition(flatten<All>(std::move(conditions))) {}

std::shared_ptr<const All> All::create(std::vector<ConditionPtr> conditions) {
  return std::make_shared<const All>(std::move(conditions));
}

bool All::evaluate(const ITimeProvider& clock) const {
  for (const auto& child : children_) {
    if (!child->evaluate(clock)) {
      return false;
    }
  }
  return true;
}

WindowPtr All::cycle() const {
  std::vector<WindowPtr> windows;
  windows.reserve(children_.size());
  for (const auto& child : children_) {
    windows.push_back(child->cycle());
  }
  return intersection_of(windows);
}

std::string All::describe() const { return join(children_, " & "); }

ConditionPtr All::rebuild(std::vector<ConditionPtr> children) const {
  return create(std::move(children));
}

Duration All::estimateTimeToNextPossibleChange(Timestamp now) const {
  // The conjunction cannot become true before its slowest branch can.
  Duration latest = Duration::zero();
  for (const auto& child : children_) {
    const IChangeEstimator* estimator = change_estimator(*child);
    const Duration estimate =
        estimator ? estimator->estimateTimeToNextPossibleChange(now)
                  : kMinimumResolution;
    latest = std::max(latest, estimate);
  }
  return latest;
}

// =============================================================================
// Not
// =============================================================================

Not::Not(Token, ConditionPtr condition)
    : CompositeCondition(std::vector<ConditionPtr>{std::move(condition)}) {}

ConditionPtr Not::create(ConditionPtr condition) {
  if (!condition) {
    throw std::invalid_argument("Not: null condition");
  }
  if (const auto* inner = dynamic_cast<const Not*>(condition.get())) {
    return inner->wrapped();
  }
  return std::make_shared<const Not>(Token{}, std::move(condition));
}

bool Not::evaluate(const ITimeProvider& clock) const {
  return !wrapped()->evaluate(clock);
}

WindowPtr Not::cycle() const {
  if (!wrapped()->isTemporal()) {
    return unbounded_window();
  }
  return wrapped()->cycle()->complement();
}

std::string Not::describe() const { return "~" + wrapped()->describe(); }

const IChangeEstimator* Not::changeEstimator() const {
  if (!wrapped()->isTemporal()) {
    return nullptr;
  }
  return this;
}

ConditionPtr Not::rebuild(std::vector<ConditionPtr> children) const {
  return create(std::move(children.front()));
}

Duration Not::estimateTimeToNextPossibleChange(Timestamp now) const {
  if (!wrapped()->isTemporal()) {
    return Duration::zero();
  }
  return distance(now, cycle()->rollForward(now).left);
}

// =============================================================================
// Combinators
// =============================================================================

ConditionPtr and_(ConditionPtr a, ConditionPtr b) {
  return All::create({std::move(a), std::move(b)});
}

ConditionPtr or_(ConditionPtr a, ConditionPtr b) {
  return Any::create({std::move(a), std::move(b)});
}

ConditionPtr not_(ConditionPtr a) { return Not::create(std::move(a)); }

}  // namespace cadence
