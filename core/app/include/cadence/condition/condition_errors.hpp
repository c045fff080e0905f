#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cadence {

// -----------------------------------------------------------------------------
// ConditionEvaluationError
// -----------------------------------------------------------------------------
//
// @brief  Thrown when a condition cannot determine its truth value.
//
// @details
// A condition whose underlying check is unavailable (a probe that cannot
// reach its resource, a missing dependency) throws this instead of
// answering false. Composites let it propagate unless short-circuiting means
// the failing child is never reached. The poller catches it per task.
// -----------------------------------------------------------------------------
class ConditionEvaluationError : public std::runtime_error {
 public:
  ConditionEvaluationError(std::string condition, std::string reason)
      : std::runtime_error("cannot evaluate " + condition + ": " + reason),
        condition_(std::move(condition)),
        reason_(std::move(reason)) {}

  const std::string& condition() const { return condition_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string condition_;
  std::string reason_;
};

// -----------------------------------------------------------------------------
// ConditionParseError
// -----------------------------------------------------------------------------
// Thrown by ConditionParser when no rule matches a condition item, or when
// an expression is syntactically malformed. Never thrown during evaluation.
// -----------------------------------------------------------------------------
class ConditionParseError : public std::runtime_error {
 public:
  ConditionParseError(std::string text, const std::string& message)
      : std::runtime_error(message + ": '" + text + "'"),
        text_(std::move(text)) {}

  const std::string& text() const { return text_; }

 private:
  std::string text_;
};

}  // namespace cadence
