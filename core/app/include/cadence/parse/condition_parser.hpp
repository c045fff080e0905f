#pragma once

#include "cadence/condition/condition.hpp"

#include <cstddef>
#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace cadence {

// -----------------------------------------------------------------------------
// ConditionParser: text → Condition through an ordered rule registry
// -----------------------------------------------------------------------------
//
// @brief  Maps human-readable condition text such as
//         "daily between 08:00 and 17:00 & ~weekly on sunday"
//         to a condition tree.
//
// @details
// Two layers:
//
//   1. Items. parseItem() tries each registered rule in insertion order and
//      returns the first match. A rule is either a regular expression (full,
//      case-insensitive match; capture groups go to the factory) or an exact
//      phrase, also compared case-insensitively. A factory that throws
//      ConditionParseError declines the text and the next rule is tried;
//      any other std::exception from a factory aborts parsing with a
//      ConditionParseError.
//
//   2. Expressions. parse() splits the text on the operators below and
//      parses every operand as an item:
//         ~   negation      (binds tightest)
//         &   conjunction
//         |   disjunction   (binds loosest)
//         ( ) grouping
//      Operators map to not_(), and_() and or_(), so "a & b & c" yields one
//      flat All of three children.
//
// Thread model:
//   Register rules during start-up, then share the parser read-only. Parsing
//   itself is const and may run concurrently.
// -----------------------------------------------------------------------------
class ConditionParser {
 public:
  using Captures = std::vector<std::string>;
  using Factory = std::function<ConditionPtr(const Captures&)>;

  ConditionParser() = default;

  // A parser preloaded with the built-in phrases (constants, daily and
  // weekly windows). See default_rules.cpp for the list.
  static ConditionParser withDefaultRules();

  // -------------------------------------------------------------------------
  // addRule(pattern, factory)
  // -------------------------------------------------------------------------
  // @brief  Registers an ECMAScript regular expression rule.
  //
  // @param  pattern  Must match the whole (trimmed) item, case-insensitive.
  // @param  factory  Receives the capture groups (group 1 first).
  //
  // @throws std::regex_error on an invalid pattern.
  // -------------------------------------------------------------------------
  void addRule(const std::string& pattern, Factory factory);

  // Registers a literal phrase, matched ignoring ASCII case; the factory
  // receives no captures.
  void addExact(const std::string& text, Factory factory);

  // @throws ConditionParseError when no rule accepts the item.
  ConditionPtr parseItem(const std::string& text) const;

  // @throws ConditionParseError on unknown items or malformed syntax.
  ConditionPtr parse(const std::string& expression) const;

  std::size_t ruleCount() const { return rules_.size(); }

 private:
  struct Rule {
    std::string source;
    std::regex pattern;
    bool exact{false};
    Factory factory;
  };

  std::vector<Rule> rules_;
};

}  // namespace cadence
