#include "cadence/condition/constant_conditions.hpp"
#include "cadence/condition/time_condition.hpp"
#include "cadence/parse/condition_parser.hpp"
#include "cadence/window/periodic_window.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace cadence {

namespace {

const char* const kClock = R"((\d{1,2}):(\d{2}))";
const char* const kWeekday =
    R"((monday|tuesday|wednesday|thursday|friday|saturday|sunday|)"
    R"(mon|tue|wed|thu|fri|sat|sun))";

// "HH", "MM" → offset from midnight.
Duration time_of_day(const std::string& hh, const std::string& mm) {
  const int hours = std::stoi(hh);
  const int minutes = std::stoi(mm);
  if (hours > 23 || minutes > 59) {
    throw std::invalid_argument("time of day out of range: " + hh + ":" + mm);
  }
  return std::chrono::hours(hours) + std::chrono::minutes(minutes);
}

// Monday == 0 ... Sunday == 6.
int weekday_index(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  static const char* const kNames[] = {"mon", "tue", "wed", "thu",
                                       "fri", "sat", "sun"};
  for (int i = 0; i < 7; ++i) {
    if (name.compare(0, 3, kNames[i]) == 0) {
      return i;
    }
  }
  throw std::invalid_argument("unknown weekday: " + name);
}

Duration start_of_weekday(int index) { return PeriodicWindow::kDay * index; }

}  // namespace

// -----------------------------------------------------------------------------
// withDefaultRules(): the phrases every deployment understands
// -----------------------------------------------------------------------------
//   true | always                           → AlwaysTrue
//   false | never                           → AlwaysFalse
//   daily between HH:MM and HH:MM           → daily window, may wrap midnight
//   time of day between HH:MM and HH:MM     → same as above
//   daily after HH:MM                       → HH:MM until midnight
//   daily before HH:MM                      → midnight until HH:MM
//   weekly on <weekday>                     → that whole day, every week
//   weekly between <weekday> and <weekday>  → first day through last day
// -----------------------------------------------------------------------------
ConditionParser ConditionParser::withDefaultRules() {
  ConditionParser parser;

  const auto constant_true = [](const Captures&) { return always_true(); };
  const auto constant_false = [](const Captures&) { return always_false(); };
  parser.addExact("true", constant_true);
  parser.addExact("always", constant_true);
  parser.addExact("false", constant_false);
  parser.addExact("never", constant_false);

  const auto daily_between = [](const Captures& c) -> ConditionPtr {
    return TimeCondition::daily(time_of_day(c[0], c[1]),
                                time_of_day(c[2], c[3]));
  };
  const std::string between =
      std::string("between ") + kClock + " and " + kClock;
  parser.addRule("daily " + between, daily_between);
  parser.addRule("time of day " + between, daily_between);

  parser.addRule(std::string("daily after ") + kClock,
                 [](const Captures& c) -> ConditionPtr {
                   return TimeCondition::daily(time_of_day(c[0], c[1]),
                                               Duration::zero());
                 });

  parser.addRule(std::string("daily before ") + kClock,
                 [](const Captures& c) -> ConditionPtr {
                   const Duration end = time_of_day(c[0], c[1]);
                   if (end == Duration::zero()) {
                     throw std::invalid_argument("nothing is before 00:00");
                   }
                   return TimeCondition::daily(Duration::zero(), end);
                 });

  parser.addRule(std::string("weekly on ") + kWeekday,
                 [](const Captures& c) -> ConditionPtr {
                   const int day = weekday_index(c[0]);
                   const int next = (day + 1) % 7;
                   return TimeCondition::weekly(start_of_weekday(day),
                                                start_of_weekday(next));
                 });

  parser.addRule(std::string("weekly between ") + kWeekday + " and " + kWeekday,
                 [](const Captures& c) -> ConditionPtr {
                   const int first = weekday_index(c[0]);
                   const int last = weekday_index(c[1]);
                   return TimeCondition::weekly(
                       start_of_weekday(first),
                       start_of_weekday((last + 1) % 7));
                 });

  return parser;
}

}  // namespace cadence
