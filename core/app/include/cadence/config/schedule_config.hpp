#pragma once

#include "cadence/time/time_utils.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace cadence {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown when a schedule configuration is unreadable, malformed JSON, or
// missing / mistyping a required key. The message names the offending key.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// PollSettings: how long the poller may sleep between ticks
// -----------------------------------------------------------------------------
//
// @brief  Clamp applied to the sleep the poller derives from condition
//         estimates.
//
// @details
// min_sleep stops a burst of zero estimates from turning into a busy loop;
// max_sleep bounds how stale the scheduler's view may get when every
// condition reports a distant change (clock adjustments, new tasks).
// -----------------------------------------------------------------------------
struct PollSettings {
  Duration min_sleep{kMinimumResolution};
  Duration max_sleep{std::chrono::minutes(1)};
};

// One task entry: a unique name and the condition text for the parser.
struct TaskSpec {
  std::string name;
  std::string condition;
};

// -----------------------------------------------------------------------------
// ScheduleConfig: tasks and poll settings loaded from JSON
// -----------------------------------------------------------------------------
//
// Expected JSON format:
//   {
//     "poll":  { "min_sleep_ms": 100, "max_sleep_ms": 60000 },   // optional
//     "tasks": [
//       {"name": "report", "condition": "daily between 08:00 and 17:00"},
//       {"name": "cleanup", "condition": "weekly on sun & daily after 22:00"}
//     ]
//   }
//
// Validation:
//   - "tasks" must be an array; every entry needs string "name" and
//     "condition". Names must be non-empty and unique.
//   - "poll" values are positive integers with min_sleep_ms <= max_sleep_ms.
// Condition text is not parsed here; that is the ConditionParser's job.
// -----------------------------------------------------------------------------
struct ScheduleConfig {
  PollSettings poll;
  std::vector<TaskSpec> tasks;

  // @throws ConfigError
  static ScheduleConfig fromJson(const std::string& text);

  // @throws ConfigError, including when the file cannot be opened.
  static ScheduleConfig fromFile(const std::string& path);
};

}  // namespace cadence
