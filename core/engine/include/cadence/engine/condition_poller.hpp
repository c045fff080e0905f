#pragma once

#include "cadence/condition/condition.hpp"
#include "cadence/config/schedule_config.hpp"
#include "cadence/logging/log_relay.hpp"
#include "cadence/parse/condition_parser.hpp"
#include "cadence/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cadence {

enum class TaskOutcome {
  Fire,   // Condition evaluated true
  Idle,   // Condition evaluated false
  Error,  // Condition threw ConditionEvaluationError
};

const char* to_string(TaskOutcome outcome);

// Result of one task's condition for one poll.
struct TaskResult {
  std::string task;
  TaskOutcome outcome{TaskOutcome::Idle};
  std::optional<Duration> estimate;  // Idle tasks with an IChangeEstimator
  std::string error;                 // Error tasks only
};

// -----------------------------------------------------------------------------
// PollReport: everything one tick decided
// -----------------------------------------------------------------------------
struct PollReport {
  std::int64_t polled_at_ms{0};
  std::vector<TaskResult> results;  // Registration order
  Duration next_sleep{kMinimumResolution};

  std::vector<std::string> firing() const;
  std::vector<std::string> failing() const;
};

// -----------------------------------------------------------------------------
// ConditionPoller
// -----------------------------------------------------------------------------
//
// @brief  Evaluates one condition per task on each tick and works out how
//         long the caller may sleep before the next tick.
//
// @details
// poll() reads the clock once and evaluates every task against that single
// instant, so a composite condition and its siblings never straddle a
// boundary mid-tick.
//
// Error isolation:
//   A ConditionEvaluationError from one task is caught, logged at Error
//   level and reported as TaskOutcome::Error for that task alone. Other
//   tasks are still evaluated. Anything else a condition throws is a bug and
//   propagates.
//
// Sleep planning:
//   - Idle task with an estimate  → that estimate
//   - Idle task without one       → min_sleep (re-check soon)
//   - Firing or failing task      → min_sleep (its state is in flux)
//   next_sleep is the minimum of the above clamped into
//   [min_sleep, max_sleep]. With no tasks it is max_sleep.
//
// Thread model:
//   Tasks are registered during start-up; poll() is const and reads only
//   immutable conditions. The clock and LogRelay must outlive the poller.
// -----------------------------------------------------------------------------
class ConditionPoller {
 public:
  // @throws std::invalid_argument unless 0 < min_sleep <= max_sleep.
  ConditionPoller(const ITimeProvider& clock, LogRelay& log,
                  PollSettings settings = {});

  ConditionPoller(const ConditionPoller&) = delete;
  ConditionPoller& operator=(const ConditionPoller&) = delete;

  // @throws std::invalid_argument on an empty or duplicate name, or a null
  //         condition.
  void addTask(std::string name, ConditionPtr condition);

  // -------------------------------------------------------------------------
  // addTasks(config, parser)
  // -------------------------------------------------------------------------
  // @brief  Parses every task of a ScheduleConfig and registers it.
  //
  // @details
  // Also adopts the config's poll settings. Settings are checked and every
  // condition parsed before anything is registered, so either failure below
  // leaves the poller unchanged.
  //
  // @throws std::invalid_argument unless 0 < min_sleep <= max_sleep.
  // @throws ConditionParseError naming the task whose condition failed.
  // -------------------------------------------------------------------------
  void addTasks(const ScheduleConfig& config, const ConditionParser& parser);

  PollReport poll() const;

  std::size_t taskCount() const { return tasks_.size(); }
  const PollSettings& settings() const { return settings_; }

 private:
  struct Task {
    std::string name;
    ConditionPtr condition;
  };

  bool hasTask(const std::string& name) const;

  const ITimeProvider& clock_;
  LogRelay& log_;
  PollSettings settings_;
  std::vector<Task> tasks_;
};

}  // namespace cadence
