#include "cadence/engine/condition_poller.hpp"
#include "cadence/condition/condition_errors.hpp"
#include "cadence/time/simulation_time_provider.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cadence {

namespace {

constexpr const char* kComponent = "ConditionPoller";

void check_settings(const PollSettings& settings) {
  if (settings.min_sleep <= Duration::zero()) {
    throw std::invalid_argument("ConditionPoller: min_sleep must be positive");
  }
  if (settings.min_sleep > settings.max_sleep) {
    throw std::invalid_argument(
        "ConditionPoller: min_sleep exceeds max_sleep");
  }
}

}  // namespace

const char* to_string(TaskOutcome outcome) {
  switch (outcome) {
    case TaskOutcome::Fire:
      return "fire";
    case TaskOutcome::Idle:
      return "idle";
    case TaskOutcome::Error:
      return "error";
  }
  return "idle";
}

std::vector<std::string> PollReport::firing() const {
  std::vector<std::string> names;
  for (const auto& result : results) {
    if (result.outcome == TaskOutcome::Fire) {
      names.push_back(result.task);
    }
  }
  return names;
}

std::vector<std::string> PollReport::failing() const {
  std::vector<std::string> names;
  for (const auto& result : results) {
    if (result.outcome == TaskOutcome::Error) {
      names.push_back(result.task);
    }
  }
  return names;
}

ConditionPoller::ConditionPoller(const ITimeProvider& clock, LogRelay& log,
                                 PollSettings settings)
    : clock_(clock), log_(log), settings_(settings) {
  check_settings(settings_);
}

bool ConditionPoller::hasTask(const std::string& name) const {
  return std::any_of(tasks_.begin(), tasks_.end(),
                     [&name](const Task& t) { return t.name == name; });
}

void ConditionPoller::addTask(std::string name, ConditionPtr condition) {
  if (name.empty()) {
    throw std::invalid_argument("ConditionPoller: empty task name");
  }
  if (!condition) {
    throw std::invalid_argument("ConditionPoller: task '" + name +
                                "' has no condition");
  }
  if (hasTask(name)) {
    throw std::invalid_argument("ConditionPoller: duplicate task '" + name +
                                "'");
  }
  log_.debug(kComponent,
             "registered task '" + name + "' when " + condition->describe());
  tasks_.push_back(Task{std::move(name), std::move(condition)});
}

void ConditionPoller::addTasks(const ScheduleConfig& config,
                               const ConditionParser& parser) {
  check_settings(config.poll);

  std::vector<Task> parsed;
  parsed.reserve(config.tasks.size());
  for (const auto& spec : config.tasks) {
    try {
      parsed.push_back(Task{spec.name, parser.parse(spec.condition)});
    } catch (const ConditionParseError& e) {
      log_.error(kComponent, "task '" + spec.name + "': " + e.what());
      throw ConditionParseError(spec.condition,
                                "task '" + spec.name + "': " + e.what());
    }
  }

  settings_ = config.poll;
  for (auto& task : parsed) {
    addTask(std::move(task.name), std::move(task.condition));
  }
}

// -----------------------------------------------------------------------------
// poll(): one clock read, every task evaluated against it
// -----------------------------------------------------------------------------
PollReport ConditionPoller::poll() const {
  PollReport report;
  report.polled_at_ms = clock_.now_ms();

  // Pin the instant so every condition sees the same "now".
  const SimulationTimeProvider snapshot{report.polled_at_ms};
  const Timestamp now = ms_to_timestamp(report.polled_at_ms);

  Duration soonest = tasks_.empty() ? settings_.max_sleep : Duration::max();

  for (const auto& task : tasks_) {
    TaskResult result;
    result.task = task.name;

    try {
      result.outcome = task.condition->evaluate(snapshot)
                           ? TaskOutcome::Fire
                           : TaskOutcome::Idle;
    } catch (const ConditionEvaluationError& e) {
      result.outcome = TaskOutcome::Error;
      result.error = e.what();
      log_.error(kComponent, "task '" + task.name + "': " + e.what());
    }

    Duration wait = settings_.min_sleep;
    if (result.outcome == TaskOutcome::Idle) {
      if (const IChangeEstimator* estimator =
              change_estimator(*task.condition)) {
        result.estimate = estimator->estimateTimeToNextPossibleChange(now);
        wait = *result.estimate;
      }
    } else if (result.outcome == TaskOutcome::Fire) {
      log_.info(kComponent, "task '" + task.name + "' fires");
    }

    soonest = std::min(soonest, wait);
    report.results.push_back(std::move(result));
  }

  report.next_sleep =
      std::clamp(soonest, settings_.min_sleep, settings_.max_sleep);
  return report;
}

}  // namespace cadence
