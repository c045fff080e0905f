// -----------------------------------------------------------------------------
// cadence_demo: run a schedule configuration against the live clock
// -----------------------------------------------------------------------------
//
// Usage: cadence_demo <config.json> [ticks]
//
//   1) Load the ScheduleConfig (tasks + poll settings) from JSON.
//   2) Parse every task's condition with the default rule set.
//   3) Poll once per tick on the live clock, log which tasks fire, and
//      sleep for the delay the poller planned from the condition estimates.
//   4) Stop after [ticks] polls (default: run until Ctrl-C).
//
// Exit codes: 0 on a clean run, 1 on bad usage, 2 on a configuration or
// parse error.
// -----------------------------------------------------------------------------

#include "cadence/condition/condition_errors.hpp"
#include "cadence/config/schedule_config.hpp"
#include "cadence/engine/condition_poller.hpp"
#include "cadence/logging/log_relay.hpp"
#include "cadence/parse/condition_parser.hpp"
#include "cadence/time/live_time_provider.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Written by the SIGINT handler, read by the poll loop.
std::atomic<bool> g_stop_requested{false};

void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

// Longest uninterrupted sleep; keeps Ctrl-C responsive during long waits.
constexpr auto kSleepSlice = std::chrono::milliseconds(100);

void sleep_interruptibly(cadence::Duration total) {
  auto remaining = total;
  while (remaining > cadence::Duration::zero() && !g_stop_requested.load()) {
    const auto slice =
        std::min<cadence::Duration>(remaining, kSleepSlice);
    std::this_thread::sleep_for(slice);
    remaining -= slice;
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "usage: " << argv[0] << " <config.json> [ticks]\n";
    return 1;
  }

  long ticks = -1;
  if (argc == 3) {
    char* end = nullptr;
    ticks = std::strtol(argv[2], &end, 10);
    if (end == argv[2] || *end != '\0' || ticks <= 0) {
      std::cerr << "[main] ticks must be a positive integer\n";
      return 1;
    }
  }

  cadence::LiveTimeProvider clock;
  cadence::LogRelay log(clock);
  log.start();

  cadence::ConditionPoller poller(clock, log);
  try {
    const auto config = cadence::ScheduleConfig::fromFile(argv[1]);
    const auto parser = cadence::ConditionParser::withDefaultRules();
    poller.addTasks(config, parser);
  } catch (const cadence::ConfigError& e) {
    log.error("main", e.what());
    log.stop();
    return 2;
  } catch (const cadence::ConditionParseError& e) {
    log.error("main", e.what());
    log.stop();
    return 2;
  }

  log.info("main", "loaded " + std::to_string(poller.taskCount()) +
                       " task(s); press Ctrl-C to stop");
  std::signal(SIGINT, sigint_handler);

  for (long tick = 0; (ticks < 0 || tick < ticks) && !g_stop_requested.load();
       ++tick) {
    const auto report = poller.poll();
    log.info("main", "tick " + std::to_string(tick) + " at " +
                         cadence::format_timestamp(cadence::ms_to_timestamp(
                             report.polled_at_ms)) +
                         ": " + std::to_string(report.firing().size()) +
                         " firing, next check in " +
                         cadence::format_duration(report.next_sleep));
    if (ticks < 0 || tick + 1 < ticks) {
      sleep_interruptibly(report.next_sleep);
    }
  }

  log.info("main", "shutting down");
  log.stop();
  return 0;
}
