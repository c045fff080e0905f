#pragma once

#include "cadence/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace cadence {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock for tests and replays
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         rather than read from the system clock.
//
// @details
// Tests pin the clock to a known instant, evaluate a condition, then move
// the clock and evaluate again:
//
//   SimulationTimeProvider clock{utc_ms(2024, 1, 1, 9)};
//   EXPECT_TRUE(office_hours->evaluate(clock));
//   clock.advance_by(std::chrono::hours(9));
//   EXPECT_FALSE(office_hours->evaluate(clock));
//
// Each test owns its own instance, so pinning time in one test never leaks
// into another and never touches the live clock used elsewhere.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_
//
// Thread model:
//   advance_time()/advance_by() and now_ms() are individually atomic. The
//   clock should not be moved while another thread is in the middle of
//   evaluating a composite condition against it, since the composite could
//   then observe two different instants.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at 0 ms (the epoch) unless told otherwise.
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given timestamp.
  //
  // @details
  // Monotonicity is not enforced: tests are free to move the clock
  // backwards to probe a window from both sides.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward (or backward, for a negative delta) relative to
  // its current value.
  void advance_by(std::chrono::milliseconds delta);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace cadence
