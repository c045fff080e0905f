#pragma once

#include <cstdint>

namespace cadence {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts the concept of "current time"
//         away from std::chrono::system_clock.
//
// @details
// Every condition reads "now" through this interface instead of calling
// std::chrono::system_clock::now() itself. The caller decides which clock to
// inject:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value pinned by a test or a replay.
//
// The clock is passed explicitly to Condition::evaluate(). There is no
// class-level "test mode": two tests may evaluate the same condition against
// two different clocks without interfering with each other.
//
// Resolution is milliseconds since the Unix epoch. Time windows work with
// Timestamp values; time_utils.hpp converts between the two.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   Writers (e.g. SimulationTimeProvider::advance_time) must synchronize
//   with readers internally (e.g. via std::atomic).
//
// Ownership:
//   Conditions and the poller borrow the provider by const reference for the
//   duration of one call; they never store it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch
  //         (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace cadence
