#pragma once

#include "cadence/time/i_time_provider.hpp"

namespace cadence {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// The default clock for a running scheduler. Stateless, so a single instance
// may be shared by every component and evaluated from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  // Milliseconds since 1970-01-01 00:00:00 UTC.
  std::int64_t now_ms() const override;
};

}  // namespace cadence
