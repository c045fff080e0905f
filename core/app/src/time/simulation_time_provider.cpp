#include "cadence/time/simulation_time_provider.hpp"

namespace cadence {

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): atomic write to the simulated clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

// -----------------------------------------------------------------------------
// advance_by(): atomic relative move
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_by(std::chrono::milliseconds delta) {
  // fetch_add keeps the read-modify-write atomic, so two concurrent
  // advance_by() calls both take effect.
  current_time_ms_.fetch_add(delta.count());
}

}  // namespace cadence
