#include "swapcore/time/simulation_time_provider.hpp"

namespace swapcore {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_ms)
    : current_time_ms_(start_ms) {}

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// sleep_ms(): simulated delay, moves the clock forward
// -----------------------------------------------------------------------------
void SimulationTimeProvider::sleep_ms(std::int64_t duration_ms) {
  if (duration_ms <= 0) {
    return;
  }
  // fetch_add keeps concurrent sleepers from losing each other's advance.
  current_time_ms_.fetch_add(duration_ms);
  total_slept_ms_.fetch_add(duration_ms);
  sleep_count_.fetch_add(1);
}

// -----------------------------------------------------------------------------
// advance_time(): atomic write to the simulated clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  // Monotonicity is not enforced; tests set arbitrary times.
  current_time_ms_.store(new_time_ms);
}

std::int64_t SimulationTimeProvider::total_slept_ms() const {
  return total_slept_ms_.load();
}

std::int64_t SimulationTimeProvider::sleep_count() const {
  return sleep_count_.load();
}

}  // namespace swapcore
