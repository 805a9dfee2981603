#pragma once

#include "swapcore/time/i_time_provider.hpp"

namespace swapcore {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock and
//         blocks the calling thread for real in sleep_ms().
//
// @details
// Used by the CLI and the service in production. Keeping the chrono calls
// behind ITimeProvider means the retrier, poller and orchestrator are all
// testable with SimulationTimeProvider.
//
// Thread model:
//   Stateless. system_clock::now() and this_thread::sleep_for() are safe to
//   call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;

  // Blocks only the calling thread.
  void sleep_ms(std::int64_t duration_ms) override;
};

}  // namespace swapcore
