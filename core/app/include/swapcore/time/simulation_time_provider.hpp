#pragma once

#include "swapcore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace swapcore {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock for deterministic tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly and whose
//         sleep_ms() advances the clock instead of blocking.
//
// @details
// A confirmation poll loop with a 30 s timeout at 1 s intervals runs in
// microseconds under this provider, and performs exactly 30 polls no matter
// how loaded the test machine is. Backoff delays are likewise observable as
// clock movement: after a retrier slept 2 s and 4 s, now_ms() has moved by
// 6000.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_ is lock-free on 64-bit platforms,
//   so concurrent readers never contend with the (rare) writers.
//
// Thread model:
//   All operations are atomic. When several threads sleep concurrently the
//   clock advances by the sum of their delays; tests that depend on exact
//   clock values drive a single thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at start_ms (0 = epoch) until advance_time() is called.
  explicit SimulationTimeProvider(std::int64_t start_ms = 0);

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // sleep_ms(duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Advances the clock by duration_ms and returns immediately.
  //
  // @details
  // Also accumulates the total slept time so tests can assert on the sum of
  // backoff delays independently of any advance_time() calls.
  // -------------------------------------------------------------------------
  void sleep_ms(std::int64_t duration_ms) override;

  // Sets the clock to the given epoch milliseconds.
  void advance_time(std::int64_t new_time_ms);

  // Total milliseconds passed to sleep_ms() since construction.
  std::int64_t total_slept_ms() const;

  // Number of sleep_ms() calls with a positive duration.
  std::int64_t sleep_count() const;

 private:
  std::atomic<std::int64_t> current_time_ms_;
  std::atomic<std::int64_t> total_slept_ms_{0};
  std::atomic<std::int64_t> sleep_count_{0};
};

}  // namespace swapcore
