#pragma once

#include <cstdint>

namespace swapcore {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source and delay interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" and "wait for
//         a while" away from std::chrono and std::this_thread.
//
// @details
// The execution engine waits in two places: between retry attempts of a
// network call (exponential backoff) and between confirmation polls of a
// submitted transaction. It also timestamps every execution record and
// measures how long each attempt took.
//
// If components called system_clock::now() and sleep_for() directly, a unit
// test of a 30-second confirmation timeout would take 30 real seconds and
// the number of polls would depend on scheduler jitter. ITimeProvider
// solves this with dependency injection:
//   - LiveTimeProvider       → system_clock + std::this_thread::sleep_for.
//   - SimulationTimeProvider → a clock that only moves when told to; its
//                              sleep_ms() advances the clock instantly.
//
// Why int64_t milliseconds instead of std::chrono types:
//   - Aggregator and RPC payloads carry integer timestamps.
//   - Millisecond resolution is more than enough for network backoff and
//     confirmation polling, which operate on the order of seconds.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent use from multiple threads.
//   Several trade attempts may be sleeping on the same provider at once.
//
// Ownership:
//   Components hold a reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
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

  // -------------------------------------------------------------------------
  // sleep_ms(duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Suspends the calling task for duration_ms milliseconds.
  //
  // @param  duration_ms  Delay length. Values <= 0 return immediately.
  //
  // @details
  // Only the calling thread is suspended; other trade attempts keep running
  // on their own threads. After sleep_ms(d) returns, now_ms() has advanced
  // by at least d.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual void sleep_ms(std::int64_t duration_ms) = 0;
};

}  // namespace swapcore
