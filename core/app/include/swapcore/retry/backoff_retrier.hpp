#pragma once

#include "swapcore/errors/errors.hpp"
#include "swapcore/events/retry_event.hpp"
#include "swapcore/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace swapcore {

// -----------------------------------------------------------------------------
// RetryPolicy
// -----------------------------------------------------------------------------
// delay after failed attempt n (n starting at 1) =
//     base_delay_ms * backoff_factor^n
// With the defaults: 2000 ms after the first failure, 4000 ms after the
// second, and the third failure propagates.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{3};
  double backoff_factor{2.0};
  std::int64_t base_delay_ms{1000};
};

// -----------------------------------------------------------------------------
// BackoffRetrier: exponential-backoff wrapper for network calls
// -----------------------------------------------------------------------------
//
// @brief  Invokes an operation up to max_attempts times, sleeping between
//         attempts, retrying only on errors of class RetryOn.
//
// @details
// Classification is by exception type and nothing else:
//   - RetryOn (default TransientNetworkError: connection failures,
//     timeouts, HTTP 429 and 5xx) is caught, reported and retried.
//   - Any other exception propagates on the spot, from the first attempt.
//   - After the max_attempts-th failure the caught exception is rethrown
//     unchanged (same dynamic type, same message).
//
// The confirmation poller narrows RetryOn to ConnectionError for submission,
// because resubmitting after a timeout or 5xx could broadcast the same
// transaction twice.
//
// Sleeping goes through ITimeProvider::sleep_ms(), so with a
// SimulationTimeProvider the delays cost nothing and are observable.
//
// Observability:
//   Each failed attempt and each recovery produce a RetryEvent, handed to
//   the observer (if any) and logged to std::cerr.
//
// Thread model:
//   Stateless between calls; run() may be used concurrently from several
//   threads provided the observer is thread-safe.
//
// Ownership:
//   Holds a reference to the time provider, which must outlive it.
// -----------------------------------------------------------------------------
class BackoffRetrier {
 public:
  using RetryObserver = std::function<void(const RetryEvent&)>;

  // Throws std::invalid_argument if max_attempts < 1, backoff_factor <= 1
  // or base_delay_ms < 0.
  BackoffRetrier(RetryPolicy policy, ITimeProvider& clock,
                 RetryObserver observer = {});

  template <typename RetryOn = TransientNetworkError, typename Operation>
  auto run(const std::string& operation, Operation&& op) -> decltype(op());

  // Delay slept after the given failed attempt (1-based).
  std::int64_t delayForAttempt(int attempt) const;

  const RetryPolicy& policy() const { return policy_; }

 private:
  void report(const std::string& operation, int attempt, RetryOutcome outcome,
              const std::string& error_kind, const std::string& error_message,
              std::int64_t delay_ms) const;

  RetryPolicy policy_;
  ITimeProvider& clock_;
  RetryObserver observer_;
};

// -----------------------------------------------------------------------------
// run<RetryOn>(operation, op)
// -----------------------------------------------------------------------------
template <typename RetryOn, typename Operation>
auto BackoffRetrier::run(const std::string& operation, Operation&& op)
    -> decltype(op()) {
  static_assert(std::is_base_of_v<SwapCoreError, RetryOn>,
                "RetryOn must be a SwapCoreError");

  std::string last_kind;
  std::string last_message;

  for (int attempt = 1;; ++attempt) {
    try {
      if constexpr (std::is_void_v<decltype(op())>) {
        op();
        if (attempt > 1) {
          report(operation, attempt, RetryOutcome::Recovered, last_kind,
                 last_message, 0);
        }
        return;
      } else {
        auto result = op();
        if (attempt > 1) {
          report(operation, attempt, RetryOutcome::Recovered, last_kind,
                 last_message, 0);
        }
        return result;
      }
    } catch (const RetryOn& e) {
      last_kind = e.kind();
      last_message = e.what();

      if (attempt >= policy_.max_attempts) {
        report(operation, attempt, RetryOutcome::GaveUp, last_kind,
               last_message, 0);
        throw;
      }

      const std::int64_t delay = delayForAttempt(attempt);
      report(operation, attempt, RetryOutcome::Retrying, last_kind,
             last_message, delay);
      clock_.sleep_ms(delay);
    }
  }
}

}  // namespace swapcore
