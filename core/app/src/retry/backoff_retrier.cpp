#include "swapcore/retry/backoff_retrier.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace swapcore {

BackoffRetrier::BackoffRetrier(RetryPolicy policy, ITimeProvider& clock,
                               RetryObserver observer)
    : policy_(policy), clock_(clock), observer_(std::move(observer)) {
  if (policy_.max_attempts < 1) {
    throw std::invalid_argument("retry max_attempts must be >= 1");
  }
  if (!(policy_.backoff_factor > 1.0)) {
    throw std::invalid_argument("retry backoff_factor must be > 1");
  }
  if (policy_.base_delay_ms < 0) {
    throw std::invalid_argument("retry base_delay_ms must be >= 0");
  }
}

std::int64_t BackoffRetrier::delayForAttempt(int attempt) const {
  return static_cast<std::int64_t>(std::llround(
      static_cast<double>(policy_.base_delay_ms) *
      std::pow(policy_.backoff_factor, attempt)));
}

void BackoffRetrier::report(const std::string& operation, int attempt,
                            RetryOutcome outcome,
                            const std::string& error_kind,
                            const std::string& error_message,
                            std::int64_t delay_ms) const {
  switch (outcome) {
    case RetryOutcome::Retrying:
      std::cerr << "[BackoffRetrier] " << operation << " attempt " << attempt
                << "/" << policy_.max_attempts << " failed (" << error_kind
                << ": " << error_message << "), retrying in " << delay_ms
                << " ms\n";
      break;
    case RetryOutcome::Recovered:
      std::cout << "[BackoffRetrier] " << operation << " succeeded on attempt "
                << attempt << "\n";
      break;
    case RetryOutcome::GaveUp:
      std::cerr << "[BackoffRetrier] " << operation << " failed after "
                << attempt << " attempt(s): " << error_kind << ": "
                << error_message << "\n";
      break;
  }

  if (!observer_) {
    return;
  }

  RetryEvent event;
  event.operation = operation;
  event.attempt = attempt;
  event.max_attempts = policy_.max_attempts;
  event.error_kind = error_kind;
  event.error_message = error_message;
  event.delay_ms = delay_ms;
  event.outcome = outcome;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  observer_(event);
}

}  // namespace swapcore
