#pragma once

#include "swapcore/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace swapcore {

enum class RetryOutcome {
  Retrying,   // attempt failed transiently, sleeping delay_ms before the next
  Recovered,  // attempt succeeded after at least one earlier failure
  GaveUp,     // final attempt failed; the error propagates to the caller
};

inline const char* toString(RetryOutcome outcome) {
  switch (outcome) {
    case RetryOutcome::Retrying:  return "retrying";
    case RetryOutcome::Recovered: return "recovered";
    case RetryOutcome::GaveUp:    return "gave_up";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// RetryEvent: observability record emitted by BackoffRetrier
// -----------------------------------------------------------------------------
//
// @brief  One event per failed attempt, plus one on recovery.
//
// @details
// A first-try success emits nothing. For an operation that fails twice and
// then succeeds, the sequence is:
//
//   {attempt=1, Retrying, delay_ms=2000}
//   {attempt=2, Retrying, delay_ms=4000}
//   {attempt=3, Recovered}
//
// error_kind / error_message describe the most recent failure (for
// Recovered, the failure that preceded the successful attempt).
//
// Ownership:
//   Value type. Safe to copy across threads inside the Event variant.
// -----------------------------------------------------------------------------
struct RetryEvent {
  std::string operation;
  int attempt{0};
  int max_attempts{0};
  std::string error_kind;
  std::string error_message;
  std::int64_t delay_ms{0};
  RetryOutcome outcome{RetryOutcome::Retrying};
  Timestamp timestamp{};
};

}  // namespace swapcore
