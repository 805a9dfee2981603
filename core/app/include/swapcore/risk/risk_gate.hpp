#pragma once

#include "swapcore/domain/trade_limits.hpp"
#include "swapcore/risk/circuit_breaker.hpp"
#include "swapcore/storage/i_execution_store.hpp"
#include "swapcore/time/i_time_provider.hpp"

#include <optional>
#include <string>

namespace swapcore {

struct RiskDecision {
  bool allowed{true};
  std::optional<std::string> reason;
};

// Live trades counted against the two caps at one instant.
struct TradeUsage {
  int today{0};
  int last_hour{0};
};

// -----------------------------------------------------------------------------
// RiskGate: pre-trade limits for live requests
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a live trade may proceed. Dry runs never reach it.
//
// @details
// Checks, in this order; the first failing one decides:
//   1. trades since 00:00 UTC today  >= max_trades_per_day
//        → "Daily trade limit reached (n/max)"
//   2. trades in the trailing 60 min >= max_trades_per_hour
//        → "Hourly trade limit reached (n/max)"
//   3. circuit breaker active
//        → kCircuitBreakerReason
//
// Counts are read from the execution store on every call, never cached, so
// concurrent attempts see the durable log. A store failure propagates as
// StorageError; the orchestrator turns it into a blocked record.
//
// Ownership:
//   Borrows the store, breaker and clock. All must outlive the gate.
// -----------------------------------------------------------------------------
class RiskGate {
 public:
  static constexpr const char* kCircuitBreakerReason =
      "Circuit breaker active: live trading halted";

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  store    Durable execution log the counts are read from.
  // @param  breaker  Halt flag shared with the orchestrator and service.
  // @param  clock    Source of "now" for the day and hour windows.
  // @param  limits   Caps, copied by value.
  // -------------------------------------------------------------------------
  RiskGate(IExecutionStore& store, CircuitBreaker& breaker,
           ITimeProvider& clock, domain::TradeLimits limits);

  // -------------------------------------------------------------------------
  // checkLimits()
  // -------------------------------------------------------------------------
  //
  // @brief  Evaluates the daily cap, the hourly cap and the breaker, in
  //         that order, against the store's current contents.
  //
  // @return allowed = true with no reason, or allowed = false with the
  //         reason of the first check that failed.
  //
  // @details
  // Only live attempts that reached the network count toward the caps; see
  // IExecutionStore::countLiveTradesSince(). The day window starts at
  // 00:00 UTC of clock.now_ms(); the hour window is the trailing 60 min.
  //
  // Thread-safety: Safe from any thread if the store is.
  // Side-effects:  Up to two store queries. Throws StorageError when one
  //                fails.
  // -------------------------------------------------------------------------
  RiskDecision checkLimits();

  // Both counts as checkLimits() would see them now. Used by STATUS.
  TradeUsage currentUsage();

  const domain::TradeLimits& limits() const { return limits_; }

 private:
  IExecutionStore& store_;
  CircuitBreaker& breaker_;
  ITimeProvider& clock_;
  domain::TradeLimits limits_;
};

}  // namespace swapcore
