#include "swapcore/risk/risk_gate.hpp"

#include <iostream>

namespace swapcore {

RiskGate::RiskGate(IExecutionStore& store, CircuitBreaker& breaker,
                   ITimeProvider& clock, domain::TradeLimits limits)
    : store_(store), breaker_(breaker), clock_(clock), limits_(limits) {}

TradeUsage RiskGate::currentUsage() {
  const std::int64_t now = clock_.now_ms();
  TradeUsage usage;
  usage.today = store_.countLiveTradesSince(
      ms_to_timestamp(start_of_utc_day_ms(now)));
  usage.last_hour =
      store_.countLiveTradesSince(ms_to_timestamp(now - kMillisPerHour));
  return usage;
}

// -----------------------------------------------------------------------------
// checkLimits(): daily, then hourly, then breaker
// -----------------------------------------------------------------------------
RiskDecision RiskGate::checkLimits() {
  const std::int64_t now = clock_.now_ms();

  const int today = store_.countLiveTradesSince(
      ms_to_timestamp(start_of_utc_day_ms(now)));
  if (today >= limits_.max_trades_per_day) {
    return RiskDecision{false, "Daily trade limit reached (" +
                                   std::to_string(today) + "/" +
                                   std::to_string(limits_.max_trades_per_day) +
                                   ")"};
  }

  const int last_hour =
      store_.countLiveTradesSince(ms_to_timestamp(now - kMillisPerHour));
  if (last_hour >= limits_.max_trades_per_hour) {
    return RiskDecision{false, "Hourly trade limit reached (" +
                                   std::to_string(last_hour) + "/" +
                                   std::to_string(limits_.max_trades_per_hour) +
                                   ")"};
  }

  if (breaker_.isActive()) {
    std::cerr << "[RiskGate] breaker active (" << breaker_.reason() << ")\n";
    return RiskDecision{false, std::string(kCircuitBreakerReason)};
  }

  return RiskDecision{true, std::nullopt};
}

}  // namespace swapcore
