#pragma once

#include "swapcore/domain/asset_pair.hpp"
#include "swapcore/domain/quote.hpp"
#include "swapcore/domain/trade_action.hpp"
#include "swapcore/risk/circuit_breaker.hpp"

#include <mutex>
#include <optional>

namespace swapcore {

// -----------------------------------------------------------------------------
// PriceMoveMonitor: automatic circuit-breaker trigger
// -----------------------------------------------------------------------------
//
// @brief  Tracks the base-asset price implied by successive quotes and trips
//         the breaker when it jumps by at least threshold_pct percent.
//
// @details
// Implied price, in quote-asset units per base-asset unit:
//   SELL (base → quote): (out / 10^quote_dec) / (in  / 10^base_dec)
//   BUY  (quote → base): (in  / 10^quote_dec) / (out / 10^base_dec)
//
// The first observation only sets the reference. Each later one is compared
// with the previous price and then becomes the new reference, so a slow
// drift never trips, only a jump between two consecutive quotes.
//
// Quotes with a zero amount are ignored.
//
// threshold_pct <= 0 disables the monitor.
//
// Thread model: observe() is thread-safe.
// -----------------------------------------------------------------------------
class PriceMoveMonitor {
 public:
  PriceMoveMonitor(CircuitBreaker& breaker, domain::AssetPair pair,
                   double threshold_pct);

  // Returns true if this observation tripped the breaker.
  bool observe(domain::TradeAction action, const domain::Quote& quote);

  std::optional<double> lastPrice() const;

  static std::optional<double> impliedPrice(domain::TradeAction action,
                                            const domain::Quote& quote,
                                            const domain::AssetPair& pair);

 private:
  CircuitBreaker& breaker_;
  domain::AssetPair pair_;
  double threshold_pct_;

  mutable std::mutex mutex_;
  std::optional<double> last_price_;
};

}  // namespace swapcore
