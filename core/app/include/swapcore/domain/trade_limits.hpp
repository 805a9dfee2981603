#pragma once

namespace swapcore {
namespace domain {

// -----------------------------------------------------------------------------
// TradeLimits: hard risk thresholds for live trading
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of risk parameters applied before any trade
//         touches the network.
//
// @details
// max_trade_size is checked by ExecutionOrchestrator for every request, dry
// run included. The two counters are checked by RiskGate for live requests
// only, against counts read fresh from the execution store.
//
// Thread model:
//   Plain value type, copied into components at construction time.
// -----------------------------------------------------------------------------
struct TradeLimits {
  /// Largest single trade, in base-asset units (e.g. SOL).
  double max_trade_size{0.1};

  /// Live trades allowed per UTC calendar day.
  int max_trades_per_day{20};

  /// Live trades allowed in any trailing 60-minute window.
  int max_trades_per_hour{5};
};

}  // namespace domain
}  // namespace swapcore
