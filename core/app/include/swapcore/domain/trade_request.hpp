#pragma once

#include "swapcore/domain/trade_action.hpp"

namespace swapcore {
namespace domain {

// Largest slippage tolerance representable in basis points (100 %).
constexpr int kMaxSlippageBps = 10000;

// -----------------------------------------------------------------------------
// TradeRequest
// -----------------------------------------------------------------------------
// Responsibility: One caller's intent, built per call and discarded after.
//   action        Buy or Sell; determines the mint pair (see resolveSwapLeg).
//   amount        Base-asset units, must be finite and > 0.
//   slippage_bps  0..10000; enforced on chain by the swap program.
//   dry_run       Quote only. No wallet, no build, no submission.
// Callers fill slippage_bps from configuration when the user gives none.
// -----------------------------------------------------------------------------
struct TradeRequest {
  TradeAction action{TradeAction::Buy};
  double amount{0.0};
  int slippage_bps{50};
  bool dry_run{true};
};

}  // namespace domain
}  // namespace swapcore
