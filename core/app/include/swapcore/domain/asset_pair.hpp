#pragma once

#include "swapcore/domain/trade_action.hpp"

#include <cmath>
#include <cstdint>
#include <string>

namespace swapcore {
namespace domain {

// Wrapped SOL mint; the aggregator wraps/unwraps native SOL around it.
inline constexpr const char* kNativeSolMint =
    "So11111111111111111111111111111111111111112";
inline constexpr const char* kUsdtMint =
    "Es9vMFrzaCERmJfrF4H2FYD4KCoNkY11McCe8BenwNYB";

// -----------------------------------------------------------------------------
// AssetPair: the single pair this engine trades
// -----------------------------------------------------------------------------
//
// @brief  Base and quote asset mints with their on-chain decimal places.
//
// @details
// Amounts in a TradeRequest are denominated in the base asset (e.g. 0.01
// SOL). The aggregator works in integer smallest units, so every amount is
// scaled by 10^decimals of the asset it refers to.
//
// Defaults: base = SOL (9 decimals), quote = USDT (6 decimals).
// -----------------------------------------------------------------------------
struct AssetPair {
  std::string base_mint{kNativeSolMint};
  int base_decimals{9};
  std::string quote_mint{kUsdtMint};
  int quote_decimals{6};
};

// -----------------------------------------------------------------------------
// SwapLeg: the resolved direction of one trade
// -----------------------------------------------------------------------------
// Buy:  quote → base.  Sell: base → quote.
// -----------------------------------------------------------------------------
struct SwapLeg {
  std::string input_mint;
  std::string output_mint;
  int input_decimals{0};
  int output_decimals{0};
};

inline SwapLeg resolveSwapLeg(const AssetPair& pair, TradeAction action) {
  if (action == TradeAction::Buy) {
    return SwapLeg{pair.quote_mint, pair.base_mint, pair.quote_decimals,
                   pair.base_decimals};
  }
  return SwapLeg{pair.base_mint, pair.quote_mint, pair.base_decimals,
                 pair.quote_decimals};
}

// Converts a display amount to integer smallest units (rounded).
inline std::uint64_t toSmallestUnits(double amount, int decimals) {
  return static_cast<std::uint64_t>(
      std::llround(amount * std::pow(10.0, decimals)));
}

// Converts integer smallest units back to a display amount.
inline double fromSmallestUnits(std::uint64_t units, int decimals) {
  return static_cast<double>(units) / std::pow(10.0, decimals);
}

}  // namespace domain
}  // namespace swapcore
