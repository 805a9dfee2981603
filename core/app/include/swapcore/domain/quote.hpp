#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace swapcore {
namespace domain {

// -----------------------------------------------------------------------------
// Quote
// -----------------------------------------------------------------------------
// Responsibility: A priced, short-lived estimate from the swap aggregator.
//
// @details
// Amounts are integer smallest units of the respective mint. The aggregator's
// original response body is kept in `raw` because the swap-build endpoint
// wants it back verbatim as `quoteResponse`.
//
// Ownership: Created by ISwapAggregator::getQuote(), owned by the
// orchestrator for the duration of one attempt, never persisted.
// -----------------------------------------------------------------------------
struct Quote {
  std::string input_mint;
  std::string output_mint;
  std::uint64_t in_amount{0};
  std::uint64_t out_amount{0};
  double price_impact_pct{0.0};
  nlohmann::json raw;
};

}  // namespace domain
}  // namespace swapcore
