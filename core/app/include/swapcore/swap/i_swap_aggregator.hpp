#pragma once

#include "swapcore/domain/quote.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace swapcore {

// -----------------------------------------------------------------------------
// ISwapAggregator: quote and swap-build endpoints of a DEX aggregator
// -----------------------------------------------------------------------------
//
// @brief  Price discovery and unsigned transaction construction. Never signs.
//
// @details
// getQuote() throws QuoteUnavailable for every failure: an HTTP error,
// transient faults that outlasted the retry budget, or a malformed payload.
// buildSwapTransaction() throws TransactionBuildFailed likewise.
// Implementations apply their own retry policy to both calls.
//
// Keeping quote and build separate lets a dry run stop after the quote,
// with no build call and no wallet access.
// -----------------------------------------------------------------------------
class ISwapAggregator {
 public:
  virtual ~ISwapAggregator() = default;

  // amount is in smallest units of the *base* asset (see AssetPair).
  virtual domain::Quote getQuote(const std::string& input_mint,
                                 const std::string& output_mint,
                                 std::uint64_t amount, int slippage_bps) = 0;

  // Returns the serialized unsigned transaction.
  virtual std::vector<std::uint8_t> buildSwapTransaction(
      const domain::Quote& quote, const std::string& user_public_key) = 0;
};

}  // namespace swapcore
