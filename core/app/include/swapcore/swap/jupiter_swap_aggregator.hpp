#pragma once

#include "swapcore/network/http_client.hpp"
#include "swapcore/retry/backoff_retrier.hpp"
#include "swapcore/swap/i_swap_aggregator.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace swapcore {

struct JupiterEndpoints {
  std::string quote_url{"https://quote-api.jup.ag/v6/quote"};
  std::string swap_url{"https://quote-api.jup.ag/v6/swap"};
};

// -----------------------------------------------------------------------------
// JupiterSwapAggregator: Jupiter v6 quote/swap adapter
// -----------------------------------------------------------------------------
//
// @brief  Implements ISwapAggregator over IHttpClient, each call wrapped in
//         a BackoffRetrier run.
//
// @details
// Quote:  GET quote_url?inputMint=&outputMint=&amount=&slippageBps=
//         The response must carry "outAmount" (decimal string or integer).
//         "inAmount" and "priceImpactPct" are optional. A body with an
//         "error" field is treated as unavailable.
//
// Build:  POST swap_url {quoteResponse, userPublicKey, wrapAndUnwrapSol}
//         The response must carry "swapTransaction" (base64).
//
// Retries cover transport faults, 429 and 5xx (TransientNetworkError).
// Parse failures and other 4xx fail on the first attempt. Whatever escapes
// is rethrown as QuoteUnavailable / TransactionBuildFailed.
//
// Ownership:
//   Borrows the HTTP client and retrier; both must outlive this adapter.
// -----------------------------------------------------------------------------
class JupiterSwapAggregator final : public ISwapAggregator {
 public:
  JupiterSwapAggregator(IHttpClient& http, BackoffRetrier& retrier,
                        JupiterEndpoints endpoints = {});

  domain::Quote getQuote(const std::string& input_mint,
                         const std::string& output_mint, std::uint64_t amount,
                         int slippage_bps) override;

  std::vector<std::uint8_t> buildSwapTransaction(
      const domain::Quote& quote, const std::string& user_public_key) override;

  // Parses a quote response body. Throws QuoteUnavailable when malformed.
  static domain::Quote parseQuote(const nlohmann::json& body,
                                  const std::string& input_mint,
                                  const std::string& output_mint,
                                  std::uint64_t requested_amount);

 private:
  domain::Quote fetchQuote(const std::string& input_mint,
                           const std::string& output_mint,
                           std::uint64_t amount, int slippage_bps);

  std::vector<std::uint8_t> fetchSwapTransaction(
      const domain::Quote& quote, const std::string& user_public_key);

  IHttpClient& http_;
  BackoffRetrier& retrier_;
  JupiterEndpoints endpoints_;
};

}  // namespace swapcore
