#include "swapcore/swap/jupiter_swap_aggregator.hpp"

#include "swapcore/codec/base64.hpp"
#include "swapcore/errors/errors.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

namespace swapcore {

namespace {

// Jupiter encodes token amounts as decimal strings; accept plain integers too.
std::optional<std::uint64_t> readAmount(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
  }
  if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    if (text.empty() ||
        text.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
    try {
      return std::stoull(text);
    } catch (const std::out_of_range&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

double readPercent(const nlohmann::json& value) {
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    try {
      return std::stod(value.get<std::string>());
    } catch (const std::logic_error&) {
      return 0.0;
    }
  }
  return 0.0;
}

nlohmann::json parseBody(const HttpResponse& response) {
  return nlohmann::json::parse(response.body);
}

std::string shortMint(const std::string& mint) { return mint.substr(0, 8); }

}  // namespace

JupiterSwapAggregator::JupiterSwapAggregator(IHttpClient& http,
                                             BackoffRetrier& retrier,
                                             JupiterEndpoints endpoints)
    : http_(http), retrier_(retrier), endpoints_(std::move(endpoints)) {}

// -----------------------------------------------------------------------------
// getQuote(): retried fetch, every escaping error mapped to QuoteUnavailable
// -----------------------------------------------------------------------------
domain::Quote JupiterSwapAggregator::getQuote(const std::string& input_mint,
                                              const std::string& output_mint,
                                              std::uint64_t amount,
                                              int slippage_bps) {
  try {
    return retrier_.run("jupiter quote", [&] {
      return fetchQuote(input_mint, output_mint, amount, slippage_bps);
    });
  } catch (const QuoteUnavailable&) {
    throw;
  } catch (const SwapCoreError& e) {
    throw QuoteUnavailable(std::string("quote request failed: ") + e.kind() +
                           ": " + e.what());
  }
}

domain::Quote JupiterSwapAggregator::fetchQuote(const std::string& input_mint,
                                                const std::string& output_mint,
                                                std::uint64_t amount,
                                                int slippage_bps) {
  const QueryParams params{
      {"inputMint", input_mint},
      {"outputMint", output_mint},
      {"amount", std::to_string(amount)},
      {"slippageBps", std::to_string(slippage_bps)},
  };

  const HttpResponse response = http_.get(endpoints_.quote_url, params);
  throwForStatus(response, "quote");

  nlohmann::json body;
  try {
    body = parseBody(response);
  } catch (const nlohmann::json::parse_error& e) {
    throw QuoteUnavailable(std::string("malformed quote payload: ") + e.what());
  }

  domain::Quote quote = parseQuote(body, input_mint, output_mint, amount);

  std::cout << "[JupiterSwapAggregator] quote " << shortMint(input_mint)
            << " -> " << shortMint(output_mint) << " in=" << quote.in_amount
            << " out=" << quote.out_amount
            << " impact=" << quote.price_impact_pct << "%\n";
  return quote;
}

domain::Quote JupiterSwapAggregator::parseQuote(const nlohmann::json& body,
                                                const std::string& input_mint,
                                                const std::string& output_mint,
                                                std::uint64_t requested_amount) {
  if (!body.is_object()) {
    throw QuoteUnavailable("malformed quote payload: not a JSON object");
  }
  if (body.contains("error")) {
    const auto& err = body["error"];
    throw QuoteUnavailable("aggregator returned error: " +
                           (err.is_string() ? err.get<std::string>()
                                            : err.dump()));
  }
  if (!body.contains("outAmount")) {
    throw QuoteUnavailable("malformed quote payload: missing outAmount");
  }

  const auto out_amount = readAmount(body["outAmount"]);
  if (!out_amount) {
    throw QuoteUnavailable("malformed quote payload: invalid outAmount " +
                           body["outAmount"].dump());
  }

  domain::Quote quote;
  quote.input_mint = input_mint;
  quote.output_mint = output_mint;
  quote.out_amount = *out_amount;
  quote.in_amount = requested_amount;
  if (body.contains("inAmount")) {
    if (auto in_amount = readAmount(body["inAmount"])) {
      quote.in_amount = *in_amount;
    }
  }
  if (body.contains("priceImpactPct")) {
    quote.price_impact_pct = readPercent(body["priceImpactPct"]);
  }
  quote.raw = body;
  return quote;
}

// -----------------------------------------------------------------------------
// buildSwapTransaction(): retried POST, errors mapped to TransactionBuildFailed
// -----------------------------------------------------------------------------
std::vector<std::uint8_t> JupiterSwapAggregator::buildSwapTransaction(
    const domain::Quote& quote, const std::string& user_public_key) {
  try {
    return retrier_.run("jupiter swap build", [&] {
      return fetchSwapTransaction(quote, user_public_key);
    });
  } catch (const TransactionBuildFailed&) {
    throw;
  } catch (const SwapCoreError& e) {
    throw TransactionBuildFailed(std::string("swap build failed: ") +
                                 e.kind() + ": " + e.what());
  }
}

std::vector<std::uint8_t> JupiterSwapAggregator::fetchSwapTransaction(
    const domain::Quote& quote, const std::string& user_public_key) {
  const nlohmann::json payload = {
      {"quoteResponse", quote.raw},
      {"userPublicKey", user_public_key},
      {"wrapAndUnwrapSol", true},
  };

  const HttpResponse response = http_.postJson(endpoints_.swap_url, payload);
  throwForStatus(response, "swap build");

  nlohmann::json body;
  try {
    body = parseBody(response);
  } catch (const nlohmann::json::parse_error& e) {
    throw TransactionBuildFailed(std::string("malformed swap payload: ") +
                                 e.what());
  }

  if (!body.is_object() || !body.contains("swapTransaction") ||
      !body["swapTransaction"].is_string()) {
    throw TransactionBuildFailed("swap payload has no swapTransaction");
  }

  std::vector<std::uint8_t> tx;
  try {
    tx = codec::base64Decode(body["swapTransaction"].get<std::string>());
  } catch (const std::invalid_argument& e) {
    throw TransactionBuildFailed(std::string("swapTransaction is not base64: ") +
                                 e.what());
  }
  if (tx.empty()) {
    throw TransactionBuildFailed("swapTransaction is empty");
  }

  std::cout << "[JupiterSwapAggregator] swap transaction built, " << tx.size()
            << " bytes\n";
  return tx;
}

}  // namespace swapcore
