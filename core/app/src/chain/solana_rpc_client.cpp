#include "swapcore/chain/solana_rpc_client.hpp"

#include "swapcore/codec/base64.hpp"
#include "swapcore/domain/asset_pair.hpp"
#include "swapcore/errors/errors.hpp"

#include <iostream>
#include <map>

namespace swapcore {

namespace {

constexpr long kJsonRpcParseError = -32700;

// Jupiter v6 program custom error codes seen in swap failures.
const std::map<std::int64_t, const char*>& jupiterErrorNames() {
  static const std::map<std::int64_t, const char*> names = {
      {6000, "EmptyRoute"},
      {6001, "SlippageToleranceExceeded"},
      {6017, "ExactOutAmountNotMatched"},
  };
  return names;
}

std::optional<std::int64_t> readTokenAmount(const nlohmann::json& entry) {
  if (!entry.contains("uiTokenAmount")) {
    return std::nullopt;
  }
  const auto& ui = entry["uiTokenAmount"];
  if (!ui.contains("amount") || !ui["amount"].is_string()) {
    return std::nullopt;
  }
  try {
    return std::stoll(ui["amount"].get<std::string>());
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

// Sum of `owner`'s balances of `mint` across a pre/postTokenBalances array.
std::int64_t sumTokenBalance(const nlohmann::json& balances,
                             const std::string& owner,
                             const std::string& mint) {
  std::int64_t total = 0;
  if (!balances.is_array()) {
    return total;
  }
  for (const auto& entry : balances) {
    if (entry.value("owner", std::string{}) != owner ||
        entry.value("mint", std::string{}) != mint) {
      continue;
    }
    if (auto amount = readTokenAmount(entry)) {
      total += *amount;
    }
  }
  return total;
}

}  // namespace

SolanaRpcClient::SolanaRpcClient(IHttpClient& http, std::string rpc_url,
                                 std::string commitment)
    : http_(http),
      rpc_url_(std::move(rpc_url)),
      commitment_(std::move(commitment)) {}

// -----------------------------------------------------------------------------
// call(): one JSON-RPC round trip, returns the "result" member
// -----------------------------------------------------------------------------
nlohmann::json SolanaRpcClient::call(const std::string& method,
                                     nlohmann::json params) {
  const nlohmann::json request = {
      {"jsonrpc", "2.0"},
      {"id", next_request_id_.fetch_add(1, std::memory_order_relaxed)},
      {"method", method},
      {"params", std::move(params)},
  };

  const HttpResponse response = http_.postJson(rpc_url_, request);
  throwForStatus(response, "rpc " + method);

  nlohmann::json body;
  try {
    body = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error& e) {
    throw RpcError("rpc " + method + " returned malformed JSON: " + e.what(),
                   kJsonRpcParseError);
  }

  if (body.contains("error") && !body["error"].is_null()) {
    const auto& err = body["error"];
    const long code = err.is_object() ? err.value("code", 0L) : 0L;
    const std::string message =
        err.is_object() ? err.value("message", err.dump()) : err.dump();
    throw RpcError("rpc " + method + " error " + std::to_string(code) + ": " +
                       message,
                   code);
  }
  if (!body.contains("result")) {
    throw RpcError("rpc " + method + " response has no result",
                   kJsonRpcParseError);
  }
  return body["result"];
}

std::string SolanaRpcClient::submitTransaction(
    const std::vector<std::uint8_t>& signed_transaction) {
  nlohmann::json params = nlohmann::json::array();
  params.push_back(codec::base64Encode(signed_transaction));
  params.push_back(nlohmann::json{
      {"encoding", "base64"},
      {"skipPreflight", false},
      {"preflightCommitment", commitment_},
  });

  const nlohmann::json result = call("sendTransaction", std::move(params));
  if (!result.is_string()) {
    throw RpcError("sendTransaction returned no signature",
                   kJsonRpcParseError);
  }
  return result.get<std::string>();
}

TransactionStatus SolanaRpcClient::getTransactionStatus(
    const std::string& signature) {
  nlohmann::json params = nlohmann::json::array();
  params.push_back(nlohmann::json::array({signature}));
  params.push_back(nlohmann::json{{"searchTransactionHistory", false}});

  const nlohmann::json result = call("getSignatureStatuses", std::move(params));
  if (!result.is_object() || !result.contains("value") ||
      !result["value"].is_array() || result["value"].empty()) {
    return TransactionStatus{};
  }
  return parseSignatureStatus(result["value"][0]);
}

std::uint64_t SolanaRpcClient::getBalance(const std::string& public_key) {
  nlohmann::json params = nlohmann::json::array();
  params.push_back(public_key);
  params.push_back(nlohmann::json{{"commitment", commitment_}});

  const nlohmann::json result = call("getBalance", std::move(params));
  if (!result.is_object() || !result.contains("value") ||
      !result["value"].is_number_unsigned()) {
    throw RpcError("getBalance returned no value", kJsonRpcParseError);
  }
  return result["value"].get<std::uint64_t>();
}

TransactionStatus SolanaRpcClient::parseSignatureStatus(
    const nlohmann::json& entry) {
  TransactionStatus status;
  if (!entry.is_object()) {
    return status;
  }

  if (entry.contains("err") && !entry["err"].is_null()) {
    status.confirmed = true;
    status.error = renderChainError(entry["err"]);
    return status;
  }

  if (entry.contains("confirmationStatus") &&
      entry["confirmationStatus"].is_string()) {
    const auto& level = entry["confirmationStatus"].get_ref<const std::string&>();
    status.confirmed = (level == "confirmed" || level == "finalized");
  }
  return status;
}

std::string SolanaRpcClient::renderChainError(const nlohmann::json& err) {
  if (err.is_string()) {
    return err.get<std::string>();
  }

  if (err.is_object() && err.contains("InstructionError")) {
    const auto& ie = err["InstructionError"];
    if (ie.is_array() && ie.size() == 2) {
      const std::string where =
          "InstructionError at instruction " + ie[0].dump() + ": ";
      const auto& detail = ie[1];
      if (detail.is_string()) {
        return where + detail.get<std::string>();
      }
      if (detail.is_object() && detail.contains("Custom") &&
          detail["Custom"].is_number_integer()) {
        const auto code = detail["Custom"].get<std::int64_t>();
        const auto& names = jupiterErrorNames();
        const auto it = names.find(code);
        const std::string name =
            it != names.end() ? it->second : "custom program error";
        return where + name + " (custom program error " +
               std::to_string(code) + ")";
      }
    }
  }
  return err.dump();
}

// -----------------------------------------------------------------------------
// getTransactionDetails(): best-effort fee and received amount
// -----------------------------------------------------------------------------
std::optional<TransactionDetails> SolanaRpcClient::getTransactionDetails(
    const std::string& signature, const std::string& owner,
    const std::string& output_mint) {
  nlohmann::json params = nlohmann::json::array();
  params.push_back(signature);
  params.push_back(nlohmann::json{
      {"encoding", "json"},
      {"commitment", commitment_},
      {"maxSupportedTransactionVersion", 0},
  });

  try {
    const nlohmann::json result = call("getTransaction", std::move(params));
    return parseTransactionDetails(result, owner, output_mint);
  } catch (const SwapCoreError& e) {
    std::cerr << "[SolanaRpcClient] getTransaction " << signature
              << " failed: " << e.what() << "\n";
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SolanaRpcClient] getTransaction " << signature
              << " returned an unexpected shape: " << e.what() << "\n";
  }
  return std::nullopt;
}

std::optional<TransactionDetails> SolanaRpcClient::parseTransactionDetails(
    const nlohmann::json& result, const std::string& owner,
    const std::string& output_mint) {
  if (!result.is_object() || !result.contains("meta") ||
      !result["meta"].is_object()) {
    return std::nullopt;
  }
  const auto& meta = result["meta"];

  TransactionDetails details;
  std::int64_t fee = 0;
  if (meta.contains("fee") && meta["fee"].is_number_integer()) {
    fee = meta["fee"].get<std::int64_t>();
    details.fee_lamports = static_cast<std::uint64_t>(fee);
  }

  std::int64_t received = 0;
  if (output_mint == domain::kNativeSolMint) {
    // Native SOL is unwrapped into the fee payer (index 0), which also paid
    // the fee.
    const auto& pre = meta.value("preBalances", nlohmann::json::array());
    const auto& post = meta.value("postBalances", nlohmann::json::array());
    if (pre.empty() || post.empty()) {
      return details;
    }
    received = post[0].get<std::int64_t>() - pre[0].get<std::int64_t>() + fee;
  } else {
    received = sumTokenBalance(meta.value("postTokenBalances", nlohmann::json()),
                               owner, output_mint) -
               sumTokenBalance(meta.value("preTokenBalances", nlohmann::json()),
                               owner, output_mint);
  }

  if (received > 0) {
    details.output_amount = static_cast<std::uint64_t>(received);
  }
  return details;
}

}  // namespace swapcore
