// =============================================================================
// solana_rpc_client_test.cpp
// =============================================================================
// Unit tests for swapcore::SolanaRpcClient over a scripted HTTP client.
//
// Validates:
//   - JSON-RPC envelopes for sendTransaction / getSignatureStatuses /
//     getBalance
//   - RPC error objects become RpcError with the node's code
//   - Signature status interpretation (null, processed, confirmed, err)
//   - Chain error rendering, including Jupiter custom codes
//   - Fee and received-amount extraction from getTransaction
// =============================================================================

#include "swapcore/chain/solana_rpc_client.hpp"
#include "swapcore/domain/asset_pair.hpp"
#include "swapcore/errors/errors.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <string>

using nlohmann::json;
using namespace swapcore_test;

namespace {

json rpcResult(const json& result) {
  return json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", result}};
}

json statusResult(const json& entry) {
  return rpcResult(json{{"context", {{"slot", 1}}},
                        {"value", json::array({entry})}});
}

const std::string kOwner = kWalletPublicKey;

}  // namespace

class SolanaRpcClientTest : public ::testing::Test {
 protected:
  FakeHttpClient http;
  swapcore::SolanaRpcClient rpc{http, "http://rpc.test", "confirmed"};
};

// -----------------------------------------------------------------------------
// 1. sendTransaction: base64 payload, preflight on, signature back.
// -----------------------------------------------------------------------------
TEST_F(SolanaRpcClientTest, SubmitSendsBase64AndReturnsSignature) {
  http.respondJson(rpcResult(kSignatureA));

  const std::string sig = rpc.submitTransaction({1, 2, 3});

  EXPECT_EQ(sig, kSignatureA);
  ASSERT_EQ(http.calls.size(), 1u);
  const auto& body = http.calls[0].body;
  EXPECT_EQ(http.calls[0].url, "http://rpc.test");
  EXPECT_EQ(body["jsonrpc"], "2.0");
  EXPECT_EQ(body["method"], "sendTransaction");
  EXPECT_EQ(body["params"][0], "AQID");
  EXPECT_EQ(body["params"][1]["encoding"], "base64");
  EXPECT_FALSE(body["params"][1]["skipPreflight"].get<bool>());
  EXPECT_EQ(body["params"][1]["preflightCommitment"], "confirmed");
}

TEST_F(SolanaRpcClientTest, RequestIdsIncrease) {
  http.respondJson(rpcResult(kSignatureA));
  http.respondJson(rpcResult(kSignatureA));
  rpc.submitTransaction({1});
  rpc.submitTransaction({1});
  EXPECT_LT(http.calls[0].body["id"].get<std::uint64_t>(),
            http.calls[1].body["id"].get<std::uint64_t>());
}

// -----------------------------------------------------------------------------
// 2. Node-side errors.
// -----------------------------------------------------------------------------
TEST_F(SolanaRpcClientTest, RpcErrorCarriesNodeCode) {
  http.respondJson(json{
      {"jsonrpc", "2.0"},
      {"id", 1},
      {"error",
       {{"code", -32002},
        {"message", "Transaction simulation failed: Blockhash not found"}}}});

  try {
    rpc.submitTransaction({1});
    FAIL() << "expected RpcError";
  } catch (const swapcore::RpcError& e) {
    EXPECT_EQ(e.code(), -32002);
    EXPECT_NE(std::string(e.what()).find("Blockhash not found"),
              std::string::npos);
  }
}

TEST_F(SolanaRpcClientTest, MalformedBodiesAreRpcErrors) {
  http.respond(200, "not json");
  EXPECT_THROW(rpc.submitTransaction({1}), swapcore::RpcError);

  http.respondJson(json{{"jsonrpc", "2.0"}, {"id", 1}});
  EXPECT_THROW(rpc.submitTransaction({1}), swapcore::RpcError);

  http.respondJson(rpcResult(42));
  EXPECT_THROW(rpc.submitTransaction({1}), swapcore::RpcError);
}

TEST_F(SolanaRpcClientTest, TransportErrorsPassThrough) {
  http.fail<swapcore::ConnectionError>("refused");
  EXPECT_THROW(rpc.submitTransaction({1}), swapcore::ConnectionError);

  http.respond(503, "");
  EXPECT_THROW(rpc.submitTransaction({1}), swapcore::ServerError);
}

// -----------------------------------------------------------------------------
// 3. Signature status.
// -----------------------------------------------------------------------------
TEST_F(SolanaRpcClientTest, StatusLevels) {
  http.respondJson(statusResult(nullptr));
  EXPECT_FALSE(rpc.getTransactionStatus(kSignatureA).confirmed);

  http.respondJson(statusResult(
      json{{"confirmationStatus", "processed"}, {"err", nullptr}}));
  EXPECT_FALSE(rpc.getTransactionStatus(kSignatureA).confirmed);

  http.respondJson(statusResult(
      json{{"confirmationStatus", "confirmed"}, {"err", nullptr}}));
  auto status = rpc.getTransactionStatus(kSignatureA);
  EXPECT_TRUE(status.confirmed);
  EXPECT_FALSE(status.error.has_value());

  EXPECT_EQ(http.calls.back().body["method"], "getSignatureStatuses");
  EXPECT_EQ(http.calls.back().body["params"][0][0], kSignatureA);
}

TEST_F(SolanaRpcClientTest, ErrorStatusIsFinalEvenWhenProcessed) {
  http.respondJson(statusResult(
      json{{"confirmationStatus", "processed"},
           {"err", {{"InstructionError", json::array({3, {{"Custom", 6001}}})}}}}));

  const auto status = rpc.getTransactionStatus(kSignatureA);
  EXPECT_TRUE(status.confirmed);
  ASSERT_TRUE(status.error.has_value());
  EXPECT_EQ(*status.error,
            "InstructionError at instruction 3: SlippageToleranceExceeded "
            "(custom program error 6001)");
}

TEST(SolanaChainErrorTest, RendersKnownShapes) {
  using swapcore::SolanaRpcClient;
  EXPECT_EQ(SolanaRpcClient::renderChainError("InsufficientFundsForFee"),
            "InsufficientFundsForFee");
  EXPECT_EQ(SolanaRpcClient::renderChainError(
                json{{"InstructionError", json::array({1, "InvalidAccountData"})}}),
            "InstructionError at instruction 1: InvalidAccountData");
  EXPECT_EQ(SolanaRpcClient::renderChainError(
                json{{"InstructionError", json::array({0, {{"Custom", 42}}})}}),
            "InstructionError at instruction 0: custom program error "
            "(custom program error 42)");
  EXPECT_EQ(SolanaRpcClient::renderChainError(json{{"Other", 1}}),
            "{\"Other\":1}");
}

// -----------------------------------------------------------------------------
// 4. getBalance.
// -----------------------------------------------------------------------------
TEST_F(SolanaRpcClientTest, BalanceReturnsLamports) {
  http.respondJson(rpcResult(json{{"context", {{"slot", 1}}},
                                  {"value", 2500000000ULL}}));

  EXPECT_EQ(rpc.getBalance(kOwner), 2500000000ULL);
  EXPECT_EQ(http.calls[0].body["method"], "getBalance");
  EXPECT_EQ(http.calls[0].body["params"][0], kOwner);
}

// -----------------------------------------------------------------------------
// 5. Transaction details.
// -----------------------------------------------------------------------------
TEST(SolanaTransactionDetailsTest, TokenOutputFromBalanceDelta) {
  const json balance_pre = json::array({
      {{"owner", kOwner},
       {"mint", swapcore::domain::kUsdtMint},
       {"uiTokenAmount", {{"amount", "1000000"}}}},
  });
  const json balance_post = json::array({
      {{"owner", kOwner},
       {"mint", swapcore::domain::kUsdtMint},
       {"uiTokenAmount", {{"amount", "2490000"}}}},
      {{"owner", "someone else"},
       {"mint", swapcore::domain::kUsdtMint},
       {"uiTokenAmount", {{"amount", "99999999"}}}},
  });
  const json result = {{"meta",
                        {{"fee", 5000},
                         {"preTokenBalances", balance_pre},
                         {"postTokenBalances", balance_post}}}};

  const auto details = swapcore::SolanaRpcClient::parseTransactionDetails(
      result, kOwner, swapcore::domain::kUsdtMint);

  ASSERT_TRUE(details.has_value());
  EXPECT_EQ(details->fee_lamports, 5000u);
  EXPECT_EQ(details->output_amount, 1490000u);
}

TEST(SolanaTransactionDetailsTest, NativeSolOutputAddsBackFee) {
  const json result = {{"meta",
                        {{"fee", 5000},
                         {"preBalances", {1000000000, 0}},
                         {"postBalances", {1004995000, 0}}}}};

  const auto details = swapcore::SolanaRpcClient::parseTransactionDetails(
      result, kOwner, swapcore::domain::kNativeSolMint);

  ASSERT_TRUE(details.has_value());
  EXPECT_EQ(details->output_amount, 5000000u);
}

TEST(SolanaTransactionDetailsTest, MissingMetaYieldsNothing) {
  EXPECT_FALSE(swapcore::SolanaRpcClient::parseTransactionDetails(
                   nullptr, kOwner, swapcore::domain::kUsdtMint)
                   .has_value());
  const auto no_output = swapcore::SolanaRpcClient::parseTransactionDetails(
      json{{"meta", {{"fee", 5000}}}}, kOwner, swapcore::domain::kUsdtMint);
  ASSERT_TRUE(no_output.has_value());
  EXPECT_FALSE(no_output->output_amount.has_value());
}

TEST_F(SolanaRpcClientTest, DetailsLookupFailureIsNullopt) {
  http.fail<swapcore::TimeoutError>("read timed out");
  EXPECT_FALSE(
      rpc.getTransactionDetails(kSignatureA, kOwner, swapcore::domain::kUsdtMint)
          .has_value());

  http.respondJson(rpcResult(nullptr));
  EXPECT_FALSE(
      rpc.getTransactionDetails(kSignatureA, kOwner, swapcore::domain::kUsdtMint)
          .has_value());
}
