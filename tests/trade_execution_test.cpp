// =============================================================================
// trade_execution_test.cpp
// =============================================================================
// Unit tests for the domain types and their JSON views.
//
// Validates:
//   - TradeExecution derives status from its outcome and exposes only the
//     fields that apply to it
//   - The constructor rejects malformed signatures, bad outputs and empty
//     failure messages, and accepts signatures shortened by leading zeros
//   - Action parsing, swap-leg resolution and unit conversion
//   - toJson / tradeRequestFromJson / eventToJson shapes
// =============================================================================

#include "swapcore/codec/base58.hpp"
#include "swapcore/domain/asset_pair.hpp"
#include "swapcore/domain/trade_execution.hpp"
#include "swapcore/serialization/execution_json.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using swapcore::domain::ExecutionStatus;
using swapcore::domain::FailureKind;
using swapcore::domain::TradeAction;
using namespace swapcore_test;

namespace {

constexpr std::int64_t kNoonUtc = 1773144000000;  // 2026-03-10T12:00:00Z

swapcore::domain::TradeAttempt makeAttempt() {
  swapcore::domain::TradeAttempt a;
  a.timestamp = swapcore::ms_to_timestamp(kNoonUtc + 250);
  a.action = TradeAction::Sell;
  a.input_mint = swapcore::domain::kNativeSolMint;
  a.output_mint = swapcore::domain::kUsdtMint;
  a.input_amount = 0.01;
  a.expected_output = 1.5;
  a.slippage_bps = 50;
  a.duration_ms = 1750;
  return a;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Each outcome exposes its own fields and nothing else.
// -----------------------------------------------------------------------------
TEST(TradeExecutionTest, SuccessCarriesSignatureAndAmounts) {
  swapcore::domain::SuccessOutcome s;
  s.transaction_signature = kSignatureA;
  s.output_amount = 1.49;
  s.fee_paid = 0.000005;

  const swapcore::domain::TradeExecution record(makeAttempt(), s);

  EXPECT_EQ(record.status(), ExecutionStatus::Success);
  EXPECT_EQ(record.transactionSignature(), kSignatureA);
  EXPECT_DOUBLE_EQ(*record.outputAmount(), 1.49);
  EXPECT_DOUBLE_EQ(*record.feePaid(), 0.000005);
  EXPECT_FALSE(record.feeEstimated());
  EXPECT_FALSE(record.errorMessage().has_value());
  EXPECT_FALSE(record.failureKind().has_value());
}

TEST(TradeExecutionTest, DryRunHasNoSignature) {
  const swapcore::domain::TradeExecution record(
      makeAttempt(), swapcore::domain::DryRunOutcome{});

  EXPECT_EQ(record.status(), ExecutionStatus::DryRun);
  EXPECT_FALSE(record.transactionSignature().has_value());
  EXPECT_FALSE(record.outputAmount().has_value());
  EXPECT_DOUBLE_EQ(*record.expectedOutput(), 1.5);
}

TEST(TradeExecutionTest, FailureCarriesKindAndMessage) {
  const swapcore::domain::TradeExecution record(
      makeAttempt(), swapcore::domain::FailureOutcome{
                         FailureKind::OnChainError, "slippage exceeded"});

  EXPECT_EQ(record.status(), ExecutionStatus::Failed);
  EXPECT_EQ(record.failureKind(), FailureKind::OnChainError);
  EXPECT_EQ(record.errorMessage(), "slippage exceeded");
  EXPECT_FALSE(record.transactionSignature().has_value());
}

TEST(TradeExecutionTest, DefaultOutcomeIsPending) {
  const swapcore::domain::TradeExecution record(
      makeAttempt(), swapcore::domain::PendingOutcome{});
  EXPECT_EQ(record.status(), ExecutionStatus::Pending);
}

// -----------------------------------------------------------------------------
// 2. Invariants the variant cannot express on its own.
// Why: A "success" with a placeholder signature would be counted as a real
//      trade and sent to the operator as proof of execution.
// -----------------------------------------------------------------------------
TEST(TradeExecutionTest, RejectsMalformedSuccess) {
  swapcore::domain::SuccessOutcome s;
  s.output_amount = 1.0;

  s.transaction_signature = "SIG1";
  EXPECT_THROW(swapcore::domain::TradeExecution(makeAttempt(), s),
               std::invalid_argument);

  s.transaction_signature = kSignatureA.substr(0, 86);
  EXPECT_THROW(swapcore::domain::TradeExecution(makeAttempt(), s),
               std::invalid_argument);

  s.transaction_signature = kSignatureA;
  s.transaction_signature[10] = '0';
  EXPECT_THROW(swapcore::domain::TradeExecution(makeAttempt(), s),
               std::invalid_argument);

  s.transaction_signature = kSignatureB;
  s.output_amount = -1.0;
  EXPECT_THROW(swapcore::domain::TradeExecution(makeAttempt(), s),
               std::invalid_argument);

  s.output_amount = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(swapcore::domain::TradeExecution(makeAttempt(), s),
               std::invalid_argument);
}

TEST(TradeExecutionTest, RejectsFailureWithoutMessage) {
  EXPECT_THROW(swapcore::domain::TradeExecution(
                   makeAttempt(),
                   swapcore::domain::FailureOutcome{FailureKind::Internal, ""}),
               std::invalid_argument);
}

// Leading zero bytes shorten the text: one '1' digit each.
TEST(TradeExecutionTest, SignatureValidityFollowsDecodedWidth) {
  using swapcore::domain::isValidTransactionSignature;
  EXPECT_TRUE(isValidTransactionSignature(kSignatureA));
  EXPECT_TRUE(isValidTransactionSignature(kSignatureB));

  std::vector<std::uint8_t> raw(64, 0xAB);
  raw[0] = 0x00;
  raw[1] = 0x01;
  const std::string one_zero = swapcore::codec::base58Encode(raw);
  EXPECT_LT(one_zero.size(), 87u);
  EXPECT_TRUE(isValidTransactionSignature(one_zero));

  raw[1] = 0x00;
  raw[2] = 0x05;
  raw[3] = 0x7F;
  const std::string two_zeros = swapcore::codec::base58Encode(raw);
  EXPECT_LT(two_zeros.size(), 87u);
  EXPECT_TRUE(isValidTransactionSignature(two_zeros));

  // 63 and 65 bytes are the wrong width whatever their length in text.
  EXPECT_FALSE(isValidTransactionSignature(swapcore::codec::base58Encode(
      std::vector<std::uint8_t>(63, 0xAB))));
  std::vector<std::uint8_t> wide(65, 0xAB);
  wide[0] = 0x00;
  EXPECT_FALSE(
      isValidTransactionSignature(swapcore::codec::base58Encode(wide)));

  EXPECT_FALSE(isValidTransactionSignature(kSignatureA + "1"));
  EXPECT_FALSE(isValidTransactionSignature("0OIl"));
  EXPECT_FALSE(isValidTransactionSignature(""));
}

TEST(TradeExecutionTest, AcceptsSuccessWithShortSignature) {
  std::vector<std::uint8_t> raw(64, 0x3C);
  raw[0] = 0x00;
  swapcore::domain::SuccessOutcome s;
  s.transaction_signature = swapcore::codec::base58Encode(raw);
  s.output_amount = 1.0;

  const swapcore::domain::TradeExecution record(makeAttempt(), s);
  EXPECT_EQ(record.status(), ExecutionStatus::Success);
  EXPECT_EQ(record.transactionSignature(), s.transaction_signature);
}

// -----------------------------------------------------------------------------
// 3. Status and kind names round-trip through their persisted text.
// -----------------------------------------------------------------------------
TEST(TradeExecutionTest, PersistedNames) {
  using namespace swapcore::domain;
  EXPECT_STREQ(toString(ExecutionStatus::DryRun), "dry_run");
  EXPECT_EQ(parseExecutionStatus("success"), ExecutionStatus::Success);
  EXPECT_FALSE(parseExecutionStatus("SUCCESS").has_value());

  EXPECT_STREQ(toString(FailureKind::RiskBlocked), "risk_blocked");
  EXPECT_EQ(parseFailureKind("confirmation_timeout"),
            FailureKind::ConfirmationTimeout);
  EXPECT_FALSE(parseFailureKind("timeout").has_value());
}

// -----------------------------------------------------------------------------
// 4. Actions, legs and units.
// -----------------------------------------------------------------------------
TEST(TradeActionTest, ParsesCaseInsensitively) {
  using swapcore::domain::parseTradeAction;
  EXPECT_EQ(parseTradeAction("buy"), TradeAction::Buy);
  EXPECT_EQ(parseTradeAction("SELL"), TradeAction::Sell);
  EXPECT_EQ(parseTradeAction("Sell"), TradeAction::Sell);
  EXPECT_FALSE(parseTradeAction("HOLD").has_value());
  EXPECT_FALSE(parseTradeAction("").has_value());
  EXPECT_STREQ(swapcore::domain::toString(TradeAction::Buy), "BUY");
}

TEST(AssetPairTest, ResolvesLegsByDirection) {
  const swapcore::domain::AssetPair pair;

  const auto buy = swapcore::domain::resolveSwapLeg(pair, TradeAction::Buy);
  EXPECT_EQ(buy.input_mint, swapcore::domain::kUsdtMint);
  EXPECT_EQ(buy.output_mint, swapcore::domain::kNativeSolMint);
  EXPECT_EQ(buy.output_decimals, 9);

  const auto sell = swapcore::domain::resolveSwapLeg(pair, TradeAction::Sell);
  EXPECT_EQ(sell.input_mint, swapcore::domain::kNativeSolMint);
  EXPECT_EQ(sell.output_decimals, 6);
}

TEST(AssetPairTest, ConvertsSmallestUnits) {
  using swapcore::domain::fromSmallestUnits;
  using swapcore::domain::toSmallestUnits;
  EXPECT_EQ(toSmallestUnits(0.01, 9), 10000000u);
  EXPECT_EQ(toSmallestUnits(0.1, 9), 100000000u);
  EXPECT_EQ(toSmallestUnits(1.5, 6), 1500000u);
  EXPECT_EQ(toSmallestUnits(1e-10, 9), 0u);
  EXPECT_DOUBLE_EQ(fromSmallestUnits(5000000, 9), 0.005);
  EXPECT_DOUBLE_EQ(fromSmallestUnits(1490000, 6), 1.49);
}

// -----------------------------------------------------------------------------
// 5. JSON views.
// -----------------------------------------------------------------------------
TEST(ExecutionJsonTest, SuccessRecordShape) {
  swapcore::domain::SuccessOutcome s;
  s.transaction_signature = kSignatureA;
  s.output_amount = 1.49;
  s.fee_paid = 0.000005;
  s.fee_estimated = true;

  const auto j = swapcore::toJson(
      swapcore::domain::TradeExecution(makeAttempt(), s));

  EXPECT_EQ(j["timestamp"], "2026-03-10T12:00:00.250Z");
  EXPECT_EQ(j["signal"], "SELL");
  EXPECT_EQ(j["status"], "success");
  EXPECT_EQ(j["transaction_signature"], kSignatureA);
  EXPECT_DOUBLE_EQ(j["output_amount"].get<double>(), 1.49);
  EXPECT_DOUBLE_EQ(j["execution_duration_sec"].get<double>(), 1.75);
  EXPECT_TRUE(j["fee_estimated"].get<bool>());
  EXPECT_TRUE(j["failure_kind"].is_null());
  EXPECT_TRUE(j["error_message"].is_null());
}

TEST(ExecutionJsonTest, FailureRecordShape) {
  const auto j = swapcore::toJson(swapcore::domain::TradeExecution(
      makeAttempt(), swapcore::domain::FailureOutcome{
                         FailureKind::RiskBlocked, "Daily trade limit reached (20/20)"}));

  EXPECT_EQ(j["status"], "failed");
  EXPECT_EQ(j["failure_kind"], "risk_blocked");
  EXPECT_EQ(j["error_message"], "Daily trade limit reached (20/20)");
  EXPECT_TRUE(j["transaction_signature"].is_null());
  EXPECT_TRUE(j["gas_fee_sol"].is_null());
  EXPECT_FALSE(j["fee_estimated"].get<bool>());
}

TEST(ExecutionJsonTest, TradeRequestFromJsonAppliesDefaults) {
  swapcore::domain::TradeRequest defaults;
  defaults.slippage_bps = 75;
  defaults.dry_run = true;

  const auto r = swapcore::tradeRequestFromJson(
      nlohmann::json{{"action", "sell"}, {"amount", 0.02}}, defaults);
  EXPECT_EQ(r.action, TradeAction::Sell);
  EXPECT_DOUBLE_EQ(r.amount, 0.02);
  EXPECT_EQ(r.slippage_bps, 75);
  EXPECT_TRUE(r.dry_run);

  const auto live = swapcore::tradeRequestFromJson(
      nlohmann::json{{"action", "BUY"},
                     {"amount", 1},
                     {"slippage_bps", 30},
                     {"dry_run", false}},
      defaults);
  EXPECT_EQ(live.slippage_bps, 30);
  EXPECT_FALSE(live.dry_run);
}

TEST(ExecutionJsonTest, TradeRequestFromJsonRejectsBadInput) {
  const swapcore::domain::TradeRequest defaults;
  using nlohmann::json;
  EXPECT_THROW(swapcore::tradeRequestFromJson(json::array(), defaults),
               std::invalid_argument);
  EXPECT_THROW(swapcore::tradeRequestFromJson(json{{"amount", 0.01}}, defaults),
               std::invalid_argument);
  EXPECT_THROW(swapcore::tradeRequestFromJson(
                   json{{"action", "HOLD"}, {"amount", 0.01}}, defaults),
               std::invalid_argument);
  EXPECT_THROW(swapcore::tradeRequestFromJson(
                   json{{"action", "BUY"}, {"amount", "0.01"}}, defaults),
               std::invalid_argument);
  EXPECT_THROW(swapcore::tradeRequestFromJson(
                   json{{"action", "BUY"}, {"amount", 0.01}, {"slippage_bps", 0.5}},
                   defaults),
               std::invalid_argument);
  EXPECT_THROW(swapcore::tradeRequestFromJson(
                   json{{"action", "BUY"}, {"amount", 0.01}, {"dry_run", "no"}},
                   defaults),
               std::invalid_argument);
}

TEST(ExecutionJsonTest, EventTypesAreTagged) {
  swapcore::RetryEvent retry;
  retry.operation = "get quote";
  retry.attempt = 1;
  retry.outcome = swapcore::RetryOutcome::Retrying;
  const auto r = swapcore::eventToJson(retry);
  EXPECT_EQ(r["type"], "retry");
  EXPECT_EQ(r["outcome"], "retrying");

  const auto b = swapcore::eventToJson(swapcore::CircuitBreakerEvent{
      true, "manual", swapcore::ms_to_timestamp(kNoonUtc)});
  EXPECT_EQ(b["type"], "circuit_breaker");
  EXPECT_TRUE(b["active"].get<bool>());
  EXPECT_EQ(b["timestamp"], "2026-03-10T12:00:00.000Z");

  const auto e = swapcore::eventToJson(swapcore::TradeExecutionEvent{
      7, swapcore::domain::TradeExecution(makeAttempt(),
                                          swapcore::domain::DryRunOutcome{})});
  EXPECT_EQ(e["type"], "trade_execution");
  EXPECT_EQ(e["request_id"], 7);
  EXPECT_EQ(e["execution"]["status"], "dry_run");
}
