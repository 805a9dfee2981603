#pragma once

#include "swapcore/domain/trade_action.hpp"
#include "swapcore/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace swapcore {
namespace domain {

// -----------------------------------------------------------------------------
// ExecutionStatus
// -----------------------------------------------------------------------------
// Persisted as "pending" / "success" / "failed" / "dry_run".
// -----------------------------------------------------------------------------
enum class ExecutionStatus {
  Pending,
  Success,
  Failed,
  DryRun,
};

const char* toString(ExecutionStatus status);
std::optional<ExecutionStatus> parseExecutionStatus(const std::string& text);

// -----------------------------------------------------------------------------
// FailureKind: why a failed record failed
// -----------------------------------------------------------------------------
// Distinguishes "never reached the network" (Validation, RiskBlocked) from
// "network or chain said no". The execution store uses that split to decide
// whether a failed attempt consumes trade-count budget.
// -----------------------------------------------------------------------------
enum class FailureKind {
  Validation,
  RiskBlocked,
  QuoteUnavailable,
  TransactionBuildFailed,
  WalletError,
  SubmissionFailed,
  OnChainError,
  ConfirmationTimeout,
  StorageError,
  Internal,
};

const char* toString(FailureKind kind);
std::optional<FailureKind> parseFailureKind(const std::string& text);

// -----------------------------------------------------------------------------
// Outcome alternatives
// -----------------------------------------------------------------------------

struct PendingOutcome {};

struct SuccessOutcome {
  std::string transaction_signature;
  double output_amount{0.0};
  std::optional<double> fee_paid;
  /// True when fee_paid is the configured placeholder, not read from chain.
  bool fee_estimated{false};
};

struct DryRunOutcome {};

struct FailureOutcome {
  FailureKind kind{FailureKind::Internal};
  std::string error_message;
};

using ExecutionOutcome =
    std::variant<PendingOutcome, SuccessOutcome, DryRunOutcome, FailureOutcome>;

// -----------------------------------------------------------------------------
// TradeAttempt: fields every record carries regardless of outcome
// -----------------------------------------------------------------------------
struct TradeAttempt {
  Timestamp timestamp{};
  TradeAction action{TradeAction::Buy};
  std::string input_mint;
  std::string output_mint;
  /// Requested amount in base-asset units.
  double input_amount{0.0};
  std::optional<double> expected_output;
  int slippage_bps{0};
  std::int64_t duration_ms{0};
};

// -----------------------------------------------------------------------------
// TradeExecution: immutable audit record of one execution attempt
// -----------------------------------------------------------------------------
//
// @brief  The single result type of ExecutionOrchestrator::executeTrade().
//
// @details
// The status-specific data lives in an ExecutionOutcome variant, and
// status() is derived from whichever alternative is active. A success
// record therefore always has a signature and an output amount, a dry-run
// record never has a signature, and a failed record always has a message.
//
// The constructor rejects the combinations the variant cannot rule out on
// its own:
//   - SuccessOutcome whose signature does not decode to 64 bytes,
//   - SuccessOutcome with a negative or non-finite output amount,
//   - FailureOutcome with an empty error message.
// All of these throw std::invalid_argument.
//
// There are no setters. Code that needs a different record builds a new one.
//
// Thread model:
//   Immutable after construction; safe to share across threads by value or
//   const reference.
// -----------------------------------------------------------------------------
class TradeExecution {
 public:
  TradeExecution(TradeAttempt attempt, ExecutionOutcome outcome);

  ExecutionStatus status() const;

  const TradeAttempt& attempt() const { return attempt_; }
  const ExecutionOutcome& outcome() const { return outcome_; }

  Timestamp timestamp() const { return attempt_.timestamp; }
  TradeAction action() const { return attempt_.action; }
  const std::string& inputMint() const { return attempt_.input_mint; }
  const std::string& outputMint() const { return attempt_.output_mint; }
  double inputAmount() const { return attempt_.input_amount; }
  std::optional<double> expectedOutput() const {
    return attempt_.expected_output;
  }
  int slippageBps() const { return attempt_.slippage_bps; }
  std::int64_t durationMs() const { return attempt_.duration_ms; }

  // Present only for Success.
  std::optional<std::string> transactionSignature() const;
  std::optional<double> outputAmount() const;
  std::optional<double> feePaid() const;
  bool feeEstimated() const;

  // Present only for Failed.
  std::optional<std::string> errorMessage() const;
  std::optional<FailureKind> failureKind() const;

 private:
  TradeAttempt attempt_;
  ExecutionOutcome outcome_;
};

// Solana transaction signatures: base58 of 64 bytes.
bool isValidTransactionSignature(const std::string& signature);

}  // namespace domain
}  // namespace swapcore
