#include "swapcore/domain/trade_execution.hpp"

#include "swapcore/codec/base58.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace swapcore {
namespace domain {

namespace {

constexpr std::size_t kSignatureBytes = 64;
// base58 of 64 bytes never needs more digits than this.
constexpr std::size_t kMaxSignatureLength = 88;

}  // namespace

const char* toString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::Pending: return "pending";
    case ExecutionStatus::Success: return "success";
    case ExecutionStatus::Failed:  return "failed";
    case ExecutionStatus::DryRun:  return "dry_run";
  }
  return "unknown";
}

std::optional<ExecutionStatus> parseExecutionStatus(const std::string& text) {
  if (text == "pending") return ExecutionStatus::Pending;
  if (text == "success") return ExecutionStatus::Success;
  if (text == "failed")  return ExecutionStatus::Failed;
  if (text == "dry_run") return ExecutionStatus::DryRun;
  return std::nullopt;
}

const char* toString(FailureKind kind) {
  switch (kind) {
    case FailureKind::Validation:             return "validation";
    case FailureKind::RiskBlocked:            return "risk_blocked";
    case FailureKind::QuoteUnavailable:       return "quote_unavailable";
    case FailureKind::TransactionBuildFailed: return "transaction_build_failed";
    case FailureKind::WalletError:            return "wallet_error";
    case FailureKind::SubmissionFailed:       return "submission_failed";
    case FailureKind::OnChainError:           return "on_chain_error";
    case FailureKind::ConfirmationTimeout:    return "confirmation_timeout";
    case FailureKind::StorageError:           return "storage_error";
    case FailureKind::Internal:               return "internal";
  }
  return "internal";
}

std::optional<FailureKind> parseFailureKind(const std::string& text) {
  static const std::pair<const char*, FailureKind> kKinds[] = {
      {"validation", FailureKind::Validation},
      {"risk_blocked", FailureKind::RiskBlocked},
      {"quote_unavailable", FailureKind::QuoteUnavailable},
      {"transaction_build_failed", FailureKind::TransactionBuildFailed},
      {"wallet_error", FailureKind::WalletError},
      {"submission_failed", FailureKind::SubmissionFailed},
      {"on_chain_error", FailureKind::OnChainError},
      {"confirmation_timeout", FailureKind::ConfirmationTimeout},
      {"storage_error", FailureKind::StorageError},
      {"internal", FailureKind::Internal},
  };
  for (const auto& [name, kind] : kKinds) {
    if (text == name) {
      return kind;
    }
  }
  return std::nullopt;
}

// Leading zero bytes encode as single '1' digits, so a valid signature can be
// shorter than 87 characters. Only the decoded width is fixed.
bool isValidTransactionSignature(const std::string& signature) {
  if (signature.empty() || signature.size() > kMaxSignatureLength ||
      !codec::isBase58(signature)) {
    return false;
  }
  return codec::base58Decode(signature).size() == kSignatureBytes;
}

// -----------------------------------------------------------------------------
// Constructor: enforce what the variant alone cannot
// -----------------------------------------------------------------------------
TradeExecution::TradeExecution(TradeAttempt attempt, ExecutionOutcome outcome)
    : attempt_(std::move(attempt)), outcome_(std::move(outcome)) {
  if (const auto* s = std::get_if<SuccessOutcome>(&outcome_)) {
    if (!isValidTransactionSignature(s->transaction_signature)) {
      throw std::invalid_argument("malformed transaction signature: '" +
                                  s->transaction_signature + "'");
    }
    if (!std::isfinite(s->output_amount) || s->output_amount < 0.0) {
      throw std::invalid_argument("success record needs a valid output amount");
    }
  } else if (const auto* f = std::get_if<FailureOutcome>(&outcome_)) {
    if (f->error_message.empty()) {
      throw std::invalid_argument("failed record needs an error message");
    }
  }
}

ExecutionStatus TradeExecution::status() const {
  if (std::holds_alternative<SuccessOutcome>(outcome_)) {
    return ExecutionStatus::Success;
  }
  if (std::holds_alternative<DryRunOutcome>(outcome_)) {
    return ExecutionStatus::DryRun;
  }
  if (std::holds_alternative<FailureOutcome>(outcome_)) {
    return ExecutionStatus::Failed;
  }
  return ExecutionStatus::Pending;
}

std::optional<std::string> TradeExecution::transactionSignature() const {
  if (const auto* s = std::get_if<SuccessOutcome>(&outcome_)) {
    return s->transaction_signature;
  }
  return std::nullopt;
}

std::optional<double> TradeExecution::outputAmount() const {
  if (const auto* s = std::get_if<SuccessOutcome>(&outcome_)) {
    return s->output_amount;
  }
  return std::nullopt;
}

std::optional<double> TradeExecution::feePaid() const {
  if (const auto* s = std::get_if<SuccessOutcome>(&outcome_)) {
    return s->fee_paid;
  }
  return std::nullopt;
}

bool TradeExecution::feeEstimated() const {
  const auto* s = std::get_if<SuccessOutcome>(&outcome_);
  return s != nullptr && s->fee_estimated;
}

std::optional<std::string> TradeExecution::errorMessage() const {
  if (const auto* f = std::get_if<FailureOutcome>(&outcome_)) {
    return f->error_message;
  }
  return std::nullopt;
}

std::optional<FailureKind> TradeExecution::failureKind() const {
  if (const auto* f = std::get_if<FailureOutcome>(&outcome_)) {
    return f->kind;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace swapcore
