#include "swapcore/execution/execution_orchestrator.hpp"

#include "swapcore/errors/errors.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace swapcore {

namespace {

constexpr double kLamportsPerSol = 1e9;

std::string describe(double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

std::string errorText(const SwapCoreError& e) {
  return std::string(e.kind()) + ": " + e.what();
}

}  // namespace

ExecutionOrchestrator::ExecutionOrchestrator(
    ISwapAggregator& aggregator, IWallet* wallet, ConfirmationPoller& poller,
    IBlockchainRpc& rpc, RiskGate& gate, CircuitBreaker& breaker,
    PriceMoveMonitor* price_monitor, IExecutionStore& store,
    ITimeProvider& clock, OrchestratorSettings settings, EventSink events)
    : aggregator_(aggregator),
      wallet_(wallet),
      poller_(poller),
      rpc_(rpc),
      gate_(gate),
      breaker_(breaker),
      price_monitor_(price_monitor),
      store_(store),
      clock_(clock),
      settings_(std::move(settings)),
      events_(std::move(events)) {}

// -----------------------------------------------------------------------------
// executeTrade(): pipeline, record, persist
// -----------------------------------------------------------------------------
domain::TradeExecution ExecutionOrchestrator::executeTrade(
    const domain::TradeRequest& request) {
  const std::int64_t started_ms = clock_.now_ms();
  const domain::SwapLeg leg = domain::resolveSwapLeg(settings_.pair,
                                                     request.action);

  domain::TradeAttempt attempt;
  attempt.timestamp = ms_to_timestamp(started_ms);
  attempt.action = request.action;
  attempt.input_mint = leg.input_mint;
  attempt.output_mint = leg.output_mint;
  attempt.input_amount = request.amount;
  attempt.slippage_bps = request.slippage_bps;

  std::cout << "[ExecutionOrchestrator] " << domain::toString(request.action)
            << " " << request.amount << " slippage=" << request.slippage_bps
            << "bps " << (request.dry_run ? "(dry run)" : "(LIVE)") << "\n";

  domain::ExecutionOutcome outcome;
  try {
    outcome = runPipeline(request, leg, attempt);
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionOrchestrator] unexpected error: " << e.what()
              << "\n";
    outcome = domain::FailureOutcome{domain::FailureKind::Internal,
                                     std::string("Unexpected error: ") +
                                         e.what()};
  }

  domain::TradeExecution record =
      finish(std::move(attempt), std::move(outcome), started_ms);

  try {
    store_.saveExecution(record);
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionOrchestrator] failed to persist "
              << domain::toString(record.status()) << " record: " << e.what()
              << "\n";
  }

  std::cout << "[ExecutionOrchestrator] finished: "
            << domain::toString(record.status());
  if (auto message = record.errorMessage()) {
    std::cout << " (" << *message << ")";
  }
  std::cout << " in " << record.durationMs() << " ms\n";
  return record;
}

std::future<domain::TradeExecution> ExecutionOrchestrator::executeTradeAsync(
    domain::TradeRequest request) {
  return std::async(std::launch::async,
                    [this, request] { return executeTrade(request); });
}

// -----------------------------------------------------------------------------
// runPipeline(): steps 1-7; live execution continues in executeLive()
// -----------------------------------------------------------------------------
domain::ExecutionOutcome ExecutionOrchestrator::runPipeline(
    const domain::TradeRequest& request, const domain::SwapLeg& leg,
    domain::TradeAttempt& attempt) {
  using domain::FailureKind;
  using domain::FailureOutcome;

  if (!std::isfinite(request.amount) || request.amount <= 0.0) {
    return FailureOutcome{FailureKind::Validation,
                          "Invalid amount " + describe(request.amount) +
                              ": must be greater than 0"};
  }
  if (request.slippage_bps < 0 ||
      request.slippage_bps > domain::kMaxSlippageBps) {
    return FailureOutcome{FailureKind::Validation,
                          "Invalid slippage " +
                              std::to_string(request.slippage_bps) +
                              " bps: must be between 0 and " +
                              std::to_string(domain::kMaxSlippageBps)};
  }

  if (request.amount > settings_.limits.max_trade_size) {
    return block(request.action, FailureKind::Validation,
                 "Amount " + describe(request.amount) +
                     " exceeds max trade size " +
                     describe(settings_.limits.max_trade_size));
  }

  if (!request.dry_run) {
    RiskDecision decision;
    try {
      decision = gate_.checkLimits();
    } catch (const SwapCoreError& e) {
      return block(request.action, FailureKind::RiskBlocked,
                   "Risk check failed, trade blocked: " + errorText(e));
    }
    if (!decision.allowed) {
      return block(request.action, FailureKind::RiskBlocked,
                   decision.reason.value_or("Blocked by risk gate"));
    }
  }

  const std::uint64_t units =
      domain::toSmallestUnits(request.amount, settings_.pair.base_decimals);
  if (units == 0) {
    return FailureOutcome{FailureKind::Validation,
                          "Amount " + describe(request.amount) +
                              " is below the smallest unit of the asset"};
  }

  domain::Quote quote;
  try {
    quote = aggregator_.getQuote(leg.input_mint, leg.output_mint, units,
                                 request.slippage_bps);
  } catch (const SwapCoreError& e) {
    return FailureOutcome{FailureKind::QuoteUnavailable,
                          "Failed to get quote: " + std::string(e.what())};
  }
  attempt.expected_output =
      domain::fromSmallestUnits(quote.out_amount, leg.output_decimals);

  std::cout << "[ExecutionOrchestrator] quote: " << units << " -> "
            << quote.out_amount << " (expected " << *attempt.expected_output
            << ", impact " << quote.price_impact_pct << "%)\n";

  if (price_monitor_ != nullptr) {
    price_monitor_->observe(request.action, quote);
  }

  if (request.dry_run) {
    return domain::DryRunOutcome{};
  }

  if (breaker_.isActive()) {
    return block(request.action, FailureKind::RiskBlocked,
                 std::string(RiskGate::kCircuitBreakerReason) + " (" +
                     breaker_.reason() + ")");
  }

  return executeLive(leg, quote, attempt);
}

// -----------------------------------------------------------------------------
// executeLive(): build, sign, submit, await finality
// -----------------------------------------------------------------------------
domain::ExecutionOutcome ExecutionOrchestrator::executeLive(
    const domain::SwapLeg& leg, const domain::Quote& quote,
    const domain::TradeAttempt& attempt) {
  using domain::FailureKind;
  using domain::FailureOutcome;

  if (wallet_ == nullptr) {
    return FailureOutcome{FailureKind::WalletError,
                          "No wallet configured for live trading"};
  }

  std::string owner;
  try {
    owner = wallet_->publicKey();
  } catch (const SwapCoreError& e) {
    return FailureOutcome{FailureKind::WalletError,
                          "Wallet unavailable: " + std::string(e.what())};
  }

  std::vector<std::uint8_t> unsigned_tx;
  try {
    unsigned_tx = aggregator_.buildSwapTransaction(quote, owner);
  } catch (const SwapCoreError& e) {
    return FailureOutcome{FailureKind::TransactionBuildFailed,
                          "Failed to build swap transaction: " +
                              std::string(e.what())};
  }

  std::vector<std::uint8_t> signed_tx;
  try {
    signed_tx = wallet_->sign(unsigned_tx);
  } catch (const SwapCoreError& e) {
    return FailureOutcome{FailureKind::WalletError,
                          "Failed to sign transaction: " +
                              std::string(e.what())};
  }

  ConfirmationResult result;
  try {
    result = poller_.submitAndConfirm(signed_tx,
                                      settings_.confirmation_timeout_ms);
  } catch (const SwapCoreError& e) {
    return FailureOutcome{FailureKind::SubmissionFailed,
                          "Transaction submission failed: " + errorText(e)};
  }

  switch (result.state) {
    case ConfirmationState::ConfirmedSuccess:
      return confirmedSuccess(result, owner, leg, attempt);
    case ConfirmationState::ConfirmedFailed:
      return FailureOutcome{
          FailureKind::OnChainError,
          "Transaction " + result.signature + " failed on-chain: " +
              result.chain_error.value_or("unknown chain error")};
    case ConfirmationState::TimedOut:
      return FailureOutcome{
          FailureKind::ConfirmationTimeout,
          "Confirmation timed out after " +
              std::to_string(settings_.confirmation_timeout_ms) +
              " ms; outcome unknown, verify transaction " + result.signature +
              " before retrying"};
    case ConfirmationState::Submitted:
      break;
  }
  return FailureOutcome{FailureKind::Internal,
                        "Confirmation ended without a final state for " +
                            result.signature};
}

// -----------------------------------------------------------------------------
// confirmedSuccess(): read the actual output and fee back when possible
// -----------------------------------------------------------------------------
domain::ExecutionOutcome ExecutionOrchestrator::confirmedSuccess(
    const ConfirmationResult& result, const std::string& owner,
    const domain::SwapLeg& leg, const domain::TradeAttempt& attempt) {
  if (!domain::isValidTransactionSignature(result.signature)) {
    return domain::FailureOutcome{
        domain::FailureKind::SubmissionFailed,
        "RPC returned a malformed transaction signature '" + result.signature +
            "'"};
  }

  std::optional<TransactionDetails> details;
  try {
    details = rpc_.getTransactionDetails(result.signature, owner,
                                         leg.output_mint);
  } catch (const SwapCoreError& e) {
    std::cerr << "[ExecutionOrchestrator] transaction details unavailable for "
              << result.signature << ": " << errorText(e) << "\n";
  }

  domain::SuccessOutcome success;
  success.transaction_signature = result.signature;

  if (details && details->output_amount) {
    success.output_amount =
        domain::fromSmallestUnits(*details->output_amount, leg.output_decimals);
  } else {
    success.output_amount = attempt.expected_output.value_or(0.0);
  }

  if (details && details->fee_lamports) {
    success.fee_paid =
        static_cast<double>(*details->fee_lamports) / kLamportsPerSol;
    success.fee_estimated = false;
  } else {
    success.fee_paid = settings_.estimated_fee_sol;
    success.fee_estimated = true;
  }
  return success;
}

domain::FailureOutcome ExecutionOrchestrator::block(domain::TradeAction action,
                                                    domain::FailureKind kind,
                                                    const std::string& reason) {
  std::cerr << "[ExecutionOrchestrator] blocked: " << reason << "\n";
  emit(RiskBlockEvent{action, reason, ms_to_timestamp(clock_.now_ms())});
  return domain::FailureOutcome{kind, reason};
}

domain::TradeExecution ExecutionOrchestrator::finish(
    domain::TradeAttempt attempt, domain::ExecutionOutcome outcome,
    std::int64_t started_ms) {
  attempt.duration_ms = clock_.now_ms() - started_ms;
  try {
    return domain::TradeExecution(attempt, std::move(outcome));
  } catch (const std::invalid_argument& e) {
    std::cerr << "[ExecutionOrchestrator] inconsistent outcome: " << e.what()
              << "\n";
    return domain::TradeExecution(
        std::move(attempt),
        domain::FailureOutcome{domain::FailureKind::Internal,
                               std::string("Inconsistent outcome: ") +
                                   e.what()});
  }
}

void ExecutionOrchestrator::emit(Event event) {
  if (!events_) {
    return;
  }
  try {
    events_(std::move(event));
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionOrchestrator] event sink threw: " << e.what()
              << "\n";
  }
}

}  // namespace swapcore
