#pragma once

#include "swapcore/chain/confirmation_poller.hpp"
#include "swapcore/chain/i_blockchain_rpc.hpp"
#include "swapcore/domain/asset_pair.hpp"
#include "swapcore/domain/trade_execution.hpp"
#include "swapcore/domain/trade_limits.hpp"
#include "swapcore/domain/trade_request.hpp"
#include "swapcore/events/event.hpp"
#include "swapcore/risk/circuit_breaker.hpp"
#include "swapcore/risk/price_move_monitor.hpp"
#include "swapcore/risk/risk_gate.hpp"
#include "swapcore/storage/i_execution_store.hpp"
#include "swapcore/swap/i_swap_aggregator.hpp"
#include "swapcore/time/i_time_provider.hpp"
#include "swapcore/wallet/i_wallet.hpp"

#include <cstdint>
#include <future>

namespace swapcore {

struct OrchestratorSettings {
  domain::AssetPair pair;
  domain::TradeLimits limits;
  std::int64_t confirmation_timeout_ms{30000};
  // Recorded as the fee when the chain does not report the actual one.
  double estimated_fee_sol{0.000005};
};

// -----------------------------------------------------------------------------
// ExecutionOrchestrator: one trade request in, one terminal record out
// -----------------------------------------------------------------------------
//
// @brief  Runs the full pipeline for a TradeRequest and returns an
//         immutable TradeExecution. Never throws.
//
// @details
// Pipeline (the first step that fails decides the record):
//
//   1. validate     amount finite and > 0, slippage in 0..10000 bps
//                   → failed / validation
//   2. size check   amount > max_trade_size → failed / validation
//                   (applies to dry runs too; no network call made)
//   3. risk gate    live only; daily, hourly, breaker
//                   → failed / risk_blocked (a store error fails closed)
//   4. quote        amount scaled by 10^base_decimals, both actions
//                   → failed / quote_unavailable
//                   expected_output = outAmount / 10^output_decimals
//   5. price move   the quote feeds the PriceMoveMonitor (may trip breaker)
//   6. dry run      → dry_run record, nothing signed or sent
//   7. breaker      live only; tripped by step 5 → failed / risk_blocked
//   8. build/sign   → transaction_build_failed / wallet_error
//   9. submit and confirm via ConfirmationPoller
//        confirmed-success → success (output and fee read back from the
//                            chain when available)
//        confirmed-failed  → failed / on_chain_error, no signature kept
//        timed-out         → failed / confirmation_timeout
//        submit error      → failed / submission_failed
//
// Every record is passed to IExecutionStore::saveExecution() before it is
// returned. A failing save is logged; the record is still returned.
//
// Thread model:
//   executeTrade() is reentrant. Concurrent calls are not serialized here;
//   the collaborators are expected to be thread-safe (the bundled ones
//   are). executeTradeAsync() runs the call on a std::async thread.
//
// Ownership:
//   Borrows every collaborator. The wallet and the price monitor may be
//   null: without a wallet live trades fail with wallet_error, without a
//   monitor no automatic trip happens.
// -----------------------------------------------------------------------------
class ExecutionOrchestrator {
 public:
  ExecutionOrchestrator(ISwapAggregator& aggregator, IWallet* wallet,
                        ConfirmationPoller& poller, IBlockchainRpc& rpc,
                        RiskGate& gate, CircuitBreaker& breaker,
                        PriceMoveMonitor* price_monitor,
                        IExecutionStore& store, ITimeProvider& clock,
                        OrchestratorSettings settings, EventSink events = {});

  ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
  ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;

  // -------------------------------------------------------------------------
  // executeTrade(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one request through the pipeline above and returns its
  //         terminal record.
  //
  // @param  request  Action, amount in base-asset units, slippage and the
  //                  dry-run flag. Invalid values yield a validation record.
  //
  // @return A success, dry_run or failed record. The record has already
  //         been handed to the store when this returns.
  //
  // @details
  // Failures of any stage become failed records with the matching
  // FailureKind; nothing escapes. The record's duration covers the whole
  // call, including backoff sleeps and confirmation polling.
  //
  // Thread-safety: Reentrant; see the class comment.
  // Side-effects:  Network calls once validation passes, one
  //                saveExecution(), a RiskBlockEvent per block, and
  //                possibly a breaker trip.
  // -------------------------------------------------------------------------
  domain::TradeExecution executeTrade(const domain::TradeRequest& request);

  // The orchestrator must outlive the returned future.
  std::future<domain::TradeExecution> executeTradeAsync(
      domain::TradeRequest request);

  const OrchestratorSettings& settings() const { return settings_; }

 private:
  domain::ExecutionOutcome runPipeline(const domain::TradeRequest& request,
                                       const domain::SwapLeg& leg,
                                       domain::TradeAttempt& attempt);

  domain::ExecutionOutcome executeLive(const domain::SwapLeg& leg,
                                       const domain::Quote& quote,
                                       const domain::TradeAttempt& attempt);

  domain::ExecutionOutcome confirmedSuccess(const ConfirmationResult& result,
                                            const std::string& owner,
                                            const domain::SwapLeg& leg,
                                            const domain::TradeAttempt& attempt);

  domain::FailureOutcome block(domain::TradeAction action,
                               domain::FailureKind kind,
                               const std::string& reason);

  domain::TradeExecution finish(domain::TradeAttempt attempt,
                                domain::ExecutionOutcome outcome,
                                std::int64_t started_ms);

  void emit(Event event);

  ISwapAggregator& aggregator_;
  IWallet* wallet_;
  ConfirmationPoller& poller_;
  IBlockchainRpc& rpc_;
  RiskGate& gate_;
  CircuitBreaker& breaker_;
  PriceMoveMonitor* price_monitor_;
  IExecutionStore& store_;
  ITimeProvider& clock_;
  OrchestratorSettings settings_;
  EventSink events_;
};

}  // namespace swapcore
