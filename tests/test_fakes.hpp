// =============================================================================
// test_fakes.hpp
// =============================================================================
// Hand-written stand-ins for the engine's collaborators. Each fake records
// its calls so tests can assert on call counts, and is scripted through
// plain public members before the code under test runs.
// =============================================================================
#pragma once

#include "swapcore/chain/i_blockchain_rpc.hpp"
#include "swapcore/domain/quote.hpp"
#include "swapcore/domain/trade_execution.hpp"
#include "swapcore/errors/errors.hpp"
#include "swapcore/network/http_client.hpp"
#include "swapcore/storage/i_execution_store.hpp"
#include "swapcore/swap/i_swap_aggregator.hpp"
#include "swapcore/wallet/i_wallet.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swapcore_test {

// Well-formed 88-character base58 transaction signatures.
inline const std::string kSignatureA =
    "5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnbJLgp8uirBgmQpjKhoR4tjF3ZpRzrFmBV6UjKdiSZkQUW";
inline const std::string kSignatureB =
    "4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T2cTjF1eyZq4b3fKhf8Rn6MUvs2VR2a7Y2gBtjXgvRZEx";

inline const std::string kWalletPublicKey =
    "7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU";

// -----------------------------------------------------------------------------
// FakeHttpClient: replays a script of responses (or throws) in order
// -----------------------------------------------------------------------------
class FakeHttpClient : public swapcore::IHttpClient {
 public:
  struct Call {
    std::string method;
    std::string url;
    swapcore::QueryParams params;
    nlohmann::json body;
  };

  using Step = std::function<swapcore::HttpResponse()>;

  void respond(long status, std::string body) {
    script.push_back([status, body] {
      return swapcore::HttpResponse{status, body};
    });
  }

  void respondJson(const nlohmann::json& body) { respond(200, body.dump()); }

  template <typename Error>
  void fail(const std::string& message) {
    script.push_back([message]() -> swapcore::HttpResponse {
      throw Error(message);
    });
  }

  swapcore::HttpResponse get(const std::string& url,
                             const swapcore::QueryParams& params) override {
    calls.push_back(Call{"GET", url, params, nullptr});
    return next();
  }

  swapcore::HttpResponse postJson(const std::string& url,
                                  const nlohmann::json& body) override {
    calls.push_back(Call{"POST", url, {}, body});
    return next();
  }

  std::deque<Step> script;
  std::vector<Call> calls;

 private:
  swapcore::HttpResponse next() {
    if (script.empty()) {
      throw swapcore::ConnectionError("FakeHttpClient: script exhausted");
    }
    Step step = std::move(script.front());
    script.pop_front();
    return step();
  }
};

// -----------------------------------------------------------------------------
// FakeSwapAggregator
// -----------------------------------------------------------------------------
class FakeSwapAggregator : public swapcore::ISwapAggregator {
 public:
  swapcore::domain::Quote getQuote(const std::string& input_mint,
                                   const std::string& output_mint,
                                   std::uint64_t amount,
                                   int slippage_bps) override {
    ++quote_calls;
    std::lock_guard lock(mutex);
    last_input_mint = input_mint;
    last_output_mint = output_mint;
    last_amount = amount;
    last_slippage_bps = slippage_bps;
    if (quote_error) {
      throw swapcore::QuoteUnavailable(*quote_error);
    }
    swapcore::domain::Quote q;
    q.input_mint = input_mint;
    q.output_mint = output_mint;
    q.in_amount = amount;
    q.out_amount = out_amount;
    q.raw = {{"outAmount", std::to_string(out_amount)}};
    return q;
  }

  std::vector<std::uint8_t> buildSwapTransaction(
      const swapcore::domain::Quote& /*quote*/,
      const std::string& user_public_key) override {
    ++build_calls;
    std::lock_guard lock(mutex);
    last_user_public_key = user_public_key;
    if (build_error) {
      throw swapcore::TransactionBuildFailed(*build_error);
    }
    return unsigned_transaction;
  }

  std::uint64_t out_amount{5000000};
  std::optional<std::string> quote_error;
  std::optional<std::string> build_error;
  std::vector<std::uint8_t> unsigned_transaction{0x01, 0x02, 0x03};

  std::atomic<int> quote_calls{0};
  std::atomic<int> build_calls{0};
  std::string last_input_mint;
  std::string last_output_mint;
  std::uint64_t last_amount{0};
  int last_slippage_bps{0};
  std::string last_user_public_key;

  // Guards the last_* fields when trades run concurrently.
  std::mutex mutex;
};

// -----------------------------------------------------------------------------
// FakeBlockchainRpc
// -----------------------------------------------------------------------------
// submitTransaction() replays submit_script (a throwing step simulates a
// transport error) and falls back to `signature` once it is empty.
// getTransactionStatus() replays status_script and repeats
// `default_status` afterwards.
// -----------------------------------------------------------------------------
class FakeBlockchainRpc : public swapcore::IBlockchainRpc {
 public:
  using SubmitStep = std::function<std::string()>;
  using StatusStep = std::function<swapcore::TransactionStatus()>;

  std::string submitTransaction(
      const std::vector<std::uint8_t>& signed_transaction) override {
    ++submit_calls;
    last_submitted = signed_transaction;
    if (!submit_script.empty()) {
      SubmitStep step = std::move(submit_script.front());
      submit_script.pop_front();
      return step();
    }
    return signature;
  }

  swapcore::TransactionStatus getTransactionStatus(
      const std::string& /*signature*/) override {
    ++status_calls;
    if (!status_script.empty()) {
      StatusStep step = std::move(status_script.front());
      status_script.pop_front();
      return step();
    }
    return default_status;
  }

  std::optional<swapcore::TransactionDetails> getTransactionDetails(
      const std::string& /*signature*/, const std::string& /*owner*/,
      const std::string& /*output_mint*/) override {
    ++details_calls;
    return details;
  }

  void pushStatus(bool confirmed, std::optional<std::string> error = {}) {
    status_script.push_back([confirmed, error] {
      return swapcore::TransactionStatus{confirmed, error};
    });
  }

  std::string signature{kSignatureA};
  std::deque<SubmitStep> submit_script;
  std::deque<StatusStep> status_script;
  swapcore::TransactionStatus default_status{false, std::nullopt};
  std::optional<swapcore::TransactionDetails> details;

  std::atomic<int> submit_calls{0};
  std::atomic<int> status_calls{0};
  std::atomic<int> details_calls{0};
  std::vector<std::uint8_t> last_submitted;
};

// -----------------------------------------------------------------------------
// FakeWallet: "signs" by appending a marker byte
// -----------------------------------------------------------------------------
class FakeWallet : public swapcore::IWallet {
 public:
  std::string publicKey() const override { return kWalletPublicKey; }

  std::vector<std::uint8_t> sign(
      const std::vector<std::uint8_t>& unsigned_transaction) const override {
    ++sign_calls;
    if (sign_error) {
      throw swapcore::WalletError(*sign_error);
    }
    std::vector<std::uint8_t> signed_tx = unsigned_transaction;
    signed_tx.push_back(0xAA);
    return signed_tx;
  }

  std::optional<std::string> sign_error;
  mutable std::atomic<int> sign_calls{0};
};

// -----------------------------------------------------------------------------
// InMemoryExecutionStore: same counting rule as the SQLite store
// -----------------------------------------------------------------------------
class InMemoryExecutionStore : public swapcore::IExecutionStore {
 public:
  void saveExecution(const swapcore::domain::TradeExecution& execution) override {
    std::lock_guard lock(mutex_);
    if (fail_saves) {
      throw swapcore::StorageError("disk full");
    }
    records_.push_back(execution);
  }

  int countLiveTradesSince(swapcore::Timestamp since) override {
    using swapcore::domain::ExecutionStatus;
    using swapcore::domain::FailureKind;
    std::lock_guard lock(mutex_);
    ++count_calls;
    if (fail_counts) {
      throw swapcore::StorageError("database is locked");
    }
    int n = 0;
    for (const auto& r : records_) {
      if (r.timestamp() < since || r.status() == ExecutionStatus::DryRun) {
        continue;
      }
      const auto kind = r.failureKind();
      if (kind && (*kind == FailureKind::Validation ||
                   *kind == FailureKind::RiskBlocked)) {
        continue;
      }
      ++n;
    }
    return n;
  }

  std::vector<swapcore::domain::TradeExecution> recentExecutions(
      int limit) override {
    std::lock_guard lock(mutex_);
    std::vector<swapcore::domain::TradeExecution> out;
    for (auto it = records_.rbegin();
         it != records_.rend() && static_cast<int>(out.size()) < limit; ++it) {
      out.push_back(*it);
    }
    return out;
  }

  // Inserts a finished record directly, bypassing the orchestrator.
  void seed(const swapcore::domain::TradeExecution& execution) {
    std::lock_guard lock(mutex_);
    records_.push_back(execution);
  }

  std::vector<swapcore::domain::TradeExecution> records() const {
    std::lock_guard lock(mutex_);
    return records_;
  }

  bool fail_saves{false};
  bool fail_counts{false};
  int count_calls{0};

 private:
  mutable std::mutex mutex_;
  std::vector<swapcore::domain::TradeExecution> records_;
};

// Builds a stored live success at `timestamp_ms`.
inline swapcore::domain::TradeExecution makeLiveSuccess(
    std::int64_t timestamp_ms, const std::string& signature = kSignatureA) {
  swapcore::domain::TradeAttempt attempt;
  attempt.timestamp = swapcore::ms_to_timestamp(timestamp_ms);
  attempt.action = swapcore::domain::TradeAction::Sell;
  attempt.input_mint = "base";
  attempt.output_mint = "quote";
  attempt.input_amount = 0.01;
  attempt.expected_output = 1.5;
  attempt.slippage_bps = 50;
  attempt.duration_ms = 1200;
  swapcore::domain::SuccessOutcome outcome;
  outcome.transaction_signature = signature;
  outcome.output_amount = 1.49;
  outcome.fee_paid = 0.000005;
  return swapcore::domain::TradeExecution(attempt, outcome);
}

inline swapcore::domain::TradeExecution makeFailure(
    std::int64_t timestamp_ms, swapcore::domain::FailureKind kind,
    const std::string& message = "failed") {
  swapcore::domain::TradeAttempt attempt;
  attempt.timestamp = swapcore::ms_to_timestamp(timestamp_ms);
  attempt.action = swapcore::domain::TradeAction::Buy;
  attempt.input_mint = "quote";
  attempt.output_mint = "base";
  attempt.input_amount = 0.01;
  attempt.slippage_bps = 50;
  return swapcore::domain::TradeExecution(
      attempt, swapcore::domain::FailureOutcome{kind, message});
}

inline swapcore::domain::TradeExecution makeDryRun(std::int64_t timestamp_ms) {
  swapcore::domain::TradeAttempt attempt;
  attempt.timestamp = swapcore::ms_to_timestamp(timestamp_ms);
  attempt.action = swapcore::domain::TradeAction::Buy;
  attempt.input_mint = "quote";
  attempt.output_mint = "base";
  attempt.input_amount = 0.01;
  attempt.expected_output = 0.005;
  attempt.slippage_bps = 50;
  return swapcore::domain::TradeExecution(attempt,
                                          swapcore::domain::DryRunOutcome{});
}

}  // namespace swapcore_test
