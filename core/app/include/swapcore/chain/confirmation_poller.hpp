#pragma once

#include "swapcore/chain/i_blockchain_rpc.hpp"
#include "swapcore/retry/backoff_retrier.hpp"
#include "swapcore/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace swapcore {

enum class ConfirmationState {
  Submitted,
  ConfirmedSuccess,
  ConfirmedFailed,
  TimedOut,
};

const char* toString(ConfirmationState state);

struct ConfirmationResult {
  std::string signature;
  ConfirmationState state{ConfirmationState::Submitted};
  std::optional<std::string> chain_error;  // set for ConfirmedFailed only
  int polls{0};
};

// -----------------------------------------------------------------------------
// ConfirmationPoller: submit once, then poll until final or out of time
// -----------------------------------------------------------------------------
//
// @brief  Drives the state machine
//           submitted → { confirmed-success | confirmed-failed | timed-out }
//         for one signed transaction.
//
// @details
// Submission:
//   Retried through BackoffRetrier on ConnectionError only. A timeout, a
//   5xx or a node rejection may mean the transaction was already accepted,
//   and broadcasting it again is never worth the risk. Anything that escapes
//   propagates to the caller; no signature exists at that point.
//
// Polling:
//   Every iteration sleeps first and then queries the status, so the first
//   query happens one interval after submission. The sleep is cut to the
//   time left before timeout_ms, and a sleep that overruns the deadline
//   ends the wait without a query. No status is ever read after the
//   deadline. With a simulated clock a never-final transaction is queried
//   ceil(timeout_ms / poll_interval_ms) times; request latency on a real
//   clock can only lower that count.
//
//   A status query that throws is logged and counted as "not final". A
//   final status with an error is returned at once and never retried: the
//   chain has rejected the transaction deterministically.
//
//   Timing out says nothing about the transaction's fate. The signature is
//   returned so the caller can check it independently.
//
// Thread model:
//   Stateless between calls; concurrent submitAndConfirm() calls are fine
//   if the RPC client allows it.
// -----------------------------------------------------------------------------
class ConfirmationPoller {
 public:
  ConfirmationPoller(IBlockchainRpc& rpc, BackoffRetrier& retrier,
                     ITimeProvider& clock, std::int64_t poll_interval_ms = 1000);

  // -------------------------------------------------------------------------
  // submitAndConfirm(signed_transaction, timeout_ms)
  // -------------------------------------------------------------------------
  // @brief  Broadcasts a signed transaction and waits for its final status.
  //
  // @param  signed_transaction  Wire bytes with every signer slot filled.
  // @param  timeout_ms          Wall-clock bound on the wait, measured from
  //                             the moment submission succeeded.
  //
  // @return ConfirmedSuccess or ConfirmedFailed (with chain_error) as soon
  //         as a final status is seen, TimedOut otherwise. The signature is
  //         set in all three cases.
  //
  // @throws Whatever submission raised once its retries are spent. Status
  //         query failures never escape.
  // -------------------------------------------------------------------------
  ConfirmationResult submitAndConfirm(
      const std::vector<std::uint8_t>& signed_transaction,
      std::int64_t timeout_ms);

 private:
  IBlockchainRpc& rpc_;
  BackoffRetrier& retrier_;
  ITimeProvider& clock_;
  std::int64_t poll_interval_ms_;
};

}  // namespace swapcore
