#include "swapcore/chain/confirmation_poller.hpp"

#include "swapcore/errors/errors.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace swapcore {

const char* toString(ConfirmationState state) {
  switch (state) {
    case ConfirmationState::Submitted:        return "submitted";
    case ConfirmationState::ConfirmedSuccess: return "confirmed-success";
    case ConfirmationState::ConfirmedFailed:  return "confirmed-failed";
    case ConfirmationState::TimedOut:         return "timed-out";
  }
  return "unknown";
}

ConfirmationPoller::ConfirmationPoller(IBlockchainRpc& rpc,
                                       BackoffRetrier& retrier,
                                       ITimeProvider& clock,
                                       std::int64_t poll_interval_ms)
    : rpc_(rpc),
      retrier_(retrier),
      clock_(clock),
      poll_interval_ms_(poll_interval_ms) {
  if (poll_interval_ms_ <= 0) {
    throw std::invalid_argument("poll interval must be positive");
  }
}

ConfirmationResult ConfirmationPoller::submitAndConfirm(
    const std::vector<std::uint8_t>& signed_transaction,
    std::int64_t timeout_ms) {
  ConfirmationResult result;
  result.signature = retrier_.run<ConnectionError>(
      "submit transaction",
      [&] { return rpc_.submitTransaction(signed_transaction); });
  result.state = ConfirmationState::Submitted;

  std::cout << "[ConfirmationPoller] submitted " << result.signature
            << ", waiting up to " << timeout_ms << " ms\n";

  // The last query lands on the deadline at the latest: sleeps are cut to
  // the time remaining, and an overslept deadline ends the wait unqueried.
  const std::int64_t started = clock_.now_ms();
  while (clock_.now_ms() - started < timeout_ms) {
    const std::int64_t remaining = timeout_ms - (clock_.now_ms() - started);
    clock_.sleep_ms(std::min(poll_interval_ms_, remaining));
    if (clock_.now_ms() - started > timeout_ms) {
      break;
    }
    ++result.polls;

    TransactionStatus status;
    try {
      status = rpc_.getTransactionStatus(result.signature);
    } catch (const SwapCoreError& e) {
      std::cerr << "[ConfirmationPoller] status poll " << result.polls
                << " failed (" << e.kind() << "): " << e.what() << "\n";
      continue;
    }

    if (!status.confirmed) {
      continue;
    }

    if (status.error) {
      result.state = ConfirmationState::ConfirmedFailed;
      result.chain_error = status.error;
      std::cerr << "[ConfirmationPoller] " << result.signature
                << " failed on chain: " << *status.error << "\n";
    } else {
      result.state = ConfirmationState::ConfirmedSuccess;
      std::cout << "[ConfirmationPoller] " << result.signature
                << " confirmed after " << result.polls << " poll(s)\n";
    }
    return result;
  }

  result.state = ConfirmationState::TimedOut;
  std::cerr << "[ConfirmationPoller] " << result.signature
            << " not final after " << result.polls << " poll(s)\n";
  return result;
}

}  // namespace swapcore
