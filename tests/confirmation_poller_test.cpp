// =============================================================================
// confirmation_poller_test.cpp
// =============================================================================
// Unit tests for swapcore::ConfirmationPoller.
//
// Validates:
//   - Final success / failure on poll N returns after exactly N polls
//   - Never-final status times out after timeout / interval polls, and no
//     lookup happens after the deadline
//   - Status lookups that throw count as "not final"
//   - Submission retries ConnectionError only
//
// Timing runs on a SimulationTimeProvider: every poll advances the clock by
// the interval, so assertions on now_ms() are exact.
// =============================================================================

#include "swapcore/chain/confirmation_poller.hpp"
#include "swapcore/errors/errors.hpp"
#include "swapcore/retry/backoff_retrier.hpp"
#include "swapcore/time/simulation_time_provider.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using swapcore::ConfirmationState;
using namespace swapcore_test;

namespace {

// Sleeps overrun by a fixed lag, as a loaded host's do.
class LaggingClock : public swapcore::ITimeProvider {
 public:
  LaggingClock(swapcore::SimulationTimeProvider& base, std::int64_t lag_ms)
      : base_(base), lag_ms_(lag_ms) {}

  std::int64_t now_ms() const override { return base_.now_ms(); }
  void sleep_ms(std::int64_t duration_ms) override {
    base_.sleep_ms(duration_ms + lag_ms_);
  }

 private:
  swapcore::SimulationTimeProvider& base_;
  std::int64_t lag_ms_;
};

}  // namespace

class ConfirmationPollerTest : public ::testing::Test {
 protected:
  ConfirmationPollerTest()
      : retrier(swapcore::RetryPolicy{}, clock), poller(rpc, retrier, clock) {}

  swapcore::ConfirmationResult submit(std::int64_t timeout_ms = 30000) {
    return poller.submitAndConfirm(tx, timeout_ms);
  }

  swapcore::SimulationTimeProvider clock{0};
  FakeBlockchainRpc rpc;
  swapcore::BackoffRetrier retrier;
  swapcore::ConfirmationPoller poller;
  std::vector<std::uint8_t> tx{0xDE, 0xAD};
};

// -----------------------------------------------------------------------------
// 1. Success on the third poll: three lookups, three intervals elapsed.
// -----------------------------------------------------------------------------
TEST_F(ConfirmationPollerTest, ConfirmedAfterSeveralPolls) {
  rpc.pushStatus(false);
  rpc.pushStatus(false);
  rpc.pushStatus(true);

  const auto result = submit();

  EXPECT_EQ(result.state, ConfirmationState::ConfirmedSuccess);
  EXPECT_EQ(result.signature, kSignatureA);
  EXPECT_EQ(result.polls, 3);
  EXPECT_FALSE(result.chain_error.has_value());
  EXPECT_EQ(rpc.status_calls.load(), 3);
  EXPECT_EQ(clock.now_ms(), 3000);
  EXPECT_EQ(rpc.last_submitted, tx);
}

// -----------------------------------------------------------------------------
// 2. A final error stops polling immediately and carries the chain error.
// -----------------------------------------------------------------------------
TEST_F(ConfirmationPollerTest, ChainErrorIsFinal) {
  rpc.pushStatus(true, std::string("InstructionError: [2, Custom(6001)]"));

  const auto result = submit();

  EXPECT_EQ(result.state, ConfirmationState::ConfirmedFailed);
  ASSERT_TRUE(result.chain_error.has_value());
  EXPECT_EQ(*result.chain_error, "InstructionError: [2, Custom(6001)]");
  EXPECT_EQ(result.polls, 1);
  EXPECT_EQ(rpc.submit_calls.load(), 1);
}

// -----------------------------------------------------------------------------
// 3. Never final: 30 s at 1 s intervals is exactly 30 lookups.
// Why: Timing out says nothing about the transaction; the signature must be
//      returned so the operator can verify it.
// -----------------------------------------------------------------------------
TEST_F(ConfirmationPollerTest, TimesOutAfterTimeoutOverInterval) {
  const auto result = submit(30000);

  EXPECT_EQ(result.state, ConfirmationState::TimedOut);
  EXPECT_EQ(result.signature, kSignatureA);
  EXPECT_EQ(result.polls, 30);
  EXPECT_EQ(rpc.status_calls.load(), 30);
  EXPECT_EQ(clock.now_ms(), 30000);
}

TEST_F(ConfirmationPollerTest, CustomIntervalChangesPollCount) {
  swapcore::ConfirmationPoller slow(rpc, retrier, clock, 2500);
  const auto result = slow.submitAndConfirm(tx, 10000);

  EXPECT_EQ(result.state, ConfirmationState::TimedOut);
  EXPECT_EQ(result.polls, 4);
}

// Why: The timeout is a hard wall-clock bound. A lookup after it could
//      report a success the caller has already written off.
TEST_F(ConfirmationPollerTest, UnevenTimeoutPollsAtTheDeadline) {
  const auto result = submit(2500);

  EXPECT_EQ(result.state, ConfirmationState::TimedOut);
  EXPECT_EQ(result.polls, 3);
  EXPECT_EQ(rpc.status_calls.load(), 3);
  EXPECT_EQ(clock.now_ms(), 2500);
}

TEST_F(ConfirmationPollerTest, SuccessOnTheShortenedLastPollCounts) {
  rpc.pushStatus(false);
  rpc.pushStatus(false);
  rpc.pushStatus(true);

  const auto result = submit(2500);

  EXPECT_EQ(result.state, ConfirmationState::ConfirmedSuccess);
  EXPECT_EQ(result.polls, 3);
  EXPECT_EQ(clock.now_ms(), 2500);
}

TEST(ConfirmationPollerDeadlineTest, OversleptDeadlineIsNotQueried) {
  swapcore::SimulationTimeProvider base{0};
  LaggingClock clock(base, 300);
  FakeBlockchainRpc rpc;
  swapcore::BackoffRetrier retrier(swapcore::RetryPolicy{}, clock);
  swapcore::ConfirmationPoller poller(rpc, retrier, clock);

  // Lookups at 1300; the second sleep ends at 2600, past the deadline.
  const auto result = poller.submitAndConfirm({0x01}, 2500);

  EXPECT_EQ(result.state, ConfirmationState::TimedOut);
  EXPECT_EQ(result.polls, 1);
  EXPECT_EQ(rpc.status_calls.load(), 1);
  EXPECT_EQ(base.now_ms(), 2600);
}

// -----------------------------------------------------------------------------
// 4. A lookup that throws is treated as "not yet" and polling continues.
// -----------------------------------------------------------------------------
TEST_F(ConfirmationPollerTest, StatusErrorsAreNotFinal) {
  rpc.status_script.push_back([]() -> swapcore::TransactionStatus {
    throw swapcore::TimeoutError("status timed out");
  });
  rpc.status_script.push_back([]() -> swapcore::TransactionStatus {
    throw swapcore::RpcError("node is behind", -32005);
  });
  rpc.pushStatus(true);

  const auto result = submit();

  EXPECT_EQ(result.state, ConfirmationState::ConfirmedSuccess);
  EXPECT_EQ(result.polls, 3);
}

// -----------------------------------------------------------------------------
// 5. Submission: ConnectionError is retried, a rejection is not.
// -----------------------------------------------------------------------------
TEST_F(ConfirmationPollerTest, SubmissionRetriesConnectionErrors) {
  rpc.submit_script.push_back([]() -> std::string {
    throw swapcore::ConnectionError("connection refused");
  });
  rpc.pushStatus(true);

  const auto result = submit();

  EXPECT_EQ(result.state, ConfirmationState::ConfirmedSuccess);
  EXPECT_EQ(rpc.submit_calls.load(), 2);
  EXPECT_EQ(clock.total_slept_ms(), 2000 + 1000);
}

TEST_F(ConfirmationPollerTest, RejectedSubmissionPropagates) {
  rpc.submit_script.push_back([]() -> std::string {
    throw swapcore::RpcError("Transaction simulation failed", -32002);
  });

  EXPECT_THROW(submit(), swapcore::RpcError);
  EXPECT_EQ(rpc.submit_calls.load(), 1);
  EXPECT_EQ(rpc.status_calls.load(), 0);
}

TEST_F(ConfirmationPollerTest, ServerErrorOnSubmitIsNotResubmitted) {
  rpc.submit_script.push_back([]() -> std::string {
    throw swapcore::ServerError("HTTP 502", 502);
  });

  EXPECT_THROW(submit(), swapcore::ServerError);
  EXPECT_EQ(rpc.submit_calls.load(), 1);
}

TEST(ConfirmationPollerConfigTest, RejectsNonPositiveInterval) {
  swapcore::SimulationTimeProvider clock;
  FakeBlockchainRpc rpc;
  swapcore::BackoffRetrier retrier(swapcore::RetryPolicy{}, clock);
  EXPECT_THROW(swapcore::ConfirmationPoller(rpc, retrier, clock, 0),
               std::invalid_argument);
}
