// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for swapcore::EventBus and swapcore::EventLoopThread.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Unsubscribe stops delivery; unknown ids are harmless
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - A throwing subscriber does not starve the others
//   - EventLoopThread delivers pushed events on its worker, in order
//
// Design note: EventBus tests are single-threaded. The EventLoopThread tests
// wait on an atomic counter with a deadline instead of sleeping blindly.
// =============================================================================

#include "swapcore/concurrent/event_loop_thread.hpp"
#include "swapcore/eventbus/event_bus.hpp"
#include "swapcore/events/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

swapcore::RetryEvent makeRetry(const std::string& operation, int attempt) {
  swapcore::RetryEvent e;
  e.operation = operation;
  e.attempt = attempt;
  e.max_attempts = 3;
  e.error_kind = "ConnectionError";
  e.error_message = "connection refused";
  e.delay_ms = 2000;
  return e;
}

swapcore::TradeRequestEvent makeRequest(std::uint64_t id) {
  swapcore::TradeRequestEvent e;
  e.request_id = id;
  e.request.action = swapcore::domain::TradeAction::Sell;
  e.request.amount = 0.01;
  return e;
}

// Spins until `pred` holds or one second passes.
template <typename Pred>
bool waitFor(Pred pred) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(1);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

}  // namespace

class EventBusTest : public ::testing::Test {
 protected:
  swapcore::EventBus bus;
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// Why: The IPC telemetry bridge subscribes generically and must see every
//      event, or the PUB stream silently drops a category.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const swapcore::Event&) { ++call_count; });

  bus.publish(makeRetry("get quote", 1));
  bus.publish(makeRequest(1));
  bus.publish(swapcore::CircuitBreakerEvent{true, "manual", {}});
  bus.publish(swapcore::RiskBlockEvent{swapcore::domain::TradeAction::Buy,
                                       "Hourly trade limit reached (5/5)", {}});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered type, with its data.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersAndKeepsPayload) {
  std::vector<int> attempts;
  bus.subscribe<swapcore::RetryEvent>(
      [&attempts](const swapcore::RetryEvent& e) {
        EXPECT_EQ(e.operation, "submit transaction");
        EXPECT_EQ(e.error_kind, "ConnectionError");
        attempts.push_back(e.attempt);
      });

  bus.publish(makeRetry("submit transaction", 1));
  bus.publish(makeRequest(7));
  bus.publish(makeRetry("submit transaction", 2));

  EXPECT_EQ(attempts, (std::vector<int>{1, 2}));
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id), the callback must not fire again.
// Why: TradeService detaches its IPC bridge before destroying the server; a
//      late delivery would touch a dead socket.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe([&call_count](const swapcore::Event&) {
    ++call_count;
  });
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.publish(makeRequest(1));
  bus.unsubscribe(id);
  bus.publish(makeRequest(2));

  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnsubscribeUnknownIdAndEmptyPublishAreNoOps) {
  EXPECT_NO_THROW(bus.unsubscribe(9999));
  EXPECT_NO_THROW(bus.publish(makeRequest(1)));
}

// -----------------------------------------------------------------------------
// 4. A subscriber that publishes inside its callback must not deadlock.
// Scenario: a CircuitBreakerEvent listener reacts by publishing a
//           RiskBlockEvent, which a second subscriber receives.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int blocks = 0;
  bus.subscribe<swapcore::RiskBlockEvent>(
      [&blocks](const swapcore::RiskBlockEvent&) { ++blocks; });
  bus.subscribe<swapcore::CircuitBreakerEvent>(
      [this](const swapcore::CircuitBreakerEvent& e) {
        bus.publish(swapcore::RiskBlockEvent{
            swapcore::domain::TradeAction::Sell, e.reason, e.timestamp});
      });

  bus.publish(swapcore::CircuitBreakerEvent{true, "price jump", {}});

  EXPECT_EQ(blocks, 1);
}

// -----------------------------------------------------------------------------
// 5. A subscriber that throws is skipped; later subscribers still run.
// Why: A broken telemetry consumer must never abort trade execution on the
//      publishing thread.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberDoesNotStarveOthers) {
  int delivered = 0;
  bus.subscribe([](const swapcore::Event&) {
    throw std::runtime_error("telemetry sink down");
  });
  bus.subscribe([&delivered](const swapcore::Event&) { ++delivered; });

  EXPECT_NO_THROW(bus.publish(makeRequest(1)));
  EXPECT_EQ(delivered, 1);
}

// -----------------------------------------------------------------------------
// 6. EventLoopThread publishes pushed events on its own thread, FIFO.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DeliversPushedEventsInOrderOnWorker) {
  swapcore::EventLoopThread loop("TestLoop");
  const auto caller = std::this_thread::get_id();

  std::mutex mutex;
  std::vector<std::uint64_t> seen;
  std::atomic<bool> on_worker{true};
  loop.eventBus().subscribe<swapcore::TradeRequestEvent>(
      [&](const swapcore::TradeRequestEvent& e) {
        if (std::this_thread::get_id() == caller) {
          on_worker = false;
        }
        std::lock_guard lock(mutex);
        seen.push_back(e.request_id);
      });

  loop.start();
  EXPECT_TRUE(loop.isRunning());
  for (std::uint64_t id = 1; id <= 5; ++id) {
    loop.push(makeRequest(id));
  }

  ASSERT_TRUE(waitFor([&] {
    std::lock_guard lock(mutex);
    return seen.size() == 5;
  }));
  loop.stop();

  EXPECT_FALSE(loop.isRunning());
  EXPECT_TRUE(on_worker.load());
  EXPECT_EQ(seen, (std::vector<std::uint64_t>{1, 2, 3, 4, 5}));
}

TEST(EventLoopThreadTest, StartAndStopAreIdempotent) {
  swapcore::EventLoopThread loop;
  loop.start();
  loop.start();
  loop.stop();
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
}

// -----------------------------------------------------------------------------
// 7. Events pushed before start() wait in the queue and are delivered once
//    the worker runs.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, EventsQueuedBeforeStartAreDelivered) {
  swapcore::EventLoopThread loop;
  std::atomic<int> delivered{0};
  loop.eventBus().subscribe([&delivered](const swapcore::Event&) {
    ++delivered;
  });

  loop.push(makeRequest(1));
  loop.push(makeRequest(2));
  EXPECT_EQ(loop.pending(), 2u);

  loop.start();
  EXPECT_TRUE(waitFor([&] { return delivered.load() == 2; }));
  EXPECT_EQ(loop.pending(), 0u);
}
