#pragma once

#include "swapcore/eventbus/event_bus.hpp"
#include "swapcore/events/event.hpp"
#include "swapcore/events/trade_events.hpp"
#include "swapcore/execution/execution_orchestrator.hpp"

#include <atomic>
#include <cstdint>

namespace swapcore {

// -----------------------------------------------------------------------------
// TradeExecutionHandler
// -----------------------------------------------------------------------------
// Responsibility: Listens for TradeRequestEvent on the execution worker's
// EventBus, runs each request through the ExecutionOrchestrator and
// forwards the resulting TradeExecutionEvent to the telemetry sink.
//
// Because the bus belongs to a single EventLoopThread, requests queued
// through it run strictly one after another; a live trade that is polling
// for confirmation holds back the next request until it finishes.
//
// Thread model:
// - Callbacks run on the execution worker thread only.
// - completed() may be read from any thread.
// Ownership:
// - Borrows the bus and the orchestrator; both must outlive the handler.
// -----------------------------------------------------------------------------
class TradeExecutionHandler {
 public:
  TradeExecutionHandler(EventBus& bus, ExecutionOrchestrator& orchestrator,
                        EventSink telemetry);

  // Unsubscribes so no callback runs after destruction.
  ~TradeExecutionHandler();

  TradeExecutionHandler(const TradeExecutionHandler&) = delete;
  TradeExecutionHandler& operator=(const TradeExecutionHandler&) = delete;

  // Number of requests executed so far.
  std::uint64_t completed() const { return completed_.load(); }

 private:
  void onTradeRequest(const TradeRequestEvent& event);

  EventBus& bus_;
  ExecutionOrchestrator& orchestrator_;
  EventSink telemetry_;
  EventBus::SubscriptionId subscription_id_{0};
  std::atomic<std::uint64_t> completed_{0};
};

}  // namespace swapcore
