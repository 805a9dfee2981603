#include "swapcore/execution/trade_execution_handler.hpp"

#include <iostream>
#include <utility>

namespace swapcore {

// -----------------------------------------------------------------------------
// Constructor: subscribe to TradeRequestEvent
// -----------------------------------------------------------------------------
TradeExecutionHandler::TradeExecutionHandler(EventBus& bus,
                                             ExecutionOrchestrator& orchestrator,
                                             EventSink telemetry)
    : bus_(bus), orchestrator_(orchestrator), telemetry_(std::move(telemetry)) {
  subscription_id_ = bus_.subscribe<TradeRequestEvent>(
      [this](const TradeRequestEvent& e) { onTradeRequest(e); });
}

// -----------------------------------------------------------------------------
// Destructor: unsubscribe
// -----------------------------------------------------------------------------
TradeExecutionHandler::~TradeExecutionHandler() {
  bus_.unsubscribe(subscription_id_);
}

// -----------------------------------------------------------------------------
// onTradeRequest: execute, then report the terminal record
// -----------------------------------------------------------------------------
void TradeExecutionHandler::onTradeRequest(const TradeRequestEvent& event) {
  std::cout << "[TradeExecutionHandler] request " << event.request_id
            << " picked up\n";

  if (telemetry_) {
    telemetry_(event);
  }

  TradeExecutionEvent result{event.request_id,
                             orchestrator_.executeTrade(event.request)};
  completed_.fetch_add(1);

  if (telemetry_) {
    telemetry_(std::move(result));
  }
}

}  // namespace swapcore
