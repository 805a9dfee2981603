#pragma once

#include "swapcore/domain/trade_action.hpp"
#include "swapcore/time/time_utils.hpp"

#include <string>

namespace swapcore {

// -----------------------------------------------------------------------------
// RiskBlockEvent
// -----------------------------------------------------------------------------
// Responsibility: Notifies that a request was refused before reaching the
// network, by the size check or by RiskGate. `reason` is the same text that
// ends up in the failed record's error message.
// -----------------------------------------------------------------------------
struct RiskBlockEvent {
  domain::TradeAction action{domain::TradeAction::Buy};
  std::string reason;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// CircuitBreakerEvent: kill-switch state change
// -----------------------------------------------------------------------------
//
// @brief  Published by CircuitBreaker listeners on every trip() and reset()
//         that changes state.
//
// @details
// active=true carries the trip reason (manual HALT text or the price-move
// description from PriceMoveMonitor). active=false carries an empty reason.
// -----------------------------------------------------------------------------
struct CircuitBreakerEvent {
  bool active{false};
  std::string reason;
  Timestamp timestamp{};
};

}  // namespace swapcore
