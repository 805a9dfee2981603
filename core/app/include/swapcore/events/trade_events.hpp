#pragma once

#include "swapcore/domain/trade_execution.hpp"
#include "swapcore/domain/trade_request.hpp"
#include "swapcore/time/time_utils.hpp"

#include <cstdint>

namespace swapcore {

// -----------------------------------------------------------------------------
// TradeRequestEvent
// -----------------------------------------------------------------------------
// Responsibility: Hands one TradeRequest to the execution worker.
// Published by TradeService onto the execution loop; consumed by
// TradeExecutionHandler on the loop thread. request_id comes from
// RequestIdGenerator and is echoed to the IPC client, so the later
// TradeExecutionEvent on the telemetry socket can be matched to it.
// -----------------------------------------------------------------------------
struct TradeRequestEvent {
  std::uint64_t request_id{0};
  domain::TradeRequest request;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// TradeExecutionEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries the terminal record of one request. Published once
// per TradeRequestEvent, after the record has been persisted.
// -----------------------------------------------------------------------------
struct TradeExecutionEvent {
  std::uint64_t request_id{0};
  domain::TradeExecution execution;
};

}  // namespace swapcore
