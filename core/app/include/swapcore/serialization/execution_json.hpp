#pragma once

#include "swapcore/domain/trade_execution.hpp"
#include "swapcore/domain/trade_request.hpp"
#include "swapcore/events/event.hpp"

#include <nlohmann/json.hpp>

namespace swapcore {

// -----------------------------------------------------------------------------
// JSON views of domain values
// -----------------------------------------------------------------------------
// Shared by the IPC telemetry stream, the TRADE command and the CLI, so a
// record printed by `swapcore_engine trade` and one published on the PUB
// socket have the same shape.
// -----------------------------------------------------------------------------

// Field names follow the trade_executions table. Fields that do not apply
// to the record's status are emitted as null.
nlohmann::json toJson(const domain::TradeExecution& execution);

// -----------------------------------------------------------------------------
// tradeRequestFromJson(doc, defaults)
// -----------------------------------------------------------------------------
//   {"action": "BUY"|"SELL", "amount": 0.01,
//    "slippage_bps": 50, "dry_run": true}
//
// "action" and "amount" are required; the other two fall back to
// `defaults`. Throws std::invalid_argument for a missing or unknown action,
// a non-numeric amount or a mistyped optional field. Range checks on the
// amount and slippage are left to the orchestrator, which records them.
// -----------------------------------------------------------------------------
domain::TradeRequest tradeRequestFromJson(const nlohmann::json& doc,
                                          const domain::TradeRequest& defaults);

// Telemetry form of an event: {"type": "...", ...}.
nlohmann::json eventToJson(const Event& event);

}  // namespace swapcore
