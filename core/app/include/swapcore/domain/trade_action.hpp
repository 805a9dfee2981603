#pragma once

#include <optional>
#include <string>

namespace swapcore {
namespace domain {

// -----------------------------------------------------------------------------
// TradeAction
// -----------------------------------------------------------------------------
// Responsibility: Encodes the trading direction relative to the base asset.
//   Buy  → spend the quote asset, receive the base asset.
//   Sell → spend the base asset, receive the quote asset.
// Why enum class: an action outside {Buy, Sell} cannot be represented, so the
// orchestrator never has to handle one. String input from the CLI or the IPC
// socket goes through parseTradeAction() at the boundary.
// -----------------------------------------------------------------------------
enum class TradeAction {
  Buy,
  Sell,
};

// "BUY" / "SELL".
const char* toString(TradeAction action);

// Case-insensitive parse of "buy"/"sell"; std::nullopt for anything else.
std::optional<TradeAction> parseTradeAction(const std::string& text);

}  // namespace domain
}  // namespace swapcore
