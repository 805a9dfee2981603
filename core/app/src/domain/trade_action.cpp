#include "swapcore/domain/trade_action.hpp"

#include <algorithm>
#include <cctype>

namespace swapcore {
namespace domain {

const char* toString(TradeAction action) {
  switch (action) {
    case TradeAction::Buy:  return "BUY";
    case TradeAction::Sell: return "SELL";
  }
  return "UNKNOWN";
}

std::optional<TradeAction> parseTradeAction(const std::string& text) {
  std::string upper(text);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "BUY") {
    return TradeAction::Buy;
  }
  if (upper == "SELL") {
    return TradeAction::Sell;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace swapcore
