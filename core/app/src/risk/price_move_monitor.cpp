#include "swapcore/risk/price_move_monitor.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace swapcore {

PriceMoveMonitor::PriceMoveMonitor(CircuitBreaker& breaker,
                                   domain::AssetPair pair,
                                   double threshold_pct)
    : breaker_(breaker), pair_(std::move(pair)), threshold_pct_(threshold_pct) {}

std::optional<double> PriceMoveMonitor::impliedPrice(
    domain::TradeAction action, const domain::Quote& quote,
    const domain::AssetPair& pair) {
  if (quote.in_amount == 0 || quote.out_amount == 0) {
    return std::nullopt;
  }
  if (action == domain::TradeAction::Sell) {
    const double base = domain::fromSmallestUnits(quote.in_amount,
                                                  pair.base_decimals);
    const double quoted = domain::fromSmallestUnits(quote.out_amount,
                                                    pair.quote_decimals);
    return quoted / base;
  }
  const double quoted = domain::fromSmallestUnits(quote.in_amount,
                                                  pair.quote_decimals);
  const double base = domain::fromSmallestUnits(quote.out_amount,
                                                pair.base_decimals);
  return quoted / base;
}

bool PriceMoveMonitor::observe(domain::TradeAction action,
                               const domain::Quote& quote) {
  if (threshold_pct_ <= 0.0) {
    return false;
  }
  const auto price = impliedPrice(action, quote, pair_);
  if (!price) {
    return false;
  }

  double previous = 0.0;
  {
    std::lock_guard lock(mutex_);
    if (!last_price_) {
      last_price_ = price;
      return false;
    }
    previous = *last_price_;
    last_price_ = price;
  }

  const double change_pct = std::abs(*price - previous) / previous * 100.0;
  if (change_pct < threshold_pct_) {
    return false;
  }

  std::ostringstream reason;
  reason << std::fixed << std::setprecision(2) << "Price moved " << change_pct
         << "% between quotes (" << previous << " -> " << *price
         << "), threshold " << threshold_pct_ << "%";
  return breaker_.trip(reason.str());
}

std::optional<double> PriceMoveMonitor::lastPrice() const {
  std::lock_guard lock(mutex_);
  return last_price_;
}

}  // namespace swapcore
