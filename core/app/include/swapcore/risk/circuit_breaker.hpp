#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace swapcore {

// -----------------------------------------------------------------------------
// CircuitBreaker: process-wide kill switch for live trading
// -----------------------------------------------------------------------------
//
// @brief  A flag plus the reason it was set. While active, RiskGate blocks
//         every live request. Dry runs are unaffected.
//
// @details
// Set by:
//   - an operator: the IPC HALT command or the CLI,
//   - PriceMoveMonitor: a price jump between consecutive quotes.
// Cleared only by reset() (IPC RESUME or process restart).
//
// Listeners are notified after every call that changes the state, outside
// the internal lock, so a listener may query the breaker. TradeService uses
// one to publish CircuitBreakerEvent.
//
// Thread model:
//   All methods are thread-safe. Trips from the IPC thread and the execution
//   worker may race; the first one wins and keeps its reason.
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  using Listener = std::function<void(bool active, const std::string& reason)>;

  CircuitBreaker() = default;

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  // Returns true if the breaker was inactive and is now active.
  bool trip(const std::string& reason);

  // Returns true if the breaker was active and is now cleared.
  bool reset();

  bool isActive() const;

  // Reason of the current trip; empty while inactive.
  std::string reason() const;

  void addListener(Listener listener);

 private:
  void notify(bool active, const std::string& reason);

  mutable std::mutex mutex_;
  bool active_{false};
  std::string reason_;
  std::vector<Listener> listeners_;
};

}  // namespace swapcore
