#include "swapcore/risk/circuit_breaker.hpp"

#include <iostream>

namespace swapcore {

bool CircuitBreaker::trip(const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    if (active_) {
      return false;
    }
    active_ = true;
    reason_ = reason;
  }
  std::cerr << "[CircuitBreaker] TRIPPED: " << reason
            << ". Live trading halted.\n";
  notify(true, reason);
  return true;
}

bool CircuitBreaker::reset() {
  {
    std::lock_guard lock(mutex_);
    if (!active_) {
      return false;
    }
    active_ = false;
    reason_.clear();
  }
  std::cout << "[CircuitBreaker] reset. Live trading resumed.\n";
  notify(false, std::string{});
  return true;
}

bool CircuitBreaker::isActive() const {
  std::lock_guard lock(mutex_);
  return active_;
}

std::string CircuitBreaker::reason() const {
  std::lock_guard lock(mutex_);
  return reason_;
}

void CircuitBreaker::addListener(Listener listener) {
  std::lock_guard lock(mutex_);
  listeners_.push_back(std::move(listener));
}

void CircuitBreaker::notify(bool active, const std::string& reason) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = listeners_;
  }
  for (const auto& listener : snapshot) {
    listener(active, reason);
  }
}

}  // namespace swapcore
