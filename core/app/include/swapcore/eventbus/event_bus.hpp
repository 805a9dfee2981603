#pragma once

#include "swapcore/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace swapcore {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe channel for Event values.
//
// Two buses exist in a running service:
//   - the telemetry bus owned by TradeService, which collects RetryEvent,
//     RiskBlockEvent, CircuitBreakerEvent and TradeExecutionEvent and
//     forwards them to the IPC PUB socket;
//   - the bus inside the execution EventLoopThread, on which
//     TradeExecutionHandler receives TradeRequestEvent.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread. A callback that
// throws std::exception is logged and skipped; the remaining subscribers
// still receive the event.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback invoked for every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback invoked only when the event holds EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // A publish() already in progress on another thread may still invoke the
  // callback once; later publishes will not.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the event to every current subscriber before returning. The
  // subscriber list is copied under the lock and invoked outside it, so a
  // callback may itself publish or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace swapcore
