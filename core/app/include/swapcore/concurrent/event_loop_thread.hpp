#pragma once

#include "swapcore/concurrent/thread_safe_queue.hpp"
#include "swapcore/eventbus/event_bus.hpp"
#include "swapcore/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace swapcore {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: One worker thread draining a ThreadSafeQueue<Event> and
// publishing each event on its own EventBus. Every subscriber of that bus
// runs on the worker, so work posted here is processed one item at a time in
// FIFO order.
//
// TradeService uses one instance as its execution worker: TRADE commands are
// pushed as TradeRequestEvent and TradeExecutionHandler handles them on the
// loop thread, which gives the "one live trade in flight" serialization the
// engine itself does not impose.
//
// Thread model: start(), stop() and push() may be called from any thread.
// Subscriber callbacks run only on the worker.
//
// Shutdown: stop() lets the item currently being handled finish and then
// exits. Items still queued are discarded; each discarded TradeRequestEvent
// is logged with its request_id.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoopThread");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Blocks until the worker has exited.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  // Items waiting to be handled (excludes the one in progress).
  std::size_t pending() const { return queue_.size(); }

  bool isRunning() const { return running_.load(); }

  EventBus& eventBus() { return bus_; }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace swapcore
