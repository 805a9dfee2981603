#include "swapcore/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>
#include <variant>
#include <vector>

namespace swapcore {

namespace {

// How long the worker waits on an empty queue before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();

  // Requests that never started are reported by id so an operator can
  // resubmit them; other events are only counted.
  const std::vector<Event> leftover = queue_.drain();
  for (const Event& event : leftover) {
    if (const auto* request = std::get_if<TradeRequestEvent>(&event)) {
      std::cerr << "[" << name_ << "] discarded trade request "
                << request->request_id << " queued before shutdown\n";
    }
  }
  if (!leftover.empty()) {
    std::cerr << "[" << name_ << "] stopped with " << leftover.size()
              << " queued event(s) discarded\n";
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
// pop_for() returns on either an item or the idle timeout, so stop() is
// noticed within kIdleWaitTimeout even when nothing is queued.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (event) {
      bus_.publish(*event);
    }
  }
}

}  // namespace swapcore
