#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace swapcore {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  Unbounded FIFO handing values across the service's thread
//         boundaries.
//
// @details
// Two instances exist at run time:
//   - EventLoopThread: IPC thread and CLI push TradeRequestEvent, the
//     execution worker pops with pop_for().
//   - IpcServer: any publisher pushes telemetry, the IPC thread takes the
//     whole backlog with drain() once per loop turn.
//
// Waiting:
//   pop()       blocks until a value arrives.
//   pop_for(d)  blocks up to d; std::nullopt on timeout lets the caller
//               re-check a running flag without a second condition variable.
//   try_pop()   never blocks.
//   drain()     never blocks; empties the queue under one lock so a burst
//               of events costs one lock round-trip, not one per event.
//
// Thread model: every method may be called from any thread. size() is a
// snapshot and may be stale by the time it returns.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      items_.push_back(std::move(value));
    }
    not_empty_.notify_one();
  }

  T pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return !items_.empty(); });
    return takeFront();
  }

  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout,
                             [this] { return !items_.empty(); })) {
      return std::nullopt;
    }
    return takeFront();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    return takeFront();
  }

  // Everything queued, oldest first. Leaves the queue empty.
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard lock(mutex_);
      taken.swap(items_);
    }
    return std::vector<T>(std::make_move_iterator(taken.begin()),
                          std::make_move_iterator(taken.end()));
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

 private:
  // Caller holds mutex_ and has checked !items_.empty().
  T takeFront() {
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::deque<T> items_;
};

}  // namespace swapcore
