#pragma once

#include <atomic>
#include <cstdint>

namespace swapcore {

// -----------------------------------------------------------------------------
// RequestIdGenerator: source of trade request ids
// -----------------------------------------------------------------------------
//
// @brief  Atomic counter handing out ids for TradeRequestEvent. The id is
//         returned to the IPC client that submitted the trade and repeated
//         in the matching TradeExecutionEvent.
//
// @details
// Starts at 1; 0 means "not assigned". Ids are unique per process run only,
// they are not persisted. Owned by TradeService as a value member; several
// IPC clients may submit concurrently, hence the atomic.
// -----------------------------------------------------------------------------
class RequestIdGenerator {
 public:
  RequestIdGenerator() = default;

  RequestIdGenerator(const RequestIdGenerator&) = delete;
  RequestIdGenerator& operator=(const RequestIdGenerator&) = delete;
  RequestIdGenerator(RequestIdGenerator&&) = delete;
  RequestIdGenerator& operator=(RequestIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace swapcore
