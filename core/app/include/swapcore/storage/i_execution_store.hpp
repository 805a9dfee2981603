#pragma once

#include "swapcore/domain/trade_execution.hpp"
#include "swapcore/time/time_utils.hpp"

#include <vector>

namespace swapcore {

// -----------------------------------------------------------------------------
// IExecutionStore: durable audit log of trade executions
// -----------------------------------------------------------------------------
//
// saveExecution(record)
//   Returns once the record is durable. Throws StorageError.
//
// countLiveTradesSince(since)
//   Number of records with timestamp >= since that consumed trade budget:
//   status != dry_run, and not a failure of kind validation or risk_blocked.
//   Throws StorageError.
//
// recentExecutions(limit)
//   Newest first. Throws StorageError.
//
// RiskGate reads the counts on every check; nothing is cached in process.
// -----------------------------------------------------------------------------
class IExecutionStore {
 public:
  virtual ~IExecutionStore() = default;

  virtual void saveExecution(const domain::TradeExecution& execution) = 0;

  virtual int countLiveTradesSince(Timestamp since) = 0;

  virtual std::vector<domain::TradeExecution> recentExecutions(int limit) = 0;
};

}  // namespace swapcore
