#pragma once

#include "swapcore/storage/i_execution_store.hpp"

#include <mutex>
#include <string>

struct sqlite3;

namespace swapcore {

// -----------------------------------------------------------------------------
// SqliteExecutionStore: IExecutionStore on a single SQLite database file
// -----------------------------------------------------------------------------
//
// @brief  Owns one sqlite3 connection and the trade_executions table.
//
// @details
// Schema (created if missing):
//   trade_executions(
//     id, timestamp (ISO-8601 UTC), timestamp_ms, signal, input_token,
//     output_token, input_amount, output_amount, expected_output,
//     slippage_bps, status, failure_kind, transaction_signature UNIQUE,
//     error_message, execution_duration_sec, gas_fee_sol, fee_estimated,
//     created_at)
//   plus indexes on timestamp_ms, status and transaction_signature.
//
// timestamp_ms is what range queries use; the ISO column is for humans
// reading the file with the sqlite3 shell.
//
// Every write runs synchronously in autocommit mode, so saveExecution()
// returns only after SQLite has committed the row.
//
// Thread model:
//   One connection guarded by mutex_. Calls from the execution worker, the
//   IPC thread (STATUS) and std::async callers are serialized.
//
// Ownership:
//   The destructor closes the connection.
// -----------------------------------------------------------------------------
class SqliteExecutionStore final : public IExecutionStore {
 public:
  // Opens (creating if needed) the database at `path`. ":memory:" gives a
  // private in-memory database. Throws StorageError.
  explicit SqliteExecutionStore(const std::string& path);
  ~SqliteExecutionStore() override;

  SqliteExecutionStore(const SqliteExecutionStore&) = delete;
  SqliteExecutionStore& operator=(const SqliteExecutionStore&) = delete;

  void saveExecution(const domain::TradeExecution& execution) override;

  int countLiveTradesSince(Timestamp since) override;

  std::vector<domain::TradeExecution> recentExecutions(int limit) override;

 private:
  void exec(const char* sql);
  void createSchema();

  std::mutex mutex_;
  sqlite3* db_{nullptr};
};

}  // namespace swapcore
