#include "swapcore/storage/sqlite_execution_store.hpp"

#include "swapcore/errors/errors.hpp"

#include <sqlite3.h>

#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

namespace swapcore {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kCreateTable = R"sql(
CREATE TABLE IF NOT EXISTS trade_executions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp TEXT NOT NULL,
    timestamp_ms INTEGER NOT NULL,
    signal TEXT NOT NULL CHECK(signal IN ('BUY', 'SELL')),
    input_token TEXT NOT NULL,
    output_token TEXT NOT NULL,
    input_amount REAL,
    output_amount REAL CHECK(output_amount IS NULL OR output_amount >= 0),
    expected_output REAL,
    slippage_bps INTEGER NOT NULL,
    status TEXT NOT NULL CHECK(status IN ('pending', 'success', 'failed', 'dry_run')),
    failure_kind TEXT,
    transaction_signature TEXT UNIQUE,
    error_message TEXT,
    execution_duration_sec REAL,
    gas_fee_sol REAL CHECK(gas_fee_sol IS NULL OR gas_fee_sol >= 0),
    fee_estimated INTEGER NOT NULL DEFAULT 0,
    created_at DATETIME DEFAULT CURRENT_TIMESTAMP
))sql";

constexpr const char* kCreateIndexes = R"sql(
CREATE INDEX IF NOT EXISTS idx_trade_executions_timestamp
    ON trade_executions(timestamp_ms DESC);
CREATE INDEX IF NOT EXISTS idx_trade_executions_status
    ON trade_executions(status);
CREATE INDEX IF NOT EXISTS idx_trade_executions_signature
    ON trade_executions(transaction_signature);
)sql";

constexpr const char* kInsert = R"sql(
INSERT INTO trade_executions (
    timestamp, timestamp_ms, signal, input_token, output_token,
    input_amount, output_amount, expected_output, slippage_bps, status,
    failure_kind, transaction_signature, error_message,
    execution_duration_sec, gas_fee_sol, fee_estimated)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?))sql";

// Attempts that never left the process do not spend trade budget.
constexpr const char* kCountLive = R"sql(
SELECT COUNT(*) FROM trade_executions
WHERE timestamp_ms >= ?
  AND status != 'dry_run'
  AND NOT (status = 'failed'
           AND COALESCE(failure_kind, '') IN ('validation', 'risk_blocked')))sql";

constexpr const char* kSelectRecent = R"sql(
SELECT timestamp_ms, signal, input_token, output_token, input_amount,
       output_amount, expected_output, slippage_bps, status, failure_kind,
       transaction_signature, error_message, execution_duration_sec,
       gas_fee_sol, fee_estimated
FROM trade_executions
ORDER BY timestamp_ms DESC, id DESC
LIMIT ?)sql";

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
  throw StorageError(what + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

Statement prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    fail(db, "prepare failed");
  }
  return Statement(raw);
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index,
              const std::string& value) {
  if (sqlite3_bind_text(stmt, index, value.c_str(),
                        static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    fail(db, "bind failed");
  }
}

void bindOptionalText(sqlite3* db, sqlite3_stmt* stmt, int index,
                      const std::optional<std::string>& value) {
  if (!value) {
    sqlite3_bind_null(stmt, index);
    return;
  }
  bindText(db, stmt, index, *value);
}

// NaN and infinities are stored as NULL; SQLite has no representation.
void bindOptionalDouble(sqlite3_stmt* stmt, int index,
                        const std::optional<double>& value) {
  if (!value || !std::isfinite(*value)) {
    sqlite3_bind_null(stmt, index);
    return;
  }
  sqlite3_bind_double(stmt, index, *value);
}

std::string columnText(sqlite3_stmt* stmt, int column) {
  const auto* text = sqlite3_column_text(stmt, column);
  return text ? reinterpret_cast<const char*>(text) : std::string{};
}

std::optional<std::string> columnOptionalText(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return columnText(stmt, column);
}

std::optional<double> columnOptionalDouble(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_double(stmt, column);
}

// Rebuilds one record from a kSelectRecent row.
domain::TradeExecution readRow(sqlite3_stmt* stmt) {
  using namespace domain;

  TradeAttempt attempt;
  attempt.timestamp = ms_to_timestamp(sqlite3_column_int64(stmt, 0));
  const auto action = parseTradeAction(columnText(stmt, 1));
  if (!action) {
    throw StorageError("stored record has unknown signal '" +
                       columnText(stmt, 1) + "'");
  }
  attempt.action = *action;
  attempt.input_mint = columnText(stmt, 2);
  attempt.output_mint = columnText(stmt, 3);
  attempt.input_amount = columnOptionalDouble(stmt, 4).value_or(0.0);
  attempt.expected_output = columnOptionalDouble(stmt, 6);
  attempt.slippage_bps = sqlite3_column_int(stmt, 7);
  attempt.duration_ms = static_cast<std::int64_t>(
      std::llround(columnOptionalDouble(stmt, 12).value_or(0.0) * 1000.0));

  const std::string status_text = columnText(stmt, 8);
  const auto status = parseExecutionStatus(status_text);
  if (!status) {
    throw StorageError("stored record has unknown status '" + status_text +
                       "'");
  }

  ExecutionOutcome outcome;
  switch (*status) {
    case ExecutionStatus::Success: {
      SuccessOutcome s;
      s.transaction_signature = columnText(stmt, 10);
      s.output_amount = columnOptionalDouble(stmt, 5).value_or(0.0);
      s.fee_paid = columnOptionalDouble(stmt, 13);
      s.fee_estimated = sqlite3_column_int(stmt, 14) != 0;
      outcome = s;
      break;
    }
    case ExecutionStatus::Failed: {
      FailureOutcome f;
      f.kind = parseFailureKind(columnOptionalText(stmt, 9).value_or(""))
                   .value_or(FailureKind::Internal);
      f.error_message = columnOptionalText(stmt, 11).value_or("unknown error");
      outcome = f;
      break;
    }
    case ExecutionStatus::DryRun:
      outcome = DryRunOutcome{};
      break;
    case ExecutionStatus::Pending:
      outcome = PendingOutcome{};
      break;
  }

  try {
    return TradeExecution(std::move(attempt), std::move(outcome));
  } catch (const std::invalid_argument& e) {
    throw StorageError(std::string("stored record is inconsistent: ") +
                       e.what());
  }
}

}  // namespace

SqliteExecutionStore::SqliteExecutionStore(const std::string& path) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string message =
        db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError("cannot open database '" + path + "': " + message);
  }
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);

  try {
    createSchema();
  } catch (const StorageError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  std::cout << "[SqliteExecutionStore] opened " << path << "\n";
}

SqliteExecutionStore::~SqliteExecutionStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void SqliteExecutionStore::exec(const char* sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
    const std::string message = error ? error : "unknown error";
    sqlite3_free(error);
    throw StorageError("schema setup failed: " + message);
  }
}

void SqliteExecutionStore::createSchema() {
  exec(kCreateTable);
  exec(kCreateIndexes);
}

// -----------------------------------------------------------------------------
// saveExecution(): one INSERT, committed before returning
// -----------------------------------------------------------------------------
void SqliteExecutionStore::saveExecution(
    const domain::TradeExecution& execution) {
  std::lock_guard lock(mutex_);
  Statement stmt = prepare(db_, kInsert);
  sqlite3_stmt* s = stmt.get();

  const auto failure = execution.failureKind();

  bindText(db_, s, 1, format_iso8601_utc(execution.timestamp()));
  sqlite3_bind_int64(s, 2, timestamp_to_ms(execution.timestamp()));
  bindText(db_, s, 3, domain::toString(execution.action()));
  bindText(db_, s, 4, execution.inputMint());
  bindText(db_, s, 5, execution.outputMint());
  bindOptionalDouble(s, 6, execution.inputAmount());
  bindOptionalDouble(s, 7, execution.outputAmount());
  bindOptionalDouble(s, 8, execution.expectedOutput());
  sqlite3_bind_int(s, 9, execution.slippageBps());
  bindText(db_, s, 10, domain::toString(execution.status()));
  bindOptionalText(db_, s, 11,
                   failure ? std::optional<std::string>(domain::toString(*failure))
                           : std::nullopt);
  bindOptionalText(db_, s, 12, execution.transactionSignature());
  bindOptionalText(db_, s, 13, execution.errorMessage());
  sqlite3_bind_double(s, 14,
                      static_cast<double>(execution.durationMs()) / 1000.0);
  bindOptionalDouble(s, 15, execution.feePaid());
  sqlite3_bind_int(s, 16, execution.feeEstimated() ? 1 : 0);

  if (sqlite3_step(s) != SQLITE_DONE) {
    fail(db_, "insert into trade_executions failed");
  }
}

int SqliteExecutionStore::countLiveTradesSince(Timestamp since) {
  std::lock_guard lock(mutex_);
  Statement stmt = prepare(db_, kCountLive);
  sqlite3_bind_int64(stmt.get(), 1, timestamp_to_ms(since));

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    fail(db_, "count query failed");
  }
  return sqlite3_column_int(stmt.get(), 0);
}

std::vector<domain::TradeExecution> SqliteExecutionStore::recentExecutions(
    int limit) {
  std::lock_guard lock(mutex_);
  Statement stmt = prepare(db_, kSelectRecent);
  sqlite3_bind_int(stmt.get(), 1, limit);

  std::vector<domain::TradeExecution> records;
  for (;;) {
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      fail(db_, "history query failed");
    }
    records.push_back(readRow(stmt.get()));
  }
  return records;
}

}  // namespace swapcore
