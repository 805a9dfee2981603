#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace swapcore {

// Wall-clock instant used by records and events.
using Timestamp = std::chrono::system_clock::time_point;

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerHour = 60 * 60 * kMillisPerSecond;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between Timestamp and int64_t epoch
//         milliseconds, and render timestamps for the audit log.
//
// @details
// ITimeProvider speaks int64_t milliseconds; TradeExecution carries a
// Timestamp. These one-liners bridge the two. The ISO-8601 form is what the
// SQLite store writes and what the CLI prints.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// start_of_utc_day_ms
// -------------------------------------------------------------------------
// @brief  Returns 00:00:00.000 UTC of the day containing epoch_ms.
//
// @details
// The daily trade cap counts trades of the current UTC calendar day, not
// the trailing 24 hours. Floor division keeps pre-epoch values correct.
// -------------------------------------------------------------------------
inline std::int64_t start_of_utc_day_ms(std::int64_t epoch_ms) {
  std::int64_t days = epoch_ms / kMillisPerDay;
  if (epoch_ms % kMillisPerDay < 0) {
    --days;
  }
  return days * kMillisPerDay;
}

// -------------------------------------------------------------------------
// format_iso8601_utc
// -------------------------------------------------------------------------
// @brief  Formats a Timestamp as "YYYY-MM-DDTHH:MM:SS.mmmZ".
// -------------------------------------------------------------------------
inline std::string format_iso8601_utc(Timestamp tp) {
  const std::int64_t ms = timestamp_to_ms(tp);
  std::int64_t secs = ms / kMillisPerSecond;
  std::int64_t millis = ms % kMillisPerSecond;
  if (millis < 0) {
    millis += kMillisPerSecond;
    --secs;
  }

  std::time_t tt = static_cast<std::time_t>(secs);
  std::tm utc{};
  gmtime_r(&tt, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return out.str();
}

}  // namespace swapcore
