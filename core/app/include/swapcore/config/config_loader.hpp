#pragma once

#include "swapcore/domain/asset_pair.hpp"
#include "swapcore/domain/trade_limits.hpp"
#include "swapcore/network/curl_http_client.hpp"
#include "swapcore/retry/backoff_retrier.hpp"
#include "swapcore/swap/jupiter_swap_aggregator.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace swapcore {

struct RpcSettings {
  std::string url{"https://api.mainnet-beta.solana.com"};
  std::string commitment{"confirmed"};
};

struct ConfirmationSettings {
  std::int64_t timeout_ms{30000};
  std::int64_t poll_interval_ms{1000};
};

struct IpcEndpoints {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig: everything the engine reads at startup
// -----------------------------------------------------------------------------
//
// @brief  Plain aggregate of settings; every member has a working default
//         except the wallet secret, which is only needed for live trades.
//
// @details
// JSON layout accepted by loadConfig() (every key optional):
//
//   {
//     "rpc":            {"url", "commitment"},
//     "jupiter":        {"quote_url", "swap_url"},
//     "pair":           {"base_mint", "base_decimals",
//                        "quote_mint", "quote_decimals"},
//     "limits":         {"max_trade_size", "max_trades_per_day",
//                        "max_trades_per_hour"},
//     "trading":        {"default_slippage_bps", "dry_run",
//                        "estimated_fee_sol"},
//     "confirmation":   {"timeout_ms", "poll_interval_ms"},
//     "retry":          {"max_attempts", "backoff_factor", "base_delay_ms"},
//     "circuit_breaker":{"price_change_pct"},
//     "database":       {"path"},
//     "wallet":         {"private_key"},
//     "http":           {"connect_timeout_ms", "total_timeout_ms"},
//     "ipc":            {"command_endpoint", "telemetry_endpoint"}
//   }
//
// estimated_fee_sol is the fee recorded when the confirmed transaction's
// actual fee cannot be read back from the chain. Records carrying it are
// flagged fee_estimated.
// -----------------------------------------------------------------------------
struct EngineConfig {
  RpcSettings rpc;
  JupiterEndpoints jupiter;
  domain::AssetPair pair;
  domain::TradeLimits limits;
  int default_slippage_bps{50};
  bool dry_run{true};
  double estimated_fee_sol{0.000005};
  ConfirmationSettings confirmation;
  RetryPolicy retry;
  double circuit_breaker_price_change_pct{20.0};
  std::string database_path{"swapcore_trades.db"};
  std::optional<std::string> wallet_private_key;
  HttpTimeouts http;
  IpcEndpoints ipc;
};

// Returns the value of an environment variable, or nullopt if unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// std::getenv-backed lookup.
std::optional<std::string> systemEnvironment(const std::string& name);

// Reads and parses the JSON file at `path`. Throws ConfigError if the file
// cannot be opened, is not valid JSON or has a mistyped key.
EngineConfig loadConfig(const std::string& path);

// Overlays `doc` onto the defaults. Throws ConfigError on mistyped keys.
EngineConfig parseConfig(const nlohmann::json& doc);

// -----------------------------------------------------------------------------
// applyEnvironmentOverrides(config, lookup)
// -----------------------------------------------------------------------------
//   SWAPCORE_RPC_URL             → rpc.url
//   SWAPCORE_WALLET_PRIVATE_KEY  → wallet_private_key
//   SWAPCORE_DATABASE_PATH       → database_path
//   SWAPCORE_DRY_RUN             → dry_run ("1"/"true"/"yes" or
//                                  "0"/"false"/"no", case-insensitive)
//
// Empty values are ignored. An unrecognised SWAPCORE_DRY_RUN value throws
// ConfigError.
// -----------------------------------------------------------------------------
void applyEnvironmentOverrides(EngineConfig& config,
                               const EnvLookup& lookup = systemEnvironment);

// Throws ConfigError naming the first out-of-range setting.
void validateConfig(const EngineConfig& config);

}  // namespace swapcore
