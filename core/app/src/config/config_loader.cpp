#include "swapcore/config/config_loader.hpp"

#include "swapcore/errors/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace swapcore {

namespace {

using nlohmann::json;

const json& section(const json& doc, const char* name) {
  static const json kEmpty = json::object();
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config section '") + name +
                      "' must be an object");
  }
  return *it;
}

template <typename T>
void read(const json& sect, const char* sect_name, const char* key, T& out) {
  auto it = sect.find(key);
  if (it == sect.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("config key '") + sect_name + "." + key +
                      "': " + e.what());
  }
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

template <typename T>
void requireRange(const char* name, T value, T lo, T hi) {
  if (value < lo || value > hi) {
    std::ostringstream msg;
    msg << name << " must be in [" << lo << ", " << hi << "], got " << value;
    throw ConfigError(msg.str());
  }
}

void requireNonEmpty(const char* name, const std::string& value) {
  if (value.empty()) {
    throw ConfigError(std::string(name) + " must not be empty");
  }
}

}  // namespace

std::optional<std::string> systemEnvironment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  json doc;
  try {
    in >> doc;
  } catch (const json::parse_error& e) {
    throw ConfigError("config file '" + path + "' is not valid JSON: " +
                      e.what());
  }
  if (!doc.is_object()) {
    throw ConfigError("config file '" + path + "' must hold a JSON object");
  }

  std::cout << "[Config] loaded " << path << "\n";
  return parseConfig(doc);
}

// -----------------------------------------------------------------------------
// parseConfig(): section by section, keeping defaults for absent keys
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const json& doc) {
  EngineConfig cfg;

  const json& rpc = section(doc, "rpc");
  read(rpc, "rpc", "url", cfg.rpc.url);
  read(rpc, "rpc", "commitment", cfg.rpc.commitment);

  const json& jupiter = section(doc, "jupiter");
  read(jupiter, "jupiter", "quote_url", cfg.jupiter.quote_url);
  read(jupiter, "jupiter", "swap_url", cfg.jupiter.swap_url);

  const json& pair = section(doc, "pair");
  read(pair, "pair", "base_mint", cfg.pair.base_mint);
  read(pair, "pair", "base_decimals", cfg.pair.base_decimals);
  read(pair, "pair", "quote_mint", cfg.pair.quote_mint);
  read(pair, "pair", "quote_decimals", cfg.pair.quote_decimals);

  const json& limits = section(doc, "limits");
  read(limits, "limits", "max_trade_size", cfg.limits.max_trade_size);
  read(limits, "limits", "max_trades_per_day", cfg.limits.max_trades_per_day);
  read(limits, "limits", "max_trades_per_hour",
       cfg.limits.max_trades_per_hour);

  const json& trading = section(doc, "trading");
  read(trading, "trading", "default_slippage_bps", cfg.default_slippage_bps);
  read(trading, "trading", "dry_run", cfg.dry_run);
  read(trading, "trading", "estimated_fee_sol", cfg.estimated_fee_sol);

  const json& confirmation = section(doc, "confirmation");
  read(confirmation, "confirmation", "timeout_ms",
       cfg.confirmation.timeout_ms);
  read(confirmation, "confirmation", "poll_interval_ms",
       cfg.confirmation.poll_interval_ms);

  const json& retry = section(doc, "retry");
  read(retry, "retry", "max_attempts", cfg.retry.max_attempts);
  read(retry, "retry", "backoff_factor", cfg.retry.backoff_factor);
  read(retry, "retry", "base_delay_ms", cfg.retry.base_delay_ms);

  const json& breaker = section(doc, "circuit_breaker");
  read(breaker, "circuit_breaker", "price_change_pct",
       cfg.circuit_breaker_price_change_pct);

  const json& database = section(doc, "database");
  read(database, "database", "path", cfg.database_path);

  const json& wallet = section(doc, "wallet");
  std::string private_key;
  read(wallet, "wallet", "private_key", private_key);
  if (!private_key.empty()) {
    cfg.wallet_private_key = private_key;
  }

  const json& http = section(doc, "http");
  read(http, "http", "connect_timeout_ms", cfg.http.connect_timeout_ms);
  read(http, "http", "total_timeout_ms", cfg.http.total_timeout_ms);

  const json& ipc = section(doc, "ipc");
  read(ipc, "ipc", "command_endpoint", cfg.ipc.command_endpoint);
  read(ipc, "ipc", "telemetry_endpoint", cfg.ipc.telemetry_endpoint);

  return cfg;
}

void applyEnvironmentOverrides(EngineConfig& config, const EnvLookup& lookup) {
  if (auto v = lookup("SWAPCORE_RPC_URL"); v && !v->empty()) {
    config.rpc.url = *v;
  }
  if (auto v = lookup("SWAPCORE_WALLET_PRIVATE_KEY"); v && !v->empty()) {
    config.wallet_private_key = *v;
  }
  if (auto v = lookup("SWAPCORE_DATABASE_PATH"); v && !v->empty()) {
    config.database_path = *v;
  }
  if (auto v = lookup("SWAPCORE_DRY_RUN"); v && !v->empty()) {
    const std::string flag = lower(*v);
    if (flag == "1" || flag == "true" || flag == "yes") {
      config.dry_run = true;
    } else if (flag == "0" || flag == "false" || flag == "no") {
      config.dry_run = false;
    } else {
      throw ConfigError("SWAPCORE_DRY_RUN must be true or false, got '" + *v +
                        "'");
    }
  }
}

// -----------------------------------------------------------------------------
// validateConfig(): range checks, first failure wins
// -----------------------------------------------------------------------------
void validateConfig(const EngineConfig& config) {
  requireNonEmpty("rpc.url", config.rpc.url);
  if (config.rpc.commitment != "processed" &&
      config.rpc.commitment != "confirmed" &&
      config.rpc.commitment != "finalized") {
    throw ConfigError("rpc.commitment must be processed, confirmed or "
                      "finalized, got '" + config.rpc.commitment + "'");
  }
  requireNonEmpty("jupiter.quote_url", config.jupiter.quote_url);
  requireNonEmpty("jupiter.swap_url", config.jupiter.swap_url);

  requireNonEmpty("pair.base_mint", config.pair.base_mint);
  requireNonEmpty("pair.quote_mint", config.pair.quote_mint);
  requireRange("pair.base_decimals", config.pair.base_decimals, 0, 18);
  requireRange("pair.quote_decimals", config.pair.quote_decimals, 0, 18);

  if (!(config.limits.max_trade_size > 0.0) ||
      config.limits.max_trade_size > 10.0) {
    std::ostringstream msg;
    msg << "limits.max_trade_size must be in (0, 10], got "
        << config.limits.max_trade_size;
    throw ConfigError(msg.str());
  }
  requireRange("limits.max_trades_per_day", config.limits.max_trades_per_day,
               1, 1000);
  requireRange("limits.max_trades_per_hour",
               config.limits.max_trades_per_hour, 1, 100);

  requireRange("trading.default_slippage_bps", config.default_slippage_bps, 0,
               1000);
  if (config.estimated_fee_sol < 0.0) {
    throw ConfigError("trading.estimated_fee_sol must not be negative");
  }

  if (config.confirmation.timeout_ms <= 0) {
    throw ConfigError("confirmation.timeout_ms must be positive");
  }
  if (config.confirmation.poll_interval_ms <= 0) {
    throw ConfigError("confirmation.poll_interval_ms must be positive");
  }

  if (config.retry.max_attempts < 1) {
    throw ConfigError("retry.max_attempts must be at least 1");
  }
  if (!(config.retry.backoff_factor > 1.0)) {
    throw ConfigError("retry.backoff_factor must be greater than 1");
  }
  if (config.retry.base_delay_ms < 0) {
    throw ConfigError("retry.base_delay_ms must not be negative");
  }

  if (config.circuit_breaker_price_change_pct < 0.0) {
    throw ConfigError("circuit_breaker.price_change_pct must not be negative");
  }

  requireNonEmpty("database.path", config.database_path);

  if (config.http.connect_timeout_ms <= 0 || config.http.total_timeout_ms <= 0) {
    throw ConfigError("http timeouts must be positive");
  }
  requireNonEmpty("ipc.command_endpoint", config.ipc.command_endpoint);
  requireNonEmpty("ipc.telemetry_endpoint", config.ipc.telemetry_endpoint);
}

}  // namespace swapcore
