// -----------------------------------------------------------------------------
// swapcore_engine: command line entry point
//
// Sub-commands:
//   trade --action BUY|SELL --amount X [--slippage-bps N] [--dry-run|--live]
//         [--yes]
//       Runs one trade through the ExecutionOrchestrator and prints the
//       resulting record as JSON. A live trade asks for a typed YES first
//       unless --yes is given.
//   serve [--halted]
//       Runs the TradeService (ZeroMQ commands + telemetry) until Ctrl-C.
//       --halted starts with the circuit breaker tripped.
//   history [--limit N]
//       Prints the most recent stored executions.
//   balance
//       Prints the configured wallet's SOL balance.
//   check-config
//       Loads and validates the configuration and prints a summary.
//
// Every sub-command accepts --config PATH. Without it the built-in
// defaults are used; SWAPCORE_* environment variables apply either way.
//
// Exit codes: 0 success or dry run, 1 failed trade or runtime error,
// 2 usage or configuration error.
// -----------------------------------------------------------------------------

#include "swapcore/chain/confirmation_poller.hpp"
#include "swapcore/chain/solana_rpc_client.hpp"
#include "swapcore/config/config_loader.hpp"
#include "swapcore/engine/trade_service.hpp"
#include "swapcore/errors/errors.hpp"
#include "swapcore/eventbus/event_bus.hpp"
#include "swapcore/execution/execution_orchestrator.hpp"
#include "swapcore/network/curl_http_client.hpp"
#include "swapcore/retry/backoff_retrier.hpp"
#include "swapcore/risk/circuit_breaker.hpp"
#include "swapcore/risk/price_move_monitor.hpp"
#include "swapcore/risk/risk_gate.hpp"
#include "swapcore/serialization/execution_json.hpp"
#include "swapcore/storage/sqlite_execution_store.hpp"
#include "swapcore/swap/jupiter_swap_aggregator.hpp"
#include "swapcore/time/live_time_provider.hpp"
#include "swapcore/wallet/keypair_wallet.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// CommandLine: "<command> [--key value | --flag]..."
// -----------------------------------------------------------------------------
struct CommandLine {
  std::string command;
  std::map<std::string, std::string> options;
  std::set<std::string> flags;

  std::optional<std::string> option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool flag(const std::string& name) const { return flags.count(name) > 0; }
};

const std::set<std::string> kValueOptions = {
    "--config", "--action", "--amount", "--slippage-bps", "--limit"};

const std::set<std::string> kFlagOptions = {"--dry-run", "--live", "--yes",
                                            "--halted"};

CommandLine parseCommandLine(int argc, char** argv) {
  if (argc < 2) {
    throw UsageError("missing command");
  }
  CommandLine cl;
  cl.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (kFlagOptions.count(arg) > 0) {
      cl.flags.insert(arg);
    } else if (kValueOptions.count(arg) > 0) {
      if (i + 1 >= argc) {
        throw UsageError(arg + " needs a value");
      }
      cl.options[arg] = argv[++i];
    } else {
      throw UsageError("unknown argument '" + arg + "'");
    }
  }
  if (cl.flag("--dry-run") && cl.flag("--live")) {
    throw UsageError("--dry-run and --live are mutually exclusive");
  }
  return cl;
}

double parseDouble(const std::string& name, const std::string& text) {
  try {
    std::size_t used = 0;
    const double value = std::stod(text, &used);
    if (used != text.size()) {
      throw UsageError(name + " is not a number: '" + text + "'");
    }
    return value;
  } catch (const std::logic_error&) {
    throw UsageError(name + " is not a number: '" + text + "'");
  }
}

int parseInt(const std::string& name, const std::string& text) {
  try {
    std::size_t used = 0;
    const int value = std::stoi(text, &used);
    if (used != text.size()) {
      throw UsageError(name + " is not an integer: '" + text + "'");
    }
    return value;
  } catch (const std::logic_error&) {
    throw UsageError(name + " is not an integer: '" + text + "'");
  }
}

void printUsage() {
  std::cerr
      << "usage: swapcore_engine <command> [--config PATH] [options]\n"
         "\n"
         "  trade --action BUY|SELL --amount X [--slippage-bps N]\n"
         "        [--dry-run|--live] [--yes]\n"
         "  serve [--halted]\n"
         "  history [--limit N]\n"
         "  balance\n"
         "  check-config\n";
}

swapcore::EngineConfig loadEngineConfig(const CommandLine& cl) {
  swapcore::EngineConfig config;
  if (auto path = cl.option("--config")) {
    config = swapcore::loadConfig(*path);
  }
  swapcore::applyEnvironmentOverrides(config);
  swapcore::validateConfig(config);
  return config;
}

// -----------------------------------------------------------------------------
// EngineContext: the wired object graph for one process
// -----------------------------------------------------------------------------
// Members are declared in dependency order; each one only references
// members declared above it, so construction and destruction order are
// both correct.
// -----------------------------------------------------------------------------
struct EngineContext {
  // `live_trading` false leaves the wallet unloaded; the orchestrator then
  // serves dry runs only.
  EngineContext(const swapcore::EngineConfig& cfg, bool live_trading)
      : config(cfg),
        retrier(cfg.retry, clock,
                [this](const swapcore::RetryEvent& e) {
                  telemetry.publish(e);
                }),
        http(cfg.http),
        aggregator(http, retrier, cfg.jupiter),
        rpc(http, cfg.rpc.url, cfg.rpc.commitment),
        wallet(swapcore::loadTradingWallet(cfg.wallet_private_key,
                                           live_trading)),
        poller(rpc, retrier, clock, cfg.confirmation.poll_interval_ms),
        store(cfg.database_path),
        price_monitor(breaker, cfg.pair, cfg.circuit_breaker_price_change_pct),
        gate(store, breaker, clock, cfg.limits),
        orchestrator(aggregator, wallet.get(), poller, rpc, gate, breaker,
                     &price_monitor, store, clock, orchestratorSettings(cfg),
                     [this](swapcore::Event e) {
                       telemetry.publish(e);
                     }) {}

  static swapcore::OrchestratorSettings orchestratorSettings(
      const swapcore::EngineConfig& cfg) {
    swapcore::OrchestratorSettings s;
    s.pair = cfg.pair;
    s.limits = cfg.limits;
    s.confirmation_timeout_ms = cfg.confirmation.timeout_ms;
    s.estimated_fee_sol = cfg.estimated_fee_sol;
    return s;
  }

  swapcore::EngineConfig config;
  swapcore::LiveTimeProvider clock;
  swapcore::EventBus telemetry;
  swapcore::BackoffRetrier retrier;
  swapcore::CurlHttpClient http;
  swapcore::JupiterSwapAggregator aggregator;
  swapcore::SolanaRpcClient rpc;
  std::unique_ptr<swapcore::KeypairWallet> wallet;
  swapcore::ConfirmationPoller poller;
  swapcore::SqliteExecutionStore store;
  swapcore::CircuitBreaker breaker;
  swapcore::PriceMoveMonitor price_monitor;
  swapcore::RiskGate gate;
  swapcore::ExecutionOrchestrator orchestrator;
};

bool confirmLiveTrade(const swapcore::domain::TradeRequest& request,
                      const swapcore::EngineConfig& config) {
  std::cout << "\n*** LIVE TRADE ***\n"
            << "  action:   " << swapcore::domain::toString(request.action)
            << "\n"
            << "  amount:   " << request.amount << "\n"
            << "  slippage: " << request.slippage_bps << " bps\n"
            << "  rpc:      " << config.rpc.url << "\n"
            << "This submits a real transaction. Type YES to continue: "
            << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    return false;
  }
  return answer == "YES";
}

// -----------------------------------------------------------------------------
// Sub-commands
// -----------------------------------------------------------------------------

int runTrade(const CommandLine& cl) {
  const auto action_text = cl.option("--action");
  const auto amount_text = cl.option("--amount");
  if (!action_text || !amount_text) {
    throw UsageError("trade needs --action and --amount");
  }
  const auto action = swapcore::domain::parseTradeAction(*action_text);
  if (!action) {
    throw UsageError("invalid action '" + *action_text +
                     "', expected BUY or SELL");
  }

  const swapcore::EngineConfig config = loadEngineConfig(cl);

  swapcore::domain::TradeRequest request;
  request.action = *action;
  request.amount = parseDouble("--amount", *amount_text);
  request.slippage_bps = config.default_slippage_bps;
  if (auto bps = cl.option("--slippage-bps")) {
    request.slippage_bps = parseInt("--slippage-bps", *bps);
  }
  request.dry_run = config.dry_run;
  if (cl.flag("--dry-run")) {
    request.dry_run = true;
  } else if (cl.flag("--live")) {
    request.dry_run = false;
  }

  if (!request.dry_run && !cl.flag("--yes") &&
      !confirmLiveTrade(request, config)) {
    std::cout << "[main] Live trade cancelled.\n";
    return kExitFailure;
  }

  EngineContext context(config, !request.dry_run);
  const swapcore::domain::TradeExecution record =
      context.orchestrator.executeTrade(request);

  std::cout << swapcore::toJson(record).dump(2) << "\n";
  return record.status() == swapcore::domain::ExecutionStatus::Failed
             ? kExitFailure
             : kExitOk;
}

// -----------------------------------------------------------------------------
// Shutdown flag for `serve`.
// The only global in the program: a pointer to a stack-local atomic in
// runServe(), set before the handler is installed and cleared after it is
// removed. The handler performs only an atomic store.
// -----------------------------------------------------------------------------
static std::atomic<bool>* g_shutdown_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_shutdown_ptr != nullptr) {
    g_shutdown_ptr->store(true);
  }
}

int runServe(const CommandLine& cl) {
  const swapcore::EngineConfig config = loadEngineConfig(cl);
  // Requests may ask for live execution whatever the default.
  EngineContext context(config, /*live_trading=*/true);

  swapcore::TradeServiceOptions options;
  options.request_defaults.slippage_bps = config.default_slippage_bps;
  options.request_defaults.dry_run = config.dry_run;
  options.ipc_cmd_endpoint = config.ipc.command_endpoint;
  options.ipc_pub_endpoint = config.ipc.telemetry_endpoint;

  swapcore::TradeService service(context.orchestrator, context.gate,
                                 context.breaker, context.telemetry,
                                 context.clock, options);

  if (cl.flag("--halted")) {
    context.breaker.trip("Started halted from the command line");
  }

  std::atomic<bool> shutdown{false};
  g_shutdown_ptr = &shutdown;
  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  service.start();
  std::cout << "[main] Serving. Commands on " << config.ipc.command_endpoint
            << ", telemetry on " << config.ipc.telemetry_endpoint
            << ". Press Ctrl-C to stop.\n";

  while (!shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "\n[main] Shutdown requested. Stopping service...\n";
  service.stop();

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_shutdown_ptr = nullptr;
  return kExitOk;
}

int runHistory(const CommandLine& cl) {
  int limit = 20;
  if (auto text = cl.option("--limit")) {
    limit = parseInt("--limit", *text);
    if (limit <= 0) {
      throw UsageError("--limit must be positive");
    }
  }

  const swapcore::EngineConfig config = loadEngineConfig(cl);
  swapcore::SqliteExecutionStore store(config.database_path);
  const auto records = store.recentExecutions(limit);

  if (records.empty()) {
    std::cout << "No executions recorded in " << config.database_path << "\n";
    return kExitOk;
  }

  for (const auto& r : records) {
    std::cout << swapcore::format_iso8601_utc(r.timestamp()) << "  "
              << std::left << std::setw(4)
              << swapcore::domain::toString(r.action()) << " "
              << std::setw(10) << r.inputAmount() << " "
              << std::setw(8) << swapcore::domain::toString(r.status());
    if (auto sig = r.transactionSignature()) {
      std::cout << " out=" << r.outputAmount().value_or(0.0) << " sig=" << *sig;
    } else if (auto error = r.errorMessage()) {
      std::cout << " " << *error;
    } else if (auto expected = r.expectedOutput()) {
      std::cout << " expected=" << *expected;
    }
    std::cout << "\n";
  }
  return kExitOk;
}

int runBalance(const CommandLine& cl) {
  const swapcore::EngineConfig config = loadEngineConfig(cl);
  if (!config.wallet_private_key) {
    throw swapcore::ConfigError(
        "no wallet configured (wallet.private_key or "
        "SWAPCORE_WALLET_PRIVATE_KEY)");
  }

  swapcore::KeypairWallet wallet(*config.wallet_private_key);
  swapcore::CurlHttpClient http(config.http);
  swapcore::SolanaRpcClient rpc(http, config.rpc.url, config.rpc.commitment);

  const std::uint64_t lamports = rpc.getBalance(wallet.publicKey());
  std::cout << wallet.publicKey() << ": " << std::fixed
            << std::setprecision(9) << static_cast<double>(lamports) / 1e9
            << " SOL\n";
  return kExitOk;
}

int runCheckConfig(const CommandLine& cl) {
  const swapcore::EngineConfig c = loadEngineConfig(cl);
  std::cout << "Configuration OK\n"
            << "  rpc:               " << c.rpc.url << " (" << c.rpc.commitment
            << ")\n"
            << "  pair:              " << c.pair.base_mint << " / "
            << c.pair.quote_mint << "\n"
            << "  max trade size:    " << c.limits.max_trade_size << "\n"
            << "  trades per day:    " << c.limits.max_trades_per_day << "\n"
            << "  trades per hour:   " << c.limits.max_trades_per_hour << "\n"
            << "  default slippage:  " << c.default_slippage_bps << " bps\n"
            << "  dry run default:   " << (c.dry_run ? "yes" : "no") << "\n"
            << "  confirmation:      " << c.confirmation.timeout_ms << " ms, poll "
            << c.confirmation.poll_interval_ms << " ms\n"
            << "  retry:             " << c.retry.max_attempts
            << " attempts, factor " << c.retry.backoff_factor << ", base "
            << c.retry.base_delay_ms << " ms\n"
            << "  breaker threshold: " << c.circuit_breaker_price_change_pct
            << "%\n"
            << "  database:          " << c.database_path << "\n"
            << "  wallet:            "
            << (c.wallet_private_key ? "configured" : "not set") << "\n";
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const CommandLine cl = parseCommandLine(argc, argv);
    if (cl.command == "trade") {
      return runTrade(cl);
    }
    if (cl.command == "serve") {
      return runServe(cl);
    }
    if (cl.command == "history") {
      return runHistory(cl);
    }
    if (cl.command == "balance") {
      return runBalance(cl);
    }
    if (cl.command == "check-config") {
      return runCheckConfig(cl);
    }
    throw UsageError("unknown command '" + cl.command + "'");
  } catch (const UsageError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    printUsage();
    return kExitUsage;
  } catch (const swapcore::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return kExitUsage;
  } catch (const swapcore::SwapCoreError& e) {
    std::cerr << "[main] " << e.kind() << ": " << e.what() << "\n";
    return kExitFailure;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return kExitFailure;
  }
}
