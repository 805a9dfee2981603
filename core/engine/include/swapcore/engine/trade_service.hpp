#pragma once

#include "swapcore/concurrent/event_loop_thread.hpp"
#include "swapcore/concurrent/request_id_generator.hpp"
#include "swapcore/domain/trade_request.hpp"
#include "swapcore/eventbus/event_bus.hpp"
#include "swapcore/execution/execution_orchestrator.hpp"
#include "swapcore/execution/trade_execution_handler.hpp"
#include "swapcore/network/ipc_server.hpp"
#include "swapcore/risk/circuit_breaker.hpp"
#include "swapcore/risk/risk_gate.hpp"
#include "swapcore/time/i_time_provider.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace swapcore {

struct TradeServiceOptions {
  // Fills slippage_bps and dry_run when a TRADE command omits them.
  domain::TradeRequest request_defaults;
  // Either endpoint empty: no IpcServer is created (unit tests).
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// TradeService
// -----------------------------------------------------------------------------
//
// @brief  Long-running front end of the engine: one execution worker, the
//         ZeroMQ command/telemetry server and the telemetry bus that ties
//         them together.
//
// @details
// Request flow:
//
//   IPC thread ── TRADE {json} ──► submit() ──► worker queue
//                                                   │
//   execution worker ◄──────────────────────────────┘
//     TradeExecutionHandler → ExecutionOrchestrator::executeTrade()
//     → TradeExecutionEvent on the telemetry bus
//
//   telemetry bus ──► IpcServer::pushTelemetry() ──► PUB socket
//
// Requests submitted here run one at a time, in submission order. Code
// that wants parallel attempts calls executeTradeAsync() on the
// orchestrator directly.
//
// The telemetry bus is owned by the caller because the retrier and the
// orchestrator, built before the service, already publish into it.
//
// Commands (REP socket), replies are JSON with a "status" of "ok" or
// "error":
//   "PING"            → "response": "PONG"
//   "STATUS"          → breaker state, live trades today / last hour,
//                       limits, queued and completed requests
//   "HALT [reason]"   → trips the circuit breaker
//   "RESUME"          → resets it
//   "TRADE {json}"    → validates and enqueues, replies with request_id
//   other             → "Unknown command: ..."
//
// Thread model:
//   start()/stop() from the owning thread. submit() and executeCommand()
//   from any thread.
//
// Ownership:
//   TradeService
//    ├── worker_          (EventLoopThread, value member, destroyed last)
//    ├── handler_         (unique_ptr<TradeExecutionHandler>)
//    ├── ipc_server_      (unique_ptr<IpcServer>)
//    └── borrowed: orchestrator, gate, breaker, telemetry bus, clock
//
//   The breaker listener registered in the constructor captures only the
//   telemetry bus and the clock, which must outlive the breaker.
// -----------------------------------------------------------------------------
class TradeService {
 public:
  TradeService(ExecutionOrchestrator& orchestrator, RiskGate& gate,
               CircuitBreaker& breaker, EventBus& telemetry_bus,
               ITimeProvider& clock, TradeServiceOptions options = {});

  ~TradeService();

  TradeService(const TradeService&) = delete;
  TradeService& operator=(const TradeService&) = delete;
  TradeService(TradeService&&) = delete;
  TradeService& operator=(TradeService&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // 1. Create the handler on the worker's bus, then start the worker.
  // 2. Start the IpcServer and bridge the telemetry bus into it.
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // IPC first (no new commands), then the worker. A trade already running
  // finishes; queued requests that never started are discarded and logged
  // by the worker. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues the request for the worker and returns its id.
  std::uint64_t submit(const domain::TradeRequest& request);

  std::string executeCommand(const std::string& cmd);

  bool isRunning() const { return running_; }

  std::uint64_t completedRequests() const;

 private:
  std::string handleStatus();
  std::string handleHalt(const std::string& args);
  std::string handleResume();
  std::string handleTrade(const std::string& args);

  ExecutionOrchestrator& orchestrator_;
  RiskGate& gate_;
  CircuitBreaker& breaker_;
  EventBus& telemetry_bus_;
  ITimeProvider& clock_;
  TradeServiceOptions options_;

  RequestIdGenerator request_ids_;
  EventLoopThread worker_{"ExecutionWorker"};
  std::unique_ptr<TradeExecutionHandler> handler_;
  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId telemetry_bridge_id_{0};
  bool telemetry_bridged_{false};
  bool running_{false};
};

}  // namespace swapcore
