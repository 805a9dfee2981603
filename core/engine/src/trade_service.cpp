#include "swapcore/engine/trade_service.hpp"

#include "swapcore/errors/errors.hpp"
#include "swapcore/serialization/execution_json.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace swapcore {

namespace {

std::string okResponse(const std::string& text) {
  nlohmann::json j;
  j["status"] = "ok";
  j["response"] = text;
  return j.dump();
}

std::string errorResponse(const std::string& text) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = text;
  return j.dump();
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: publish breaker transitions as telemetry
// -----------------------------------------------------------------------------
TradeService::TradeService(ExecutionOrchestrator& orchestrator, RiskGate& gate,
                           CircuitBreaker& breaker, EventBus& telemetry_bus,
                           ITimeProvider& clock, TradeServiceOptions options)
    : orchestrator_(orchestrator),
      gate_(gate),
      breaker_(breaker),
      telemetry_bus_(telemetry_bus),
      clock_(clock),
      options_(std::move(options)) {
  EventBus* bus = &telemetry_bus_;
  ITimeProvider* time = &clock_;
  breaker_.addListener([bus, time](bool active, const std::string& reason) {
    bus->publish(CircuitBreakerEvent{active, reason,
                                     ms_to_timestamp(time->now_ms())});
  });
}

TradeService::~TradeService() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradeService::start() {
  if (running_) {
    return;
  }

  // ---  1) Handler before the worker so no request is missed ---------------
  handler_ = std::make_unique<TradeExecutionHandler>(
      worker_.eventBus(), orchestrator_,
      [this](Event event) { telemetry_bus_.publish(event); });
  worker_.start();

  // ---  2) Commands and telemetry -------------------------------------------
  if (!options_.ipc_cmd_endpoint.empty() &&
      !options_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        options_.ipc_cmd_endpoint, options_.ipc_pub_endpoint);
    ipc_server_->start();

    telemetry_bridge_id_ = telemetry_bus_.subscribe(
        [server = ipc_server_.get()](const Event& e) {
          server->pushTelemetry(e);
        });
    telemetry_bridged_ = true;
  }

  running_ = true;
  std::cout << "[TradeService] started"
            << (ipc_server_ ? " with IPC" : " without IPC") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradeService::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new commands; detach the bridge before the server goes ------
  if (telemetry_bridged_) {
    telemetry_bus_.unsubscribe(telemetry_bridge_id_);
    telemetry_bridged_ = false;
  }
  ipc_server_.reset();

  // ---  2) Let the running trade finish, then drop the handler -------------
  worker_.stop();
  handler_.reset();

  running_ = false;
  std::cout << "[TradeService] stopped.\n";
}

std::uint64_t TradeService::submit(const domain::TradeRequest& request) {
  const std::uint64_t id = request_ids_.next_id();
  worker_.push(TradeRequestEvent{id, request, ms_to_timestamp(clock_.now_ms())});
  std::cout << "[TradeService] queued request " << id << " ("
            << domain::toString(request.action) << " " << request.amount
            << (request.dry_run ? ", dry run" : ", LIVE") << ")\n";
  return id;
}

std::uint64_t TradeService::completedRequests() const {
  return handler_ ? handler_->completed() : 0;
}

// -----------------------------------------------------------------------------
// executeCommand(): "VERB [args]"
// -----------------------------------------------------------------------------
std::string TradeService::executeCommand(const std::string& cmd) {
  const std::string line = trim(cmd);
  const auto space = line.find(' ');
  const std::string verb = line.substr(0, space);
  const std::string args =
      space == std::string::npos ? std::string{} : trim(line.substr(space + 1));

  if (verb == "PING") {
    return okResponse("PONG");
  }
  if (verb == "STATUS") {
    return handleStatus();
  }
  if (verb == "HALT") {
    return handleHalt(args);
  }
  if (verb == "RESUME") {
    return handleResume();
  }
  if (verb == "TRADE") {
    return handleTrade(args);
  }
  return errorResponse("Unknown command: " + cmd);
}

std::string TradeService::handleStatus() {
  nlohmann::json response;
  response["status"] = "ok";
  response["circuit_breaker"] = {{"active", breaker_.isActive()},
                                 {"reason", breaker_.reason()}};

  const auto& limits = gate_.limits();
  response["limits"] = {{"max_trade_size", limits.max_trade_size},
                        {"max_trades_per_day", limits.max_trades_per_day},
                        {"max_trades_per_hour", limits.max_trades_per_hour}};

  try {
    const TradeUsage usage = gate_.currentUsage();
    response["trades_today"] = usage.today;
    response["trades_last_hour"] = usage.last_hour;
  } catch (const SwapCoreError& e) {
    return errorResponse(std::string("Trade counts unavailable: ") + e.what());
  }

  response["queued_requests"] = worker_.pending();
  response["completed_requests"] = completedRequests();
  return response.dump();
}

std::string TradeService::handleHalt(const std::string& args) {
  const std::string reason = args.empty() ? "Manual halt via IPC" : args;
  const bool changed = breaker_.trip(reason);
  return okResponse(changed ? "Trading halted: " + reason
                            : "Trading already halted: " + breaker_.reason());
}

std::string TradeService::handleResume() {
  const bool changed = breaker_.reset();
  return okResponse(changed ? "Trading resumed" : "Trading was not halted");
}

std::string TradeService::handleTrade(const std::string& args) {
  if (args.empty()) {
    return errorResponse("TRADE needs a JSON body");
  }

  domain::TradeRequest request;
  try {
    request = tradeRequestFromJson(nlohmann::json::parse(args),
                                   options_.request_defaults);
  } catch (const nlohmann::json::parse_error& e) {
    return errorResponse(std::string("Malformed TRADE body: ") + e.what());
  } catch (const std::invalid_argument& e) {
    return errorResponse(e.what());
  }

  nlohmann::json response;
  response["status"] = "ok";
  response["request_id"] = submit(request);
  return response.dump();
}

}  // namespace swapcore
