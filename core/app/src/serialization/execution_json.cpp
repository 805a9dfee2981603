#include "swapcore/serialization/execution_json.hpp"

#include <stdexcept>
#include <type_traits>

namespace swapcore {

namespace {

using nlohmann::json;

template <typename T>
json orNull(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

json toJson(const domain::TradeRequest& request) {
  json j;
  j["action"] = domain::toString(request.action);
  j["amount"] = request.amount;
  j["slippage_bps"] = request.slippage_bps;
  j["dry_run"] = request.dry_run;
  return j;
}

}  // namespace

json toJson(const domain::TradeExecution& execution) {
  const auto failure = execution.failureKind();

  json j;
  j["timestamp"] = format_iso8601_utc(execution.timestamp());
  j["signal"] = domain::toString(execution.action());
  j["input_token"] = execution.inputMint();
  j["output_token"] = execution.outputMint();
  j["input_amount"] = execution.inputAmount();
  j["output_amount"] = orNull(execution.outputAmount());
  j["expected_output"] = orNull(execution.expectedOutput());
  j["slippage_bps"] = execution.slippageBps();
  j["status"] = domain::toString(execution.status());
  j["failure_kind"] = failure ? json(domain::toString(*failure)) : json(nullptr);
  j["transaction_signature"] = orNull(execution.transactionSignature());
  j["error_message"] = orNull(execution.errorMessage());
  j["execution_duration_sec"] =
      static_cast<double>(execution.durationMs()) / 1000.0;
  j["gas_fee_sol"] = orNull(execution.feePaid());
  j["fee_estimated"] = execution.feeEstimated();
  return j;
}

domain::TradeRequest tradeRequestFromJson(
    const json& doc, const domain::TradeRequest& defaults) {
  if (!doc.is_object()) {
    throw std::invalid_argument("trade request must be a JSON object");
  }

  auto action_it = doc.find("action");
  if (action_it == doc.end() || !action_it->is_string()) {
    throw std::invalid_argument("trade request needs a string 'action'");
  }
  const auto action = domain::parseTradeAction(action_it->get<std::string>());
  if (!action) {
    throw std::invalid_argument("invalid action '" +
                                action_it->get<std::string>() +
                                "', expected BUY or SELL");
  }

  auto amount_it = doc.find("amount");
  if (amount_it == doc.end() || !amount_it->is_number()) {
    throw std::invalid_argument("trade request needs a numeric 'amount'");
  }

  domain::TradeRequest request = defaults;
  request.action = *action;
  request.amount = amount_it->get<double>();

  if (auto it = doc.find("slippage_bps"); it != doc.end() && !it->is_null()) {
    if (!it->is_number_integer()) {
      throw std::invalid_argument("'slippage_bps' must be an integer");
    }
    request.slippage_bps = it->get<int>();
  }
  if (auto it = doc.find("dry_run"); it != doc.end() && !it->is_null()) {
    if (!it->is_boolean()) {
      throw std::invalid_argument("'dry_run' must be a boolean");
    }
    request.dry_run = it->get<bool>();
  }
  return request;
}

// -----------------------------------------------------------------------------
// eventToJson(): one "type" tag per Event alternative
// -----------------------------------------------------------------------------
json eventToJson(const Event& event) {
  return std::visit(
      [](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        json j;
        if constexpr (std::is_same_v<T, TradeRequestEvent>) {
          j["type"] = "trade_request";
          j["request_id"] = e.request_id;
          j["request"] = toJson(e.request);
          j["timestamp"] = format_iso8601_utc(e.timestamp);
        } else if constexpr (std::is_same_v<T, TradeExecutionEvent>) {
          j["type"] = "trade_execution";
          j["request_id"] = e.request_id;
          j["execution"] = toJson(e.execution);
        } else if constexpr (std::is_same_v<T, RetryEvent>) {
          j["type"] = "retry";
          j["operation"] = e.operation;
          j["attempt"] = e.attempt;
          j["max_attempts"] = e.max_attempts;
          j["error_kind"] = e.error_kind;
          j["error_message"] = e.error_message;
          j["delay_ms"] = e.delay_ms;
          j["outcome"] = toString(e.outcome);
          j["timestamp"] = format_iso8601_utc(e.timestamp);
        } else if constexpr (std::is_same_v<T, RiskBlockEvent>) {
          j["type"] = "risk_block";
          j["action"] = domain::toString(e.action);
          j["reason"] = e.reason;
          j["timestamp"] = format_iso8601_utc(e.timestamp);
        } else if constexpr (std::is_same_v<T, CircuitBreakerEvent>) {
          j["type"] = "circuit_breaker";
          j["active"] = e.active;
          j["reason"] = e.reason;
          j["timestamp"] = format_iso8601_utc(e.timestamp);
        }
        return j;
      },
      event);
}

}  // namespace swapcore
