#pragma once

#include <stdexcept>
#include <string>

namespace swapcore {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception hierarchy shared by every network-facing component.
//
// @details
// The split that matters is transient vs. everything else:
//
//   SwapCoreError
//   ├── TransientNetworkError      ← the ONLY family BackoffRetrier retries
//   │   ├── ConnectionError        (connect / resolve / send / recv failure)
//   │   ├── TimeoutError           (transport timeout)
//   │   ├── RateLimitError         (HTTP 429)
//   │   └── ServerError            (HTTP 5xx)
//   ├── HttpClientError            (other non-2xx, never retried)
//   ├── QuoteUnavailable
//   ├── TransactionBuildFailed
//   ├── RpcError                   (JSON-RPC error object)
//   ├── WalletError
//   ├── StorageError
//   └── ConfigError
//
// kind() returns a stable class name. It is what RetryEvent reports as the
// error type and what the logs print; it never changes with the message.
//
// None of these escape ExecutionOrchestrator::executeTrade(). The
// orchestrator turns each of them into a failed TradeExecution record.
// -----------------------------------------------------------------------------
class SwapCoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;

  virtual const char* kind() const noexcept { return "SwapCoreError"; }
};

// Base of every error BackoffRetrier is allowed to retry.
class TransientNetworkError : public SwapCoreError {
 public:
  using SwapCoreError::SwapCoreError;

  const char* kind() const noexcept override {
    return "TransientNetworkError";
  }
};

class ConnectionError : public TransientNetworkError {
 public:
  using TransientNetworkError::TransientNetworkError;

  const char* kind() const noexcept override { return "ConnectionError"; }
};

class TimeoutError : public TransientNetworkError {
 public:
  using TransientNetworkError::TransientNetworkError;

  const char* kind() const noexcept override { return "TimeoutError"; }
};

class RateLimitError : public TransientNetworkError {
 public:
  using TransientNetworkError::TransientNetworkError;

  const char* kind() const noexcept override { return "RateLimitError"; }
};

class ServerError : public TransientNetworkError {
 public:
  ServerError(const std::string& message, long status_code)
      : TransientNetworkError(message), status_code_(status_code) {}

  const char* kind() const noexcept override { return "ServerError"; }

  long statusCode() const noexcept { return status_code_; }

 private:
  long status_code_;
};

class HttpClientError : public SwapCoreError {
 public:
  HttpClientError(const std::string& message, long status_code)
      : SwapCoreError(message), status_code_(status_code) {}

  const char* kind() const noexcept override { return "HttpClientError"; }

  long statusCode() const noexcept { return status_code_; }

 private:
  long status_code_;
};

class QuoteUnavailable : public SwapCoreError {
 public:
  using SwapCoreError::SwapCoreError;

  const char* kind() const noexcept override { return "QuoteUnavailable"; }
};

class TransactionBuildFailed : public SwapCoreError {
 public:
  using SwapCoreError::SwapCoreError;

  const char* kind() const noexcept override {
    return "TransactionBuildFailed";
  }
};

class RpcError : public SwapCoreError {
 public:
  RpcError(const std::string& message, long code)
      : SwapCoreError(message), code_(code) {}

  const char* kind() const noexcept override { return "RpcError"; }

  long code() const noexcept { return code_; }

 private:
  long code_;
};

class WalletError : public SwapCoreError {
 public:
  using SwapCoreError::SwapCoreError;

  const char* kind() const noexcept override { return "WalletError"; }
};

class StorageError : public SwapCoreError {
 public:
  using SwapCoreError::SwapCoreError;

  const char* kind() const noexcept override { return "StorageError"; }
};

class ConfigError : public SwapCoreError {
 public:
  using SwapCoreError::SwapCoreError;

  const char* kind() const noexcept override { return "ConfigError"; }
};

}  // namespace swapcore
