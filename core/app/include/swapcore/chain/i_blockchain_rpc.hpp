#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace swapcore {

// -----------------------------------------------------------------------------
// TransactionStatus
// -----------------------------------------------------------------------------
// confirmed == true means the outcome is final: either the cluster reached
// the required commitment or execution already failed. `error` is set only
// for a final failure and holds the rendered chain error.
// -----------------------------------------------------------------------------
struct TransactionStatus {
  bool confirmed{false};
  std::optional<std::string> error;
};

// What getTransaction reveals about a landed transaction. Amounts are in
// smallest units (lamports / token base units).
struct TransactionDetails {
  std::optional<std::uint64_t> fee_lamports;
  std::optional<std::uint64_t> output_amount;
};

// -----------------------------------------------------------------------------
// IBlockchainRpc: the chain operations the engine needs
// -----------------------------------------------------------------------------
//
// submitTransaction: broadcasts signed bytes, returns the signature.
//   Throws ConnectionError / TimeoutError / ServerError for transport faults
//   and RpcError when the node rejects the transaction (e.g. preflight).
//
// getTransactionStatus: one status lookup. An unknown signature is not an
//   error, it is {confirmed=false}.
//
// getTransactionDetails: best effort. Any failure yields std::nullopt.
// -----------------------------------------------------------------------------
class IBlockchainRpc {
 public:
  virtual ~IBlockchainRpc() = default;

  virtual std::string submitTransaction(
      const std::vector<std::uint8_t>& signed_transaction) = 0;

  virtual TransactionStatus getTransactionStatus(
      const std::string& signature) = 0;

  virtual std::optional<TransactionDetails> getTransactionDetails(
      const std::string& signature, const std::string& owner,
      const std::string& output_mint) = 0;
};

}  // namespace swapcore
