#pragma once

#include "swapcore/chain/i_blockchain_rpc.hpp"
#include "swapcore/network/http_client.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <string>

namespace swapcore {

// -----------------------------------------------------------------------------
// SolanaRpcClient: JSON-RPC 2.0 client for a Solana cluster
// -----------------------------------------------------------------------------
//
// @brief  Implements IBlockchainRpc with sendTransaction,
//         getSignatureStatuses and getTransaction.
//
// @details
// Every call POSTs {"jsonrpc":"2.0","id":n,"method":...,"params":[...]} to
// the configured URL. Transport faults and HTTP status are handled by
// IHttpClient / throwForStatus. A JSON-RPC "error" member raises RpcError
// carrying the node's code and message. An unparseable body raises RpcError
// with code -32700.
//
// Status rules (getSignatureStatuses, one signature):
//   value[0] == null                                → not confirmed
//   value[0].err != null                            → confirmed, error
//   confirmationStatus "confirmed" or "finalized"   → confirmed, no error
//   otherwise ("processed")                         → not confirmed
//
// Thread-safety: safe for concurrent use if the IHttpClient is.
// -----------------------------------------------------------------------------
class SolanaRpcClient final : public IBlockchainRpc {
 public:
  SolanaRpcClient(IHttpClient& http, std::string rpc_url,
                  std::string commitment = "confirmed");

  std::string submitTransaction(
      const std::vector<std::uint8_t>& signed_transaction) override;

  TransactionStatus getTransactionStatus(const std::string& signature) override;

  std::optional<TransactionDetails> getTransactionDetails(
      const std::string& signature, const std::string& owner,
      const std::string& output_mint) override;

  // Lamport balance of an account (getBalance).
  std::uint64_t getBalance(const std::string& public_key);

  // Interprets one entry of getSignatureStatuses' value array.
  static TransactionStatus parseSignatureStatus(const nlohmann::json& entry);

  // Extracts fee and the owner's received amount of output_mint from a
  // getTransaction result. std::nullopt if `result` is null or has no meta.
  static std::optional<TransactionDetails> parseTransactionDetails(
      const nlohmann::json& result, const std::string& owner,
      const std::string& output_mint);

  // ---------------------------------------------------------------------------
  // renderChainError(err)
  // ---------------------------------------------------------------------------
  // Human-readable form of a transaction error object:
  //   "InsufficientFundsForFee"                       → as is
  //   {"InstructionError":[3,{"Custom":6001}]}        →
  //       "InstructionError at instruction 3: SlippageToleranceExceeded
  //        (custom program error 6001)"
  //   {"InstructionError":[1,"InvalidAccountData"]}   →
  //       "InstructionError at instruction 1: InvalidAccountData"
  //   anything else                                   → compact JSON dump
  // ---------------------------------------------------------------------------
  static std::string renderChainError(const nlohmann::json& err);

 private:
  nlohmann::json call(const std::string& method, nlohmann::json params);

  IHttpClient& http_;
  std::string rpc_url_;
  std::string commitment_;
  std::atomic<std::uint64_t> next_request_id_{1};
};

}  // namespace swapcore
