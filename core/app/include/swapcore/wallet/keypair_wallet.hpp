#pragma once

#include "swapcore/wallet/i_wallet.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swapcore {

// -----------------------------------------------------------------------------
// KeypairWallet: Ed25519 keypair held in memory
// -----------------------------------------------------------------------------
//
// @brief  IWallet built from a base58-encoded 64-byte Solana secret key
//         (32-byte seed followed by the 32-byte public key).
//
// @details
// Construction derives the public key from the seed with OpenSSL and rejects
// a secret whose second half does not match. Signing:
//
//   1. Parse the wire transaction: compact-u16 signature count, that many
//      64-byte slots, then the message.
//   2. Read the message header (skipping the 0x80 version prefix of v0
//      messages) and the account key list.
//   3. Locate this wallet among the first num_required_signatures keys.
//   4. Ed25519-sign the message bytes and write the signature into the
//      matching slot.
//
// A transaction that does not list this wallet as a signer, or is truncated,
// raises WalletError.
//
// The secret never leaves the object and is never logged. The destructor
// wipes it with OPENSSL_cleanse.
// -----------------------------------------------------------------------------
class KeypairWallet final : public IWallet {
 public:
  static constexpr std::size_t kSecretKeySize = 64;
  static constexpr std::size_t kPublicKeySize = 32;
  static constexpr std::size_t kSignatureSize = 64;

  explicit KeypairWallet(const std::string& base58_secret_key);
  ~KeypairWallet() override;

  KeypairWallet(const KeypairWallet&) = delete;
  KeypairWallet& operator=(const KeypairWallet&) = delete;

  std::string publicKey() const override;

  std::vector<std::uint8_t> sign(
      const std::vector<std::uint8_t>& unsigned_transaction) const override;

  // Raw Ed25519 signature over arbitrary bytes.
  std::array<std::uint8_t, kSignatureSize> signMessage(
      const std::uint8_t* data, std::size_t size) const;

 private:
  std::array<std::uint8_t, kSecretKeySize> secret_{};
  std::array<std::uint8_t, kPublicKeySize> public_key_{};
};

// Loads the signing wallet for a process that may trade live. Returns
// nullptr when `live_trading` is false or no secret is configured, so a
// dry run never parses the key and a malformed one cannot stop it.
// Throws WalletError for a malformed secret when `live_trading` is true.
std::unique_ptr<KeypairWallet> loadTradingWallet(
    const std::optional<std::string>& base58_secret_key, bool live_trading);

// Reads a Solana compact-u16 ("shortvec") at `offset`, advancing it.
// Throws WalletError when the encoding runs past `bytes`.
std::uint16_t readCompactU16(const std::vector<std::uint8_t>& bytes,
                             std::size_t& offset);

}  // namespace swapcore
