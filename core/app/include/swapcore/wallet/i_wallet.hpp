#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace swapcore {

// -----------------------------------------------------------------------------
// IWallet: signing collaborator
// -----------------------------------------------------------------------------
// publicKey(): base58 address of the signer.
// sign():      takes a serialized transaction with an empty signature slot
//              for this signer and returns it with the slot filled.
// Failures raise WalletError. Only the wallet ever touches key material.
// -----------------------------------------------------------------------------
class IWallet {
 public:
  virtual ~IWallet() = default;

  virtual std::string publicKey() const = 0;

  virtual std::vector<std::uint8_t> sign(
      const std::vector<std::uint8_t>& unsigned_transaction) const = 0;
};

}  // namespace swapcore
