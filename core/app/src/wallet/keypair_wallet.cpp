#include "swapcore/wallet/keypair_wallet.hpp"

#include "swapcore/codec/base58.hpp"
#include "swapcore/errors/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace swapcore {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

constexpr std::uint8_t kVersionedMessageFlag = 0x80;
constexpr std::size_t kMessageHeaderSize = 3;

PkeyPtr loadPrivateKey(const std::uint8_t* seed) {
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed,
                                           KeypairWallet::kPublicKeySize));
  if (!key) {
    throw WalletError("could not load Ed25519 private key");
  }
  return key;
}

}  // namespace

std::uint16_t readCompactU16(const std::vector<std::uint8_t>& bytes,
                             std::size_t& offset) {
  std::uint32_t value = 0;
  for (int shift = 0; shift < 21; shift += 7) {
    if (offset >= bytes.size()) {
      throw WalletError("transaction truncated inside compact-u16");
    }
    const std::uint8_t byte = bytes[offset++];
    value |= static_cast<std::uint32_t>(byte & 0x7f) << shift;
    if ((byte & 0x80) == 0) {
      if (value > 0xffff) {
        throw WalletError("compact-u16 out of range");
      }
      return static_cast<std::uint16_t>(value);
    }
  }
  throw WalletError("compact-u16 longer than 3 bytes");
}

// -----------------------------------------------------------------------------
// Constructor: decode, derive and cross-check the public half
// -----------------------------------------------------------------------------
KeypairWallet::KeypairWallet(const std::string& base58_secret_key) {
  std::vector<std::uint8_t> decoded;
  try {
    decoded = codec::base58Decode(base58_secret_key);
  } catch (const std::invalid_argument&) {
    throw WalletError("wallet secret key is not valid base58");
  }
  if (decoded.size() != kSecretKeySize) {
    OPENSSL_cleanse(decoded.data(), decoded.size());
    throw WalletError("wallet secret key must decode to 64 bytes, got " +
                      std::to_string(decoded.size()));
  }
  std::copy(decoded.begin(), decoded.end(), secret_.begin());
  OPENSSL_cleanse(decoded.data(), decoded.size());

  PkeyPtr key = loadPrivateKey(secret_.data());
  std::size_t length = public_key_.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key_.data(), &length) != 1 ||
      length != kPublicKeySize) {
    throw WalletError("could not derive Ed25519 public key");
  }
  if (!std::equal(public_key_.begin(), public_key_.end(),
                  secret_.begin() + kPublicKeySize)) {
    throw WalletError("wallet secret key does not match its public key");
  }
}

KeypairWallet::~KeypairWallet() {
  OPENSSL_cleanse(secret_.data(), secret_.size());
}

std::string KeypairWallet::publicKey() const {
  return codec::base58Encode(
      std::vector<std::uint8_t>(public_key_.begin(), public_key_.end()));
}

std::array<std::uint8_t, KeypairWallet::kSignatureSize>
KeypairWallet::signMessage(const std::uint8_t* data, std::size_t size) const {
  PkeyPtr key = loadPrivateKey(secret_.data());
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw WalletError("EVP_MD_CTX_new failed");
  }
  // Ed25519 is a one-shot scheme: no digest, sign the message directly.
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw WalletError("EVP_DigestSignInit failed");
  }

  std::array<std::uint8_t, kSignatureSize> signature{};
  std::size_t length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, data, size) != 1 ||
      length != kSignatureSize) {
    throw WalletError("Ed25519 signing failed");
  }
  return signature;
}

// -----------------------------------------------------------------------------
// sign(): fill this wallet's signature slot of a wire-format transaction
// -----------------------------------------------------------------------------
std::vector<std::uint8_t> KeypairWallet::sign(
    const std::vector<std::uint8_t>& unsigned_transaction) const {
  std::vector<std::uint8_t> tx = unsigned_transaction;

  std::size_t offset = 0;
  const std::uint16_t signature_count = readCompactU16(tx, offset);
  const std::size_t signatures_offset = offset;
  const std::size_t message_offset =
      signatures_offset + signature_count * kSignatureSize;
  if (message_offset >= tx.size()) {
    throw WalletError("transaction truncated before message");
  }

  std::size_t cursor = message_offset;
  if ((tx[cursor] & kVersionedMessageFlag) != 0) {
    ++cursor;
  }
  if (cursor + kMessageHeaderSize > tx.size()) {
    throw WalletError("transaction truncated inside message header");
  }
  const std::uint8_t required_signatures = tx[cursor];
  cursor += kMessageHeaderSize;

  const std::uint16_t account_count = readCompactU16(tx, cursor);
  if (cursor + static_cast<std::size_t>(account_count) * kPublicKeySize >
      tx.size()) {
    throw WalletError("transaction truncated inside account keys");
  }
  if (required_signatures > signature_count ||
      required_signatures > account_count) {
    throw WalletError("transaction header is inconsistent");
  }

  std::size_t signer_index = required_signatures;
  for (std::size_t i = 0; i < required_signatures; ++i) {
    const auto key_begin = tx.begin() + static_cast<std::ptrdiff_t>(
                                            cursor + i * kPublicKeySize);
    if (std::equal(public_key_.begin(), public_key_.end(), key_begin)) {
      signer_index = i;
      break;
    }
  }
  if (signer_index == required_signatures) {
    throw WalletError("wallet " + publicKey() +
                      " is not a required signer of this transaction");
  }

  const auto signature = signMessage(tx.data() + message_offset,
                                     tx.size() - message_offset);
  std::copy(signature.begin(), signature.end(),
            tx.begin() + static_cast<std::ptrdiff_t>(
                             signatures_offset + signer_index * kSignatureSize));
  return tx;
}

std::unique_ptr<KeypairWallet> loadTradingWallet(
    const std::optional<std::string>& base58_secret_key, bool live_trading) {
  if (!live_trading || !base58_secret_key) {
    return nullptr;
  }
  return std::make_unique<KeypairWallet>(*base58_secret_key);
}

}  // namespace swapcore
