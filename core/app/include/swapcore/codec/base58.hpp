#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace swapcore {
namespace codec {

// -----------------------------------------------------------------------------
// Base58 (Bitcoin alphabet)
// -----------------------------------------------------------------------------
// Solana public keys, secret keys and transaction signatures are all
// exchanged as base58 text. Leading zero bytes map to leading '1' characters.
// -----------------------------------------------------------------------------

std::string base58Encode(const std::vector<std::uint8_t>& bytes);

// Throws std::invalid_argument on a character outside the alphabet.
std::vector<std::uint8_t> base58Decode(const std::string& text);

// True when every character belongs to the alphabet (empty → false).
bool isBase58(const std::string& text);

}  // namespace codec
}  // namespace swapcore
