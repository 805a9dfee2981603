#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace swapcore {
namespace codec {

// Standard (RFC 4648) base64 with padding, backed by OpenSSL's EVP block
// codec. The swap-build endpoint returns transactions in this form and
// sendTransaction takes them back in it.
std::string base64Encode(const std::vector<std::uint8_t>& bytes);

// Throws std::invalid_argument on malformed input. Surrounding whitespace is
// ignored.
std::vector<std::uint8_t> base64Decode(const std::string& text);

}  // namespace codec
}  // namespace swapcore
