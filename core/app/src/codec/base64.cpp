#include "swapcore/codec/base64.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <stdexcept>

namespace swapcore {
namespace codec {

std::string base64Encode(const std::vector<std::uint8_t>& bytes) {
  if (bytes.empty()) {
    return {};
  }
  // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes.
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), bytes.data(),
                      static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::vector<std::uint8_t> base64Decode(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  const std::string trimmed = text.substr(begin, end - begin);

  if (trimmed.empty()) {
    return {};
  }
  if (trimmed.size() % 4 != 0) {
    throw std::invalid_argument("base64 length is not a multiple of 4");
  }

  std::vector<std::uint8_t> out(trimmed.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(trimmed.data()),
      static_cast<int>(trimmed.size()));
  if (decoded < 0) {
    throw std::invalid_argument("malformed base64 input");
  }

  // EVP_DecodeBlock does not account for padding; drop one byte per '='.
  std::size_t padding = 0;
  if (trimmed[trimmed.size() - 1] == '=') ++padding;
  if (trimmed[trimmed.size() - 2] == '=') ++padding;
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return out;
}

}  // namespace codec
}  // namespace swapcore
