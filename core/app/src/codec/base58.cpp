#include "swapcore/codec/base58.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace swapcore {
namespace codec {

namespace {

constexpr char kAlphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Reverse lookup, -1 for characters outside the alphabet.
const std::array<int, 256>& decodeTable() {
  static const std::array<int, 256> table = [] {
    std::array<int, 256> t{};
    t.fill(-1);
    for (int i = 0; i < 58; ++i) {
      t[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return t;
  }();
  return table;
}

}  // namespace

// -----------------------------------------------------------------------------
// base58Encode: repeated division of a big-endian byte string by 58
// -----------------------------------------------------------------------------
std::string base58Encode(const std::vector<std::uint8_t>& bytes) {
  std::size_t zeros = 0;
  while (zeros < bytes.size() && bytes[zeros] == 0) {
    ++zeros;
  }

  // log(256) / log(58) ≈ 1.37, so this many digits always suffice.
  std::vector<std::uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
  std::size_t length = 0;

  for (std::size_t i = zeros; i < bytes.size(); ++i) {
    int carry = bytes[i];
    std::size_t j = 0;
    for (auto it = digits.rbegin();
         (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
      carry += 256 * (*it);
      *it = static_cast<std::uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }

  auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
  while (it != digits.end() && *it == 0) {
    ++it;
  }

  std::string out(zeros, '1');
  for (; it != digits.end(); ++it) {
    out.push_back(kAlphabet[*it]);
  }
  return out;
}

// -----------------------------------------------------------------------------
// base58Decode: repeated multiplication by 58 into a base-256 buffer
// -----------------------------------------------------------------------------
std::vector<std::uint8_t> base58Decode(const std::string& text) {
  const auto& table = decodeTable();

  std::size_t ones = 0;
  while (ones < text.size() && text[ones] == '1') {
    ++ones;
  }

  // log(58) / log(256) ≈ 0.733.
  std::vector<std::uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
  std::size_t length = 0;

  for (std::size_t i = ones; i < text.size(); ++i) {
    int carry = table[static_cast<unsigned char>(text[i])];
    if (carry < 0) {
      throw std::invalid_argument("invalid base58 character at position " +
                                  std::to_string(i));
    }
    std::size_t j = 0;
    for (auto it = bytes.rbegin();
         (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
      carry += 58 * (*it);
      *it = static_cast<std::uint8_t>(carry % 256);
      carry /= 256;
    }
    length = j;
  }

  auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
  while (it != bytes.end() && *it == 0) {
    ++it;
  }

  std::vector<std::uint8_t> out(ones, 0);
  out.insert(out.end(), it, bytes.end());
  return out;
}

bool isBase58(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  const auto& table = decodeTable();
  return std::all_of(text.begin(), text.end(), [&table](char c) {
    return table[static_cast<unsigned char>(c)] >= 0;
  });
}

}  // namespace codec
}  // namespace swapcore
