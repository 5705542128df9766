#include "flakeid/core/base62.h"

#include <algorithm>

namespace flakeid::core {

namespace {

constexpr std::uint64_t kRadix = 62;

}  // namespace

std::string encode_base62(std::uint64_t value) {
  if (value == 0) {
    return std::string{kBase62Alphabet[0]};
  }

  std::string digits;
  digits.reserve(kBase62IdWidth);

  // Least significant digit first, reversed below.
  while (value > 0) {
    digits.push_back(kBase62Alphabet[static_cast<std::size_t>(value % kRadix)]);
    value /= kRadix;
  }

  std::reverse(digits.begin(), digits.end());
  return digits;
}

std::string encode_base62_padded(const std::uint64_t value) {
  std::string digits = encode_base62(value);
  if (digits.size() < kBase62IdWidth) {
    digits.insert(0, kBase62IdWidth - digits.size(), kBase62Alphabet[0]);
  }
  return digits;
}

}  // namespace flakeid::core
