#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace flakeid::core {

// Base-62 rendering of non-negative integers over the alphabet 0-9A-Za-z
// (digits, then upper case, then lower case). Output is URL-safe and shorter
// than decimal for the same value.
//
// Ordering: raw string comparison matches numeric order only between strings of
// equal length. Use encode_base62_padded when keys must sort lexicographically.

inline constexpr std::string_view kBase62Alphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

// Digits needed for any 64-bit value (62^10 < 2^63 < 2^64 < 62^11).
inline constexpr std::size_t kBase62IdWidth = 11;

// encode_base62 returns the base-62 digits of value, most significant first,
// with no leading '0' characters. encode_base62(0) == "0".
// Pure function: no state, never fails.
[[nodiscard]] std::string encode_base62(std::uint64_t value);

// encode_base62_padded left-pads encode_base62(value) with '0' to exactly
// kBase62IdWidth characters, so padded keys sort like the integers they encode.
[[nodiscard]] std::string encode_base62_padded(std::uint64_t value);

}  // namespace flakeid::core
