#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "codec/error.hpp"
#include "codec/uuid.hpp"

namespace tid::codec::base32 {

/// Crockford-style alphabet without i, l, o and u.
inline constexpr std::string_view kAlphabet = "0123456789abcdefghjkmnpqrstvwxyz";

/// Encoded length of a 128-bit value (130 bits in 5-bit groups).
inline constexpr std::size_t kEncodedLength = 26;

/// Largest symbol value allowed in the leading position: only its low three
/// bits are significant.
inline constexpr std::uint8_t kMaxLeadingValue = 7;

inline constexpr std::uint8_t kInvalidSymbol = 0xFF;

/// Symbol -> 5-bit value; kInvalidSymbol for bytes outside the alphabet.
inline constexpr auto kDecodeTable = [] {
  std::array<std::uint8_t, 256> table{};
  table.fill(kInvalidSymbol);
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
  }
  return table;
}();

/// Encode 16 bytes as 26 alphabet symbols, most significant group first.
auto encode(const Uuid& value) -> std::string;

/// Check length, alphabet and leading symbol without producing a value.
auto validate(std::string_view suffix) -> Expected<void>;

/// Decode a 26 symbol suffix back to 16 bytes.
auto decode(std::string_view suffix) -> Expected<Uuid>;

inline auto is_valid_suffix(std::string_view suffix) -> bool {
  return validate(suffix).has_value();
}

}  // namespace tid::codec::base32
