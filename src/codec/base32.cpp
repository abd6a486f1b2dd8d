#include "codec/base32.hpp"

#include <format>

namespace tid::codec::base32 {
namespace {

constexpr std::string_view kSuffixPattern = "^[0-7][0-9a-hjkmnp-tv-z]{25}$";

auto symbol_value(char c) -> std::uint8_t {
  return kDecodeTable[static_cast<unsigned char>(c)];
}

auto suffix_error(ErrorKind kind, std::string message, std::string_view suffix) -> CodecError {
  auto error = make_error(kind, std::move(message), std::string(suffix));
  error.pattern = std::string(kSuffixPattern);
  return error;
}

}  // namespace

auto encode(const Uuid& value) -> std::string {
  std::string out(kEncodedLength, '0');
  // Consume bytes from the least significant end; each pass emits every
  // complete 5-bit group. 128 bits yield 25 groups plus 3 leftover bits
  // that, with the two implicit zero bits, form the leading symbol.
  std::uint32_t acc = 0;
  unsigned bits = 0;
  std::size_t pos = kEncodedLength;
  for (std::size_t i = Uuid::kSize; i-- > 0;) {
    acc |= static_cast<std::uint32_t>(value.bytes[i]) << bits;
    bits += 8;
    while (bits >= 5) {
      out[--pos] = kAlphabet[acc & 0x1Fu];
      acc >>= 5;
      bits -= 5;
    }
  }
  out[--pos] = kAlphabet[acc & 0x1Fu];
  return out;
}

auto validate(std::string_view suffix) -> Expected<void> {
  if (suffix.size() != kEncodedLength) {
    return tl::unexpected(suffix_error(
        ErrorKind::InvalidSuffixLength,
        std::format("suffix must be {} characters, got {}", kEncodedLength, suffix.size()),
        suffix));
  }
  for (std::size_t i = 0; i < suffix.size(); ++i) {
    if (symbol_value(suffix[i]) == kInvalidSymbol) {
      auto error = suffix_error(
          ErrorKind::InvalidSuffixAlphabet,
          std::format("invalid base32 character '{}' at position {}", suffix[i], i),
          suffix);
      error.position = i;
      return tl::unexpected(std::move(error));
    }
  }
  if (symbol_value(suffix.front()) > kMaxLeadingValue) {
    auto error = suffix_error(
        ErrorKind::SuffixOverflow,
        std::format("leading character '{}' exceeds '7'; value would not fit in 128 bits",
                    suffix.front()),
        suffix);
    error.position = 0;
    return tl::unexpected(std::move(error));
  }
  return {};
}

auto decode(std::string_view suffix) -> Expected<Uuid> {
  if (auto ok = validate(suffix); !ok) {
    return tl::unexpected(std::move(ok.error()));
  }

  Uuid value;
  std::uint32_t acc = 0;
  unsigned bits = 0;
  std::size_t pos = Uuid::kSize;
  for (std::size_t i = kEncodedLength; i-- > 0;) {
    acc |= static_cast<std::uint32_t>(symbol_value(suffix[i])) << bits;
    bits += 5;
    if (bits >= 8) {
      value.bytes[--pos] = static_cast<std::uint8_t>(acc & 0xFFu);
      acc >>= 8;
      bits -= 8;
    }
  }
  // Two bits remain: the implicit leading zeros.
  if (pos != 0 || acc != 0) {
    return tl::unexpected(make_error(ErrorKind::DecodeFailure,
                                     "suffix did not decode to exactly 128 bits",
                                     std::string(suffix)));
  }
  return value;
}

}  // namespace tid::codec::base32
