#include "codec/uuid.hpp"

#include <algorithm>

namespace tid::codec {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

auto hex_nibble(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

auto Uuid::is_nil() const -> bool {
  return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; });
}

auto is_uuid_v7(const Uuid& value) -> bool {
  return value.version() == 7 && value.variant() == 0b10;
}

auto timestamp_ms(const Uuid& value) -> std::uint64_t {
  std::uint64_t ms = 0;
  for (std::size_t i = 0; i < 6; ++i) {
    ms = (ms << 8) | value.bytes[i];
  }
  return ms;
}

auto value_from_bytes(std::span<const std::uint8_t> bytes) -> Expected<Uuid> {
  if (bytes.size() != Uuid::kSize) {
    return tl::unexpected(make_error(
        ErrorKind::InvalidValueLength,
        std::format("value must be exactly {} bytes, got {}", Uuid::kSize, bytes.size())));
  }
  Uuid value;
  std::copy(bytes.begin(), bytes.end(), value.bytes.begin());
  return value;
}

auto value_to_hex(const Uuid& value) -> std::string {
  std::string out;
  out.reserve(Uuid::kSize * 2);
  for (auto b : value.bytes) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0F]);
  }
  return out;
}

auto value_to_uuid_string(const Uuid& value) -> std::string {
  auto hex = value_to_hex(value);
  return std::format("{}-{}-{}-{}-{}",
                     std::string_view(hex).substr(0, 8),
                     std::string_view(hex).substr(8, 4),
                     std::string_view(hex).substr(12, 4),
                     std::string_view(hex).substr(16, 4),
                     std::string_view(hex).substr(20, 12));
}

auto hex_to_value(std::string_view hex) -> Expected<Uuid> {
  Uuid value;
  std::size_t digits = 0;
  for (std::size_t i = 0; i < hex.size(); ++i) {
    const char c = hex[i];
    if (c == '-') {
      continue;
    }
    const int nibble = hex_nibble(c);
    if (nibble < 0) {
      auto error = make_error(ErrorKind::InvalidHex,
                              std::format("invalid hex character '{}' at position {}", c, i),
                              std::string(hex));
      error.position = i;
      return tl::unexpected(std::move(error));
    }
    if (digits >= Uuid::kSize * 2) {
      return tl::unexpected(make_error(ErrorKind::InvalidValueLength,
                                       "hex value has more than 32 digits",
                                       std::string(hex)));
    }
    auto& byte = value.bytes[digits / 2];
    byte = static_cast<std::uint8_t>(digits % 2 == 0 ? nibble << 4 : byte | nibble);
    ++digits;
  }
  if (digits != Uuid::kSize * 2) {
    return tl::unexpected(make_error(ErrorKind::InvalidValueLength,
                                     std::format("hex value must have 32 digits, got {}", digits),
                                     std::string(hex)));
  }
  return value;
}

}  // namespace tid::codec
