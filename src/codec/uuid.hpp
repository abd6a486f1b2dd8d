#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include "codec/error.hpp"

namespace tid::codec {

/// 128-bit identifier value, big-endian byte order.
struct Uuid {
  static constexpr std::size_t kSize = 16;

  std::array<std::uint8_t, kSize> bytes{};

  auto operator<=>(const Uuid&) const = default;

  /// High nibble of byte 6.
  auto version() const -> int { return bytes[6] >> 4; }
  /// Top two bits of byte 8.
  auto variant() const -> int { return bytes[8] >> 6; }
  auto is_nil() const -> bool;
};

/// True when the value carries the version 7 nibble and the RFC variant bits.
auto is_uuid_v7(const Uuid& value) -> bool;

/// The 48-bit millisecond timestamp stored in bytes 0..6.
auto timestamp_ms(const Uuid& value) -> std::uint64_t;

/// Copy exactly 16 bytes; any other length is InvalidValueLength.
auto value_from_bytes(std::span<const std::uint8_t> bytes) -> Expected<Uuid>;

/// 32 lowercase hex digits, no separators.
auto value_to_hex(const Uuid& value) -> std::string;

/// Canonical 8-4-4-4-12 lowercase form.
auto value_to_uuid_string(const Uuid& value) -> std::string;

/// Parse 32 hex digits. Hyphens are skipped wherever they appear and digits
/// are case-insensitive.
auto hex_to_value(std::string_view hex) -> Expected<Uuid>;

}  // namespace tid::codec

template <>
struct std::hash<tid::codec::Uuid> {
  auto operator()(const tid::codec::Uuid& v) const -> std::size_t {
    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    for (std::size_t i = 0; i < 8; ++i) {
      hi = (hi << 8) | v.bytes[i];
      lo = (lo << 8) | v.bytes[i + 8];
    }
    std::size_t h1 = std::hash<std::uint64_t>{}(hi);
    std::size_t h2 = std::hash<std::uint64_t>{}(lo);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

template <>
struct std::formatter<tid::codec::Uuid> : std::formatter<std::string> {
  auto format(const tid::codec::Uuid& v, std::format_context& ctx) const {
    return formatter<std::string>::format(tid::codec::value_to_uuid_string(v), ctx);
  }
};
