#pragma once

#include <compare>
#include <cstddef>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "codec/error.hpp"
#include "codec/parser.hpp"
#include "codec/uuid.hpp"

namespace tid::codec {

using Json = nlohmann::json;

/// Build a typeid string. Without a value a fresh version 7 value is
/// generated.
auto create(std::string_view prefix = {}, std::optional<Uuid> value = std::nullopt)
  -> Expected<std::string>;

/// Create from a loosely typed prefix (null means no prefix). Anything but a
/// string or null is InvalidPrefixType.
auto create_json(const Json& prefix, std::optional<Uuid> value = std::nullopt)
  -> Expected<std::string>;

/// Encode an existing value under a prefix.
auto encode(const Uuid& value, std::string_view prefix) -> Expected<std::string>;

/// Parse a typeid and return only its value.
auto decode(std::string_view text) -> Expected<Uuid>;

/// Parse a loosely typed input; non-strings are InvalidInputType.
auto parse_json(const Json& input) -> Expected<ParsedTypeId>;

/// Diagnose any JSON value. Never throws on malformed input.
auto explain_json(const Json& input) -> std::optional<CodecError>;

/// {"prefix", "suffix", "uuid", "typeid"}
void to_json(Json& json, const ParsedTypeId& parsed);

/// {"type", "message", "value", "state"} plus "position"/"pattern" when set.
void to_json(Json& json, const CodecError& error);

/// Serialize compactly; invalid UTF-8 in raw inputs becomes U+FFFD.
auto dump_json(const Json& json) -> std::string;

/// Validated prefix/value pair. Orders by prefix, then value, which matches
/// the byte order of the text form for identifiers sharing a prefix.
class TypeId {
public:
  /// Nil value, no prefix.
  TypeId() = default;

  static auto generate(std::string_view prefix = {}) -> Expected<TypeId>;
  static auto from_string(std::string_view text) -> Expected<TypeId>;
  static auto from_value(std::string_view prefix, const Uuid& value) -> Expected<TypeId>;

  auto prefix() const -> const std::string& { return prefix_; }
  auto value() const -> const Uuid& { return value_; }
  auto suffix() const -> std::string;
  auto to_string() const -> std::string;

  auto operator<=>(const TypeId&) const = default;

private:
  TypeId(std::string prefix, const Uuid& value);

  std::string prefix_;
  Uuid value_{};
};

}  // namespace tid::codec

template <>
struct std::hash<tid::codec::TypeId> {
  auto operator()(const tid::codec::TypeId& id) const -> std::size_t {
    std::size_t h1 = std::hash<std::string>{}(id.prefix());
    std::size_t h2 = std::hash<tid::codec::Uuid>{}(id.value());
    return h1 ^ (h2 << 1);
  }
};

template <>
struct std::formatter<tid::codec::TypeId> : std::formatter<std::string> {
  auto format(const tid::codec::TypeId& id, std::format_context& ctx) const {
    return formatter<std::string>::format(id.to_string(), ctx);
  }
};
