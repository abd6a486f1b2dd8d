#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "codec/error.hpp"
#include "codec/uuid.hpp"

namespace tid::codec {

inline constexpr char kSeparator = '_';
inline constexpr std::size_t kMinTypeIdLength = 26;
inline constexpr std::size_t kMaxTypeIdLength = 90;

/// Result of a successful parse. `text` is the full identifier.
struct ParsedTypeId {
  std::string prefix;
  std::string suffix;
  Uuid value;
  std::string text;

  auto operator==(const ParsedTypeId&) const -> bool = default;
};

/// `suffix` when prefix is empty, otherwise `prefix_suffix`. No validation.
auto assemble(std::string_view prefix, std::string_view suffix) -> std::string;

/// Split on the last separator; no separator means an empty prefix.
auto split(std::string_view text) -> std::pair<std::string_view, std::string_view>;

/// Runs the full validation chain:
///   length -> case -> leading underscore -> split -> prefix -> suffix -> decode
/// and stops at the first failure. The error's `state` is the last state
/// passed.
auto parse(std::string_view text) -> Expected<ParsedTypeId>;

/// Same chain as parse(); empty on success.
auto explain(std::string_view text) -> std::optional<CodecError>;

auto is_valid_typeid(std::string_view text) -> bool;

}  // namespace tid::codec
