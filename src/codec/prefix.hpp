#pragma once

#include <cstddef>
#include <string_view>

#include "codec/error.hpp"

namespace tid::codec {

inline constexpr std::size_t kMaxPrefixLength = 63;
inline constexpr std::string_view kPrefixPattern = "^([a-z]([a-z_]{0,61}[a-z])?)?$";

/// Accepts "" or 1-63 characters of [a-z_] that start and end with a letter.
/// Length is checked before the grammar.
auto validate_prefix(std::string_view prefix) -> Expected<void>;

auto is_valid_prefix(std::string_view prefix) -> bool;

}  // namespace tid::codec
