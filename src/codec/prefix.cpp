#include "codec/prefix.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace tid::codec {
namespace {

auto is_lower(char c) -> bool { return c >= 'a' && c <= 'z'; }

auto grammar_error(std::string_view prefix, std::string message) -> CodecError {
  auto error = make_error(ErrorKind::InvalidPrefixFormat, std::move(message), std::string(prefix));
  error.pattern = std::string(kPrefixPattern);
  return error;
}

}  // namespace

auto validate_prefix(std::string_view prefix) -> Expected<void> {
  if (prefix.empty()) {
    return {};
  }
  if (prefix.size() > kMaxPrefixLength) {
    return tl::unexpected(make_error(
        ErrorKind::PrefixTooLong,
        std::format("prefix must be at most {} characters, got {}", kMaxPrefixLength, prefix.size()),
        std::string(prefix)));
  }
  if (!is_lower(prefix.front())) {
    return tl::unexpected(grammar_error(prefix, "prefix must start with a lowercase letter"));
  }
  if (!is_lower(prefix.back())) {
    return tl::unexpected(grammar_error(prefix, "prefix must end with a lowercase letter"));
  }
  auto bad = std::find_if(prefix.begin(), prefix.end(),
                          [](char c) { return !is_lower(c) && c != '_'; });
  if (bad != prefix.end()) {
    auto error = grammar_error(
        prefix, "prefix may only contain lowercase letters and underscores");
    error.position = static_cast<std::size_t>(bad - prefix.begin());
    return tl::unexpected(std::move(error));
  }
  return {};
}

auto is_valid_prefix(std::string_view prefix) -> bool {
  return validate_prefix(prefix).has_value();
}

}  // namespace tid::codec
