#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace tid::codec {

/// Failure taxonomy shared by the codec, the validators and the parser.
enum class ErrorKind : std::uint8_t {
  InvalidInputType,
  InvalidLength,
  InvalidCase,
  LeadingUnderscore,
  InvalidPrefixType,
  PrefixTooLong,
  InvalidPrefixFormat,
  InvalidSuffixLength,
  InvalidSuffixAlphabet,
  SuffixOverflow,
  InvalidValueLength,
  InvalidHex,
  DecodeFailure,
  EntropyUnavailable,
};

/// Parser states, in the order a well-formed input passes through them.
/// A diagnostic records the last state that was reached successfully.
enum class ParseState : std::uint8_t {
  Start,
  TypeOk,
  LengthOk,
  CaseOk,
  NoLeadingUnderscore,
  Split,
  PrefixOk,
  SuffixOk,
  Decoded,
};

/// Stable snake_case name, used as the `type` of JSON diagnostics.
auto to_string(ErrorKind kind) -> std::string_view;

auto to_string(ParseState state) -> std::string_view;

struct CodecError {
  ErrorKind kind = ErrorKind::DecodeFailure;
  std::string message;
  /// The offending input (whole string, prefix or suffix depending on kind).
  std::string value;
  /// Character offset for alphabet failures.
  std::optional<std::size_t> position;
  /// Grammar that was violated, for format failures.
  std::string pattern;
  ParseState state = ParseState::Start;
};

template <typename T>
using Expected = tl::expected<T, CodecError>;

inline auto make_error(ErrorKind kind, std::string message, std::string value = {})
  -> CodecError {
  CodecError error;
  error.kind = kind;
  error.message = std::move(message);
  error.value = std::move(value);
  return error;
}

}  // namespace tid::codec

template <>
struct std::formatter<tid::codec::ErrorKind> : std::formatter<std::string_view> {
  auto format(tid::codec::ErrorKind kind, std::format_context& ctx) const {
    return formatter<std::string_view>::format(tid::codec::to_string(kind), ctx);
  }
};

template <>
struct std::formatter<tid::codec::CodecError> : std::formatter<std::string> {
  auto format(const tid::codec::CodecError& error, std::format_context& ctx) const {
    return formatter<std::string>::format(
        std::format("{}: {}", tid::codec::to_string(error.kind), error.message), ctx);
  }
};
