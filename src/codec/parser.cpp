#include "codec/parser.hpp"

#include <algorithm>
#include <format>

#include "codec/base32.hpp"
#include "codec/prefix.hpp"

namespace tid::codec {
namespace {

auto fail(CodecError error, ParseState state) -> tl::unexpected<CodecError> {
  error.state = state;
  return tl::unexpected(std::move(error));
}

auto has_upper(std::string_view text) -> bool {
  return std::any_of(text.begin(), text.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
}

}  // namespace

auto assemble(std::string_view prefix, std::string_view suffix) -> std::string {
  if (prefix.empty()) {
    return std::string(suffix);
  }
  std::string out;
  out.reserve(prefix.size() + 1 + suffix.size());
  out.append(prefix);
  out.push_back(kSeparator);
  out.append(suffix);
  return out;
}

auto split(std::string_view text) -> std::pair<std::string_view, std::string_view> {
  auto pos = text.rfind(kSeparator);
  if (pos == std::string_view::npos) {
    return {std::string_view{}, text};
  }
  return {text.substr(0, pos), text.substr(pos + 1)};
}

auto parse(std::string_view text) -> Expected<ParsedTypeId> {
  // Start -> TypeOk: the input is statically a string here; the dynamic
  // check lives at the JSON boundary.
  auto state = ParseState::TypeOk;

  if (text.size() < kMinTypeIdLength || text.size() > kMaxTypeIdLength) {
    return fail(make_error(ErrorKind::InvalidLength,
                           std::format("typeid must be {}-{} characters, got {}",
                                       kMinTypeIdLength, kMaxTypeIdLength, text.size()),
                           std::string(text)),
                state);
  }
  state = ParseState::LengthOk;

  if (has_upper(text)) {
    return fail(make_error(ErrorKind::InvalidCase, "typeid must be all lowercase",
                           std::string(text)),
                state);
  }
  state = ParseState::CaseOk;

  if (text.front() == kSeparator) {
    return fail(make_error(ErrorKind::LeadingUnderscore,
                           "typeid must not start with an underscore", std::string(text)),
                state);
  }
  state = ParseState::NoLeadingUnderscore;

  auto [prefix, suffix] = split(text);
  state = ParseState::Split;

  if (auto ok = validate_prefix(prefix); !ok) {
    return fail(std::move(ok.error()), state);
  }
  state = ParseState::PrefixOk;

  if (auto ok = base32::validate(suffix); !ok) {
    return fail(std::move(ok.error()), state);
  }
  state = ParseState::SuffixOk;

  auto value = base32::decode(suffix);
  if (!value) {
    return fail(make_error(ErrorKind::DecodeFailure,
                           std::format("suffix could not be decoded: {}", value.error().message),
                           std::string(suffix)),
                state);
  }

  ParsedTypeId parsed;
  parsed.prefix = std::string(prefix);
  parsed.suffix = std::string(suffix);
  parsed.value = *value;
  parsed.text = std::string(text);
  return parsed;
}

auto explain(std::string_view text) -> std::optional<CodecError> {
  auto parsed = parse(text);
  if (parsed) {
    return std::nullopt;
  }
  return std::move(parsed.error());
}

auto is_valid_typeid(std::string_view text) -> bool {
  return parse(text).has_value();
}

}  // namespace tid::codec
