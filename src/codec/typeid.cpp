#include "codec/typeid.hpp"

#include <utility>

#include "codec/base32.hpp"
#include "codec/generator.hpp"
#include "codec/prefix.hpp"

namespace tid::codec {
namespace {

auto json_type_name(const Json& value) -> std::string {
  return std::string(value.type_name());
}

}  // namespace

auto create(std::string_view prefix, std::optional<Uuid> value) -> Expected<std::string> {
  if (auto ok = validate_prefix(prefix); !ok) {
    return tl::unexpected(std::move(ok.error()));
  }
  if (!value) {
    auto generated = generate_v7();
    if (!generated) {
      return tl::unexpected(std::move(generated.error()));
    }
    value = *generated;
  }
  return assemble(prefix, base32::encode(*value));
}

auto create_json(const Json& prefix, std::optional<Uuid> value) -> Expected<std::string> {
  if (prefix.is_null()) {
    return create(std::string_view{}, value);
  }
  if (!prefix.is_string()) {
    return tl::unexpected(make_error(
        ErrorKind::InvalidPrefixType,
        std::format("prefix must be a string, got {}", json_type_name(prefix)),
        dump_json(prefix)));
  }
  return create(std::string_view(prefix.get_ref<const std::string&>()), value);
}

auto encode(const Uuid& value, std::string_view prefix) -> Expected<std::string> {
  return create(prefix, value);
}

auto decode(std::string_view text) -> Expected<Uuid> {
  auto parsed = parse(text);
  if (!parsed) {
    return tl::unexpected(std::move(parsed.error()));
  }
  return parsed->value;
}

auto parse_json(const Json& input) -> Expected<ParsedTypeId> {
  if (!input.is_string()) {
    auto error = make_error(
        ErrorKind::InvalidInputType,
        std::format("typeid must be a string, got {}", json_type_name(input)),
        dump_json(input));
    error.state = ParseState::Start;
    return tl::unexpected(std::move(error));
  }
  return parse(std::string_view(input.get_ref<const std::string&>()));
}

auto explain_json(const Json& input) -> std::optional<CodecError> {
  auto parsed = parse_json(input);
  if (parsed) {
    return std::nullopt;
  }
  return std::move(parsed.error());
}

void to_json(Json& json, const ParsedTypeId& parsed) {
  json = Json{
      {"prefix", parsed.prefix},
      {"suffix", parsed.suffix},
      {"uuid", value_to_uuid_string(parsed.value)},
      {"typeid", parsed.text},
  };
}

void to_json(Json& json, const CodecError& error) {
  json = Json{
      {"type", std::string(to_string(error.kind))},
      {"message", error.message},
      {"value", error.value},
      {"state", std::string(to_string(error.state))},
  };
  if (error.position) {
    json["position"] = *error.position;
  }
  if (!error.pattern.empty()) {
    json["pattern"] = error.pattern;
  }
}

auto dump_json(const Json& json) -> std::string {
  return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

TypeId::TypeId(std::string prefix, const Uuid& value)
    : prefix_(std::move(prefix)), value_(value) {}

auto TypeId::generate(std::string_view prefix) -> Expected<TypeId> {
  auto value = generate_v7();
  if (!value) {
    return tl::unexpected(std::move(value.error()));
  }
  return from_value(prefix, *value);
}

auto TypeId::from_string(std::string_view text) -> Expected<TypeId> {
  auto parsed = parse(text);
  if (!parsed) {
    return tl::unexpected(std::move(parsed.error()));
  }
  return TypeId(std::move(parsed->prefix), parsed->value);
}

auto TypeId::from_value(std::string_view prefix, const Uuid& value) -> Expected<TypeId> {
  if (auto ok = validate_prefix(prefix); !ok) {
    return tl::unexpected(std::move(ok.error()));
  }
  return TypeId(std::string(prefix), value);
}

auto TypeId::suffix() const -> std::string {
  return base32::encode(value_);
}

auto TypeId::to_string() const -> std::string {
  return assemble(prefix_, suffix());
}

}  // namespace tid::codec
