#include "codec/error.hpp"

namespace tid::codec {

auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::InvalidInputType: return "invalid_input_type";
    case ErrorKind::InvalidLength: return "invalid_length";
    case ErrorKind::InvalidCase: return "invalid_case";
    case ErrorKind::LeadingUnderscore: return "leading_underscore";
    case ErrorKind::InvalidPrefixType: return "invalid_prefix_type";
    case ErrorKind::PrefixTooLong: return "prefix_too_long";
    case ErrorKind::InvalidPrefixFormat: return "invalid_prefix_format";
    case ErrorKind::InvalidSuffixLength: return "invalid_suffix_length";
    case ErrorKind::InvalidSuffixAlphabet: return "invalid_suffix_alphabet";
    case ErrorKind::SuffixOverflow: return "suffix_overflow";
    case ErrorKind::InvalidValueLength: return "invalid_value_length";
    case ErrorKind::InvalidHex: return "invalid_hex";
    case ErrorKind::DecodeFailure: return "decode_failure";
    case ErrorKind::EntropyUnavailable: return "entropy_unavailable";
  }
  return "unknown";
}

auto to_string(ParseState state) -> std::string_view {
  switch (state) {
    case ParseState::Start: return "start";
    case ParseState::TypeOk: return "type_ok";
    case ParseState::LengthOk: return "length_ok";
    case ParseState::CaseOk: return "case_ok";
    case ParseState::NoLeadingUnderscore: return "no_leading_underscore";
    case ParseState::Split: return "split";
    case ParseState::PrefixOk: return "prefix_ok";
    case ParseState::SuffixOk: return "suffix_ok";
    case ParseState::Decoded: return "decoded";
  }
  return "unknown";
}

}  // namespace tid::codec
