#include <cstdint>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <gflags/gflags.h>

#include "codec/typeid.hpp"
#include "codec/uuid.hpp"
#include "common/logging/log.hpp"

DEFINE_string(command, "generate",
              "One of: generate, parse, explain, encode, decode, to_hex, from_hex");
DEFINE_string(prefix, "", "Type prefix for generate/encode");
DEFINE_int32(count, 1, "Number of identifiers to generate");
DEFINE_string(input, "", "Typeid (parse, explain, decode, to_hex) or UUID hex (encode, from_hex)");
DEFINE_bool(json, false, "Print results as JSON");

namespace {

using tid::codec::CodecError;
using tid::codec::Json;
using tid::codec::dump_json;

auto report_error(const CodecError& error) -> int {
  tid::log::warn("{} failed: {}", FLAGS_command, std::format("{}", error));
  if (FLAGS_json) {
    std::cout << dump_json(Json(error)) << "\n";
  } else {
    std::cerr << std::format("error: {}\n", error);
  }
  return 1;
}

auto print_text(std::string_view key, const std::string& text) -> void {
  if (FLAGS_json) {
    std::cout << dump_json(Json{{std::string(key), text}}) << "\n";
  } else {
    std::cout << text << "\n";
  }
}

auto run_generate() -> int {
  if (FLAGS_count < 1) {
    std::cerr << "--count must be at least 1\n";
    return 1;
  }
  Json ids = Json::array();
  for (int i = 0; i < FLAGS_count; ++i) {
    auto id = tid::codec::create(FLAGS_prefix);
    if (!id) {
      return report_error(id.error());
    }
    if (FLAGS_json) {
      ids.push_back(*id);
    } else {
      std::cout << *id << "\n";
    }
  }
  if (FLAGS_json) {
    std::cout << dump_json(ids) << "\n";
  }
  tid::log::info("typeid.generate", {{"prefix", FLAGS_prefix},
                                     {"count", std::to_string(FLAGS_count)}});
  return 0;
}

auto run_parse() -> int {
  auto parsed = tid::codec::parse(FLAGS_input);
  if (!parsed) {
    return report_error(parsed.error());
  }
  if (FLAGS_json) {
    std::cout << dump_json(Json(*parsed)) << "\n";
  } else {
    std::cout << std::format("prefix={} suffix={} uuid={}\n",
                             parsed->prefix, parsed->suffix, parsed->value);
  }
  return 0;
}

auto run_explain() -> int {
  auto diagnostic = tid::codec::explain(FLAGS_input);
  if (FLAGS_json) {
    std::cout << dump_json(diagnostic ? Json(*diagnostic) : Json(nullptr)) << "\n";
  } else if (diagnostic) {
    std::cout << std::format("{} (state={}, value={})\n", *diagnostic,
                             tid::codec::to_string(diagnostic->state), diagnostic->value);
  } else {
    std::cout << "valid\n";
  }
  return diagnostic ? 1 : 0;
}

auto run_encode() -> int {
  auto value = tid::codec::hex_to_value(FLAGS_input);
  if (!value) {
    return report_error(value.error());
  }
  auto text = tid::codec::encode(*value, FLAGS_prefix);
  if (!text) {
    return report_error(text.error());
  }
  print_text("typeid", *text);
  return 0;
}

auto run_decode() -> int {
  auto value = tid::codec::decode(FLAGS_input);
  if (!value) {
    return report_error(value.error());
  }
  print_text("uuid", tid::codec::value_to_uuid_string(*value));
  return 0;
}

auto run_to_hex() -> int {
  auto value = tid::codec::decode(FLAGS_input);
  if (!value) {
    return report_error(value.error());
  }
  print_text("hex", tid::codec::value_to_hex(*value));
  return 0;
}

auto run_from_hex() -> int {
  auto value = tid::codec::hex_to_value(FLAGS_input);
  if (!value) {
    return report_error(value.error());
  }
  print_text("uuid", tid::codec::value_to_uuid_string(*value));
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Generate, parse and validate typeid identifiers");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  tid::log::init();

  int rc = 1;
  const std::string& command = FLAGS_command;
  if (command == "generate") {
    rc = run_generate();
  } else if (command == "parse") {
    rc = run_parse();
  } else if (command == "explain") {
    rc = run_explain();
  } else if (command == "encode") {
    rc = run_encode();
  } else if (command == "decode") {
    rc = run_decode();
  } else if (command == "to_hex") {
    rc = run_to_hex();
  } else if (command == "from_hex") {
    rc = run_from_hex();
  } else {
    std::cerr << "unknown --command: " << command << "\n";
  }

  tid::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return rc;
}
