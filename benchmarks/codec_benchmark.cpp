#include <benchmark/benchmark.h>

#include <string>

#include "codec/base32.hpp"
#include "codec/generator.hpp"
#include "codec/parser.hpp"
#include "codec/prefix.hpp"
#include "codec/typeid.hpp"

namespace {

const std::string kSampleTypeId = "user_01h5fskfsk4fpeqwnsyz5hj55t";
const std::string kSampleSuffix = "01h5fskfsk4fpeqwnsyz5hj55t";

auto sample_value() -> tid::codec::Uuid {
  auto value = tid::codec::hex_to_value("01895f99-bf33-23ec-ebf2-b9f7cb1914ba");
  return value ? *value : tid::codec::Uuid{};
}

void BM_Create(benchmark::State& state) {
  for (auto _ : state) {
    auto id = tid::codec::create("user");
    benchmark::DoNotOptimize(id);
  }
}
BENCHMARK(BM_Create);

void BM_CreateNoPrefix(benchmark::State& state) {
  for (auto _ : state) {
    auto id = tid::codec::create();
    benchmark::DoNotOptimize(id);
  }
}
BENCHMARK(BM_CreateNoPrefix);

void BM_GenerateSeeded(benchmark::State& state) {
  tid::codec::FixedClock clock(1700000000000ULL);
  tid::codec::SeededRandomSource random(42);
  tid::codec::ValueGenerator generator(clock, random);
  for (auto _ : state) {
    auto value = generator.generate();
    benchmark::DoNotOptimize(value);
  }
}
BENCHMARK(BM_GenerateSeeded);

void BM_Parse(benchmark::State& state) {
  for (auto _ : state) {
    auto parsed = tid::codec::parse(kSampleTypeId);
    benchmark::DoNotOptimize(parsed);
  }
}
BENCHMARK(BM_Parse);

void BM_Encode(benchmark::State& state) {
  const auto value = sample_value();
  for (auto _ : state) {
    auto text = tid::codec::encode(value, "user");
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_Encode);

void BM_Decode(benchmark::State& state) {
  for (auto _ : state) {
    auto value = tid::codec::decode(kSampleTypeId);
    benchmark::DoNotOptimize(value);
  }
}
BENCHMARK(BM_Decode);

void BM_Base32Encode(benchmark::State& state) {
  const auto value = sample_value();
  for (auto _ : state) {
    auto text = tid::codec::base32::encode(value);
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_Base32Encode);

void BM_Base32Decode(benchmark::State& state) {
  for (auto _ : state) {
    auto value = tid::codec::base32::decode(kSampleSuffix);
    benchmark::DoNotOptimize(value);
  }
}
BENCHMARK(BM_Base32Decode);

void BM_ValidatePrefix(benchmark::State& state) {
  const std::string prefix = "customer_order_line";
  for (auto _ : state) {
    auto ok = tid::codec::is_valid_prefix(prefix);
    benchmark::DoNotOptimize(ok);
  }
}
BENCHMARK(BM_ValidatePrefix);

}  // namespace

BENCHMARK_MAIN();
