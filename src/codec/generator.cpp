#include "codec/generator.hpp"

#include <array>
#include <chrono>
#include <climits>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "common/logging/log.hpp"

namespace tid::codec {
namespace {

constexpr std::uint64_t kTimestampMask = (std::uint64_t{1} << 48) - 1;
constexpr std::size_t kRandomBytes = 10;

}  // namespace

auto SystemClock::now_ms() const -> std::uint64_t {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

auto SecureRandomSource::fill(std::span<std::uint8_t> out) -> bool {
  if (out.empty()) {
    return true;
  }
  if (out.size() > static_cast<std::size_t>(INT_MAX)) {
    return false;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    std::array<char, 256> reason{};
    ERR_error_string_n(ERR_get_error(), reason.data(), reason.size());
    tid::log::error("RAND_bytes failed: {}", std::string(reason.data()));
    return false;
  }
  return true;
}

auto SeededRandomSource::fill(std::span<std::uint8_t> out) -> bool {
  std::size_t i = 0;
  while (i < out.size()) {
    state_ += 0x9e3779b97f4a7c15ULL;
    std::uint64_t z = state_;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    z ^= z >> 31;
    for (int shift = 0; shift < 64 && i < out.size(); shift += 8) {
      out[i++] = static_cast<std::uint8_t>(z >> shift);
    }
  }
  return true;
}

auto system_clock() -> const Clock& {
  static const SystemClock clock;
  return clock;
}

auto secure_random() -> RandomSource& {
  static SecureRandomSource source;
  return source;
}

ValueGenerator::ValueGenerator() : ValueGenerator(system_clock(), secure_random()) {}

ValueGenerator::ValueGenerator(const Clock& clock, RandomSource& random)
    : clock_(&clock), random_(&random) {}

auto ValueGenerator::generate() const -> Expected<Uuid> {
  const std::uint64_t ms = clock_->now_ms() & kTimestampMask;

  std::array<std::uint8_t, kRandomBytes> entropy{};
  if (!random_->fill(entropy)) {
    tid::log::error("random source failed; no value generated");
    return tl::unexpected(make_error(ErrorKind::EntropyUnavailable,
                                     "random source could not provide 10 bytes"));
  }

  Uuid value;
  for (std::size_t i = 0; i < 6; ++i) {
    value.bytes[i] = static_cast<std::uint8_t>(ms >> (8 * (5 - i)));
  }
  value.bytes[6] = static_cast<std::uint8_t>((entropy[0] & 0x0F) | 0x70);
  value.bytes[7] = entropy[1];
  value.bytes[8] = static_cast<std::uint8_t>((entropy[2] & 0x3F) | 0x80);
  for (std::size_t i = 0; i < 7; ++i) {
    value.bytes[9 + i] = entropy[3 + i];
  }
  return value;
}

auto generate_v7() -> Expected<Uuid> {
  return ValueGenerator{}.generate();
}

}  // namespace tid::codec
