#pragma once

#include <cstdint>
#include <span>

#include "codec/error.hpp"
#include "codec/uuid.hpp"

namespace tid::codec {

/// Wall-clock source in milliseconds since the Unix epoch.
class Clock {
public:
  virtual ~Clock() = default;
  virtual auto now_ms() const -> std::uint64_t = 0;
};

/// Source of random bytes. Returns false when entropy is unavailable; the
/// contents of `out` are unspecified in that case.
class RandomSource {
public:
  virtual ~RandomSource() = default;
  virtual auto fill(std::span<std::uint8_t> out) -> bool = 0;
};

class SystemClock final : public Clock {
public:
  auto now_ms() const -> std::uint64_t override;
};

/// OpenSSL RAND_bytes. Holds no state of its own and may be shared between
/// threads.
class SecureRandomSource final : public RandomSource {
public:
  auto fill(std::span<std::uint8_t> out) -> bool override;
};

/// Clock pinned to a caller-chosen instant.
class FixedClock final : public Clock {
public:
  explicit FixedClock(std::uint64_t ms) : ms_(ms) {}

  auto now_ms() const -> std::uint64_t override { return ms_; }
  auto set(std::uint64_t ms) -> void { ms_ = ms; }
  auto advance(std::uint64_t delta_ms) -> void { ms_ += delta_ms; }

private:
  std::uint64_t ms_;
};

/// Reproducible splitmix64 stream for tests and benchmarks. Not for
/// production identifiers and not thread-safe.
class SeededRandomSource final : public RandomSource {
public:
  explicit SeededRandomSource(std::uint64_t seed) : state_(seed) {}

  auto fill(std::span<std::uint8_t> out) -> bool override;

private:
  std::uint64_t state_;
};

/// Process-wide production capabilities.
auto system_clock() -> const Clock&;
auto secure_random() -> RandomSource&;

/// Builds version 7 values: 48-bit big-endian millisecond timestamp, version
/// nibble, 74 random bits, RFC variant. There is no per-millisecond counter,
/// so values created within the same millisecond are ordered only by their
/// random bits.
class ValueGenerator {
public:
  ValueGenerator();
  ValueGenerator(const Clock& clock, RandomSource& random);

  auto generate() const -> Expected<Uuid>;

private:
  const Clock* clock_;
  RandomSource* random_;
};

/// Generate with the system clock and the OpenSSL random source.
auto generate_v7() -> Expected<Uuid>;

}  // namespace tid::codec
