#include "codec/generator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <set>
#include <vector>

using tid::codec::ErrorKind;
using tid::codec::FixedClock;
using tid::codec::SeededRandomSource;
using tid::codec::Uuid;
using tid::codec::ValueGenerator;

TEST(Generator, LaysOutTimestampVersionAndVariant) {
  FixedClock clock(0x0123456789ABULL);
  ScriptedRandomSource random({0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09});
  ValueGenerator generator(clock, random);

  auto value = generator.generate();
  ASSERT_TRUE(value.has_value());
  ASSERT_EQ(tid::codec::value_to_hex(*value), "0123456789ab70018203040506070809");
  ASSERT_EQ(tid::codec::timestamp_ms(*value), 0x0123456789ABULL);
}

TEST(Generator, MasksRandomBitsUnderVersionAndVariant) {
  FixedClock clock(0);
  ScriptedRandomSource random({0xFF});
  ValueGenerator generator(clock, random);

  auto value = generator.generate();
  ASSERT_TRUE(value.has_value());
  ASSERT_EQ(tid::codec::value_to_hex(*value), "0000000000007fffbfffffffffffffff");
  ASSERT_TRUE(tid::codec::is_uuid_v7(*value));
}

TEST(Generator, TruncatesClockToFortyEightBits) {
  FixedClock clock(0xFFFF000000000001ULL);
  SeededRandomSource random(1);
  ValueGenerator generator(clock, random);

  auto value = generator.generate();
  ASSERT_TRUE(value.has_value());
  ASSERT_EQ(tid::codec::timestamp_ms(*value), 1u);
}

TEST(Generator, SameSeedSameValues) {
  FixedClock clock(1700000000000ULL);
  SeededRandomSource first_random(99);
  SeededRandomSource second_random(99);
  ValueGenerator first(clock, first_random);
  ValueGenerator second(clock, second_random);

  for (int i = 0; i < 10; ++i) {
    auto a = first.generate();
    auto b = second.generate();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(*a, *b);
  }
}

TEST(Generator, DistinctWithinOneMillisecond) {
  FixedClock clock(1700000000000ULL);
  SeededRandomSource random(5);
  ValueGenerator generator(clock, random);

  std::set<Uuid> values;
  for (int i = 0; i < 1000; ++i) {
    auto value = generator.generate();
    ASSERT_TRUE(value.has_value());
    ASSERT_EQ(tid::codec::timestamp_ms(*value), 1700000000000ULL);
    values.insert(*value);
  }
  ASSERT_EQ(values.size(), 1000u);
}

TEST(Generator, TimestampFollowsClock) {
  FixedClock clock(1000);
  SeededRandomSource random(3);
  ValueGenerator generator(clock, random);

  auto early = generator.generate();
  clock.advance(1);
  auto late = generator.generate();
  ASSERT_TRUE(early.has_value());
  ASSERT_TRUE(late.has_value());
  ASSERT_LT(*early, *late);
}

TEST(Generator, ReportsEntropyFailure) {
  FixedClock clock(1000);
  FailingRandomSource random;
  ValueGenerator generator(clock, random);

  auto value = generator.generate();
  ASSERT_FALSE(value.has_value());
  ASSERT_EQ(value.error().kind, ErrorKind::EntropyUnavailable);
}

TEST(Generator, SystemGeneratorProducesDistinctV7Values) {
  std::set<Uuid> values;
  for (int i = 0; i < 100; ++i) {
    auto value = tid::codec::generate_v7();
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(tid::codec::is_uuid_v7(*value));
    values.insert(*value);
  }
  ASSERT_EQ(values.size(), 100u);
}

TEST(Generator, SystemClockIsRecent) {
  // 2023-01-01T00:00:00Z
  ASSERT_GT(tid::codec::system_clock().now_ms(), 1672531200000ULL);
}
