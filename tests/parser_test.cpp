#include "codec/parser.hpp"
#include "codec/base32.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>

using tid::codec::ErrorKind;
using tid::codec::ParseState;

TEST(Parser, AssembleAndSplit) {
  ASSERT_EQ(tid::codec::assemble("", "01h5fskfsk4fpeqwnsyz5hj55t"), "01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_EQ(tid::codec::assemble("user", "01h5fskfsk4fpeqwnsyz5hj55t"),
            "user_01h5fskfsk4fpeqwnsyz5hj55t");

  auto [prefix, suffix] = tid::codec::split("pre_fix_00000000000000000000000000");
  ASSERT_EQ(prefix, "pre_fix");
  ASSERT_EQ(suffix, "00000000000000000000000000");

  auto [empty, whole] = tid::codec::split("01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_TRUE(empty.empty());
  ASSERT_EQ(whole, "01h5fskfsk4fpeqwnsyz5hj55t");
}

TEST(Parser, ParsesPrefixedTypeId) {
  auto parsed = tid::codec::parse("user_01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_TRUE(parsed.has_value());
  ASSERT_EQ(parsed->prefix, "user");
  ASSERT_EQ(parsed->suffix, "01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_EQ(parsed->value, uuid_from_hex("01895f99bf3323ecebf2b9f7cb1914ba"));
  ASSERT_EQ(parsed->text, "user_01h5fskfsk4fpeqwnsyz5hj55t");
}

TEST(Parser, ParsesBareSuffix) {
  auto parsed = tid::codec::parse("01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_TRUE(parsed.has_value());
  ASSERT_TRUE(parsed->prefix.empty());
  ASSERT_EQ(parsed->suffix, "01h5fskfsk4fpeqwnsyz5hj55t");
}

TEST(Parser, ParsesPrefixWithUnderscores) {
  auto parsed = tid::codec::parse("user_name_01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_TRUE(parsed.has_value());
  ASSERT_EQ(parsed->prefix, "user_name");
}

TEST(Parser, RoundTripsAssembledIdentifiers) {
  tid::codec::SeededRandomSource random(11);
  for (const char* prefix : {"", "a", "user", "pre_fix", "a__b"}) {
    tid::codec::Uuid value;
    ASSERT_TRUE(random.fill(value.bytes));
    const auto suffix = tid::codec::base32::encode(value);
    auto parsed = tid::codec::parse(tid::codec::assemble(prefix, suffix));
    ASSERT_TRUE(parsed.has_value()) << prefix;
    ASSERT_EQ(parsed->prefix, prefix);
    ASSERT_EQ(parsed->suffix, suffix);
    ASSERT_EQ(parsed->value, value);
  }
}

TEST(Parser, LengthBounds) {
  auto too_short = tid::codec::explain("01h5fskfsk4fpeqwnsyz5hj55");
  ASSERT_TRUE(too_short.has_value());
  ASSERT_EQ(too_short->kind, ErrorKind::InvalidLength);
  ASSERT_EQ(too_short->state, ParseState::TypeOk);

  auto too_long = tid::codec::explain(std::string(65, 'a') + "_01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_TRUE(too_long.has_value());
  ASSERT_EQ(too_long->kind, ErrorKind::InvalidLength);

  ASSERT_TRUE(tid::codec::is_valid_typeid(std::string(63, 'a') + "_00000000000000000000000000"));
  ASSERT_EQ(tid::codec::explain("")->kind, ErrorKind::InvalidLength);
}

TEST(Parser, RejectsUppercase) {
  auto error = tid::codec::explain("User_01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_TRUE(error.has_value());
  ASSERT_EQ(error->kind, ErrorKind::InvalidCase);
  ASSERT_EQ(error->state, ParseState::LengthOk);
}

TEST(Parser, RejectsLeadingUnderscore) {
  auto error = tid::codec::explain("_prefix_01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_TRUE(error.has_value());
  ASSERT_EQ(error->kind, ErrorKind::LeadingUnderscore);
  ASSERT_EQ(error->state, ParseState::CaseOk);
}

TEST(Parser, RejectsBadPrefix) {
  auto error = tid::codec::explain("user__01h5fskfsk4fpeqwnsyz5hj55t");
  ASSERT_TRUE(error.has_value());
  ASSERT_EQ(error->kind, ErrorKind::InvalidPrefixFormat);
  ASSERT_EQ(error->value, "user_");
  ASSERT_EQ(error->state, ParseState::Split);

  auto too_long = tid::codec::explain(std::string(64, 'a') + "_0000000000000000000000000");
  ASSERT_TRUE(too_long.has_value());
  ASSERT_EQ(too_long->kind, ErrorKind::PrefixTooLong);
}

TEST(Parser, RejectsBadSuffix) {
  auto overflow = tid::codec::explain("user_8zzzzzzzzzzzzzzzzzzzzzzzzz");
  ASSERT_TRUE(overflow.has_value());
  ASSERT_EQ(overflow->kind, ErrorKind::SuffixOverflow);
  ASSERT_EQ(overflow->state, ParseState::PrefixOk);

  auto alphabet = tid::codec::explain("user_01h5fskfsk4fpeqwnsyz5hj55u");
  ASSERT_TRUE(alphabet.has_value());
  ASSERT_EQ(alphabet->kind, ErrorKind::InvalidSuffixAlphabet);
  ASSERT_EQ(alphabet->position, 25u);

  auto length = tid::codec::explain("prefix_123456789012345678901234567");
  ASSERT_TRUE(length.has_value());
  ASSERT_EQ(length->kind, ErrorKind::InvalidSuffixLength);
}

TEST(Parser, ExplainIsEmptyForValidInput) {
  ASSERT_FALSE(tid::codec::explain("user_01h5fskfsk4fpeqwnsyz5hj55t").has_value());
  ASSERT_FALSE(tid::codec::explain("00000000000000000000000000").has_value());
}
