#include "codec/prefix.hpp"

#include <gtest/gtest.h>

#include <string>

using tid::codec::ErrorKind;

TEST(Prefix, AcceptsGrammar) {
  for (const char* prefix : {"", "a", "user", "pre_fix", "a_b", "a__b", "snake_case_name",
                             "abcdefghijklmnopqrstuvwxyz"}) {
    ASSERT_TRUE(tid::codec::validate_prefix(prefix).has_value()) << prefix;
  }
}

TEST(Prefix, AcceptsSixtyThreeCharacters) {
  ASSERT_TRUE(tid::codec::is_valid_prefix(std::string(63, 'a')));
}

TEST(Prefix, RejectsSixtyFourCharacters) {
  auto result = tid::codec::validate_prefix(std::string(64, 'a'));
  ASSERT_FALSE(result.has_value());
  ASSERT_EQ(result.error().kind, ErrorKind::PrefixTooLong);
  ASSERT_EQ(result.error().value, std::string(64, 'a'));
}

TEST(Prefix, LengthIsCheckedBeforeGrammar) {
  auto result = tid::codec::validate_prefix(std::string(64, 'A'));
  ASSERT_FALSE(result.has_value());
  ASSERT_EQ(result.error().kind, ErrorKind::PrefixTooLong);
}

TEST(Prefix, RejectsBadFormat) {
  for (const char* prefix : {"_", "_user", "user_", "User", "us3r", "1user", "pre.fix",
                             "pre fix", "pre-fix", "caf\xc3\xa9"}) {
    auto result = tid::codec::validate_prefix(prefix);
    ASSERT_FALSE(result.has_value()) << prefix;
    ASSERT_EQ(result.error().kind, ErrorKind::InvalidPrefixFormat) << prefix;
    ASSERT_EQ(result.error().value, prefix);
    ASSERT_EQ(result.error().pattern, tid::codec::kPrefixPattern);
  }
}

TEST(Prefix, ReportsFirstOffendingInteriorCharacter) {
  auto result = tid::codec::validate_prefix("ab9c");
  ASSERT_FALSE(result.has_value());
  ASSERT_EQ(result.error().position, 2u);
}
