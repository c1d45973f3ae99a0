#include <gtest/gtest.h>

#include "vscore/common/name.hpp"

namespace vscore {
namespace {

class NameTest : public ::testing::Test {};

TEST_F(NameTest, BasicIdentifiersFoldToLowerCase) {
  EXPECT_EQ(CanonicalName("Std_Logic"), "std_logic");
  EXPECT_EQ(CanonicalName("WORK"), "work");
}

TEST_F(NameTest, ExtendedIdentifiersKeepSpelling) {
  EXPECT_EQ(CanonicalName("\\Foo Bar\\"), "\\Foo Bar\\");
}

TEST_F(NameTest, CharacterLiteralsKeepSpelling) {
  EXPECT_TRUE(IsCharacterLiteral("'A'"));
  EXPECT_EQ(CanonicalName("'A'"), "'A'");
  EXPECT_NE(CanonicalName("'A'"), CanonicalName("'a'"));
}

TEST_F(NameTest, NotCharacterLiterals) {
  EXPECT_FALSE(IsCharacterLiteral("a"));
  EXPECT_FALSE(IsCharacterLiteral("'ab'"));
  EXPECT_FALSE(IsCharacterLiteral("''"));
}

}  // namespace
}  // namespace vscore
