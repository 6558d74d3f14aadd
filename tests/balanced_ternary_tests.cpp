#include <gtest/gtest.h>

#include "../src/errors/errors.hpp"
#include "../src/ternary/balanced_ternary.hpp"

#include <limits>
#include <string>

using numerals::BalancedTernary;
using numerals::Trit;

TEST(TritTest, Characters) {
  EXPECT_EQ(numerals::TritToChar(Trit::kMinus), '-');
  EXPECT_EQ(numerals::TritToChar(Trit::kZero), '0');
  EXPECT_EQ(numerals::TritToChar(Trit::kPlus), '+');

  EXPECT_EQ(numerals::TritFromChar('+').value(), Trit::kPlus);
  EXPECT_FALSE(numerals::TritFromChar('1').has_value());
}

TEST(TritTest, Values) {
  EXPECT_EQ(numerals::TritValue(Trit::kMinus), -1);
  EXPECT_EQ(numerals::TritValue(Trit::kZero), 0);
  EXPECT_EQ(numerals::TritValue(Trit::kPlus), 1);
}

TEST(BalancedTernaryTest, RoundTrip) {
  for (std::int64_t i = -4321; i <= 4321; ++i) {
    ASSERT_EQ(BalancedTernary::FromInt(i).Value(), i);
  }
}

TEST(BalancedTernaryTest, KnownEncodings) {
  EXPECT_EQ(BalancedTernary::FromInt(0).ToString(), "0");
  EXPECT_EQ(BalancedTernary::FromInt(1).ToString(), "+");
  EXPECT_EQ(BalancedTernary::FromInt(2).ToString(), "+-");
  EXPECT_EQ(BalancedTernary::FromInt(8).ToString(), "+0-");
  EXPECT_EQ(BalancedTernary::FromInt(-1).ToString(), "-");
  EXPECT_EQ(BalancedTernary::FromInt(-2).ToString(), "-+");
  EXPECT_EQ(BalancedTernary::FromInt(523).ToString(), "+-0++0+");
}

TEST(BalancedTernaryTest, Extremes) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

  EXPECT_EQ(BalancedTernary::FromInt(kMax).Value(), kMax);
  EXPECT_EQ(BalancedTernary::FromInt(kMin).Value(), kMin);
}

TEST(BalancedTernaryTest, ExtremesDecodeChecked) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

  auto min_text = BalancedTernary::FromInt(kMin).ToString();
  ASSERT_EQ(min_text.back(), '+');
  auto min_value = BalancedTernary::Parse(min_text).ValueChecked();
  ASSERT_TRUE(min_value.has_value());
  EXPECT_EQ(min_value.value(), kMin);

  auto max_value = BalancedTernary::FromInt(kMax).ValueChecked();
  ASSERT_TRUE(max_value.has_value());
  EXPECT_EQ(max_value.value(), kMax);
}

TEST(BalancedTernaryTest, OverflowJustPastExtremes) {
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();

  // One more trit multiplies the magnitude by three.
  auto below = BalancedTernary::Parse(
      BalancedTernary::FromInt(kMin).ToString() + "-");
  auto above = BalancedTernary::Parse(
      BalancedTernary::FromInt(kMax).ToString() + "+");

  EXPECT_FALSE(below.ValueChecked().has_value());
  EXPECT_THROW(below.Value(), numerals::OverflowError);
  EXPECT_FALSE(above.ValueChecked().has_value());
}

TEST(BalancedTernaryTest, Parse) {
  auto ternary = BalancedTernary::Parse("+-0++0+");

  EXPECT_EQ(ternary.Value(), 523);
  EXPECT_EQ(ternary.ToString(), "+-0++0+");
  EXPECT_EQ(ternary, BalancedTernary::FromInt(523));
}

TEST(BalancedTernaryTest, ParseLeadingZeros) {
  EXPECT_EQ(BalancedTernary::Parse("00+").Value(), 1);
  EXPECT_NE(BalancedTernary::Parse("00+"), BalancedTernary::FromInt(1));
}

TEST(BalancedTernaryTest, ParseEmptyText) {
  auto ternary = BalancedTernary::Parse("");

  EXPECT_TRUE(ternary.Trits().empty());
  EXPECT_EQ(ternary.Value(), 0);
}

TEST(BalancedTernaryTest, ParseRejectsInvalidCharacter) {
  try {
    BalancedTernary::Parse("+-2");
    FAIL() << "expected InvalidNumeralText";
  } catch (const numerals::InvalidNumeralText &error) {
    EXPECT_EQ(error.Position(), 2u);
    EXPECT_EQ(error.Character(), '2');
  }
}

TEST(BalancedTernaryTest, Overflow) {
  // 3^40 is far beyond the 64-bit range.
  auto ternary = BalancedTernary::Parse("+" + std::string(40, '0'));

  EXPECT_FALSE(ternary.ValueChecked().has_value());
  EXPECT_THROW(ternary.Value(), numerals::OverflowError);
}
