#include <gtest/gtest.h>

#include "../src/main/arguments_parser.hpp"
#include "../src/utils/verbose/verbose.hpp"

class ArgumentsParserTest : public ::testing::Test {
protected:
  void TearDown() override { utils::verbose::Flags::getInstance().Clean(); }
};

TEST_F(ArgumentsParserTest, NoArguments) {
  int argc1 = 1;
  char *argv1[] = {
      (char *)"program",
  };
  ArgumentsParser parser1;
  LaunchSettings result1 = parser1.Parse(argc1, argv1);
  EXPECT_EQ(result1.mode, ConversionMode::kAuto);
  EXPECT_FALSE(result1.need_to_print_help_and_stop);
  EXPECT_TRUE(result1.values.empty());
}

TEST_F(ArgumentsParserTest, SingleArgument) {
  int argc2 = 3;
  char *argv2[] = {(char *)"program", (char *)"-e", (char *)"1994"};
  ArgumentsParser parser2;
  LaunchSettings result2 = parser2.Parse(argc2, argv2);
  EXPECT_EQ(result2.mode, ConversionMode::kEncode);
  ASSERT_EQ(result2.values.size(), 1u);
  EXPECT_EQ(result2.values[0], "1994");
}

TEST_F(ArgumentsParserTest, MultipleArguments) {
  int argc3 = 7;
  char *argv3[] = {(char *)"program", (char *)"-r", (char *)"-l",
                   (char *)"-c",      (char *)"-v", (char *)"XIV",
                   (char *)"mmx"};
  ArgumentsParser parser3;
  LaunchSettings result3 = parser3.Parse(argc3, argv3);
  EXPECT_EQ(result3.mode, ConversionMode::kDecode);
  EXPECT_TRUE(result3.need_lowercase_output);
  EXPECT_TRUE(result3.need_checked_decode);
  EXPECT_FALSE(result3.need_balanced_ternary);
  EXPECT_TRUE(utils::verbose::Flags::getInstance().NeedToPrintVerbose());
  ASSERT_EQ(result3.values.size(), 2u);
  EXPECT_EQ(result3.values[1], "mmx");
}

TEST_F(ArgumentsParserTest, NegativeNumbersAndTritsAreValues) {
  int argc = 5;
  char *argv[] = {(char *)"program", (char *)"-t", (char *)"-5",
                  (char *)"-+0", (char *)"-x"};
  ArgumentsParser parser;
  LaunchSettings result = parser.Parse(argc, argv);
  EXPECT_TRUE(result.need_balanced_ternary);
  EXPECT_FALSE(result.need_to_print_help_and_stop);
  ASSERT_EQ(result.values.size(), 3u);
  EXPECT_EQ(result.values[0], "-5");
  EXPECT_EQ(result.values[1], "-+0");
  EXPECT_EQ(result.values[2], "-x");
}

TEST_F(ArgumentsParserTest, DoubleDashEndsOptions) {
  int argc = 4;
  char *argv[] = {(char *)"program", (char *)"--", (char *)"-V",
                  (char *)"-h"};
  ArgumentsParser parser;
  LaunchSettings result = parser.Parse(argc, argv);
  EXPECT_FALSE(result.need_to_print_version_and_stop);
  EXPECT_FALSE(result.need_to_print_help_and_stop);
  ASSERT_EQ(result.values.size(), 2u);
  EXPECT_EQ(result.values[0], "-V");
}

TEST_F(ArgumentsParserTest, ConflictingModesPrintHelp) {
  int argc = 3;
  char *argv[] = {(char *)"program", (char *)"-e", (char *)"-r"};
  ArgumentsParser parser;
  testing::internal::CaptureStdout();
  LaunchSettings result = parser.Parse(argc, argv);
  std::string output = testing::internal::GetCapturedStdout();
  EXPECT_TRUE(result.need_to_print_help_and_stop);
  EXPECT_EQ(output, "numerals: cannot combine -e with -r\n");
}

TEST_F(ArgumentsParserTest, UnknownOptionPrintsHelp) {
  int argc = 2;
  char *argv[] = {(char *)"program", (char *)"-q"};
  ArgumentsParser parser;
  LaunchSettings result = parser.Parse(argc, argv);
  EXPECT_TRUE(result.need_to_print_help_and_stop);
}

TEST(LaunchSettingsTest, SetMode) {
  LaunchSettings settings;
  settings.SetMode(ConversionMode::kDecode);
  settings.SetMode(ConversionMode::kDecode);
  EXPECT_EQ(settings.mode, ConversionMode::kDecode);
  EXPECT_THROW(settings.SetMode(ConversionMode::kEncode), std::runtime_error);
}
