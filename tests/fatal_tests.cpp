#include <gtest/gtest.h>

#include "../src/fatal/fatal.hpp"

TEST(LogerTest, NonFatalCountsErrors) {
  loger::ResetErrorCount();
  testing::internal::CaptureStdout();
  loger::non_fatal("bad value", std::string(" 'Q'"));
  loger::non_fatal("second");
  std::string output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(output,
            "numerals: Error: bad value 'Q'\nnumerals: Error: second\n");
  EXPECT_EQ(loger::ErrorCount(), 2);
  loger::ResetErrorCount();
  EXPECT_EQ(loger::ErrorCount(), 0);
}

TEST(LogerTest, FatalExits) {
  EXPECT_EXIT(loger::fatal("giving up"), ::testing::ExitedWithCode(1), "");
}
