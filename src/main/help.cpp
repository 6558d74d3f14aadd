#include "help.hpp"

#include <fmt/core.h>
#include <iostream>
#include <string_view>

static constexpr std::string_view kVersion = "1.0.0";

void PrintHelp() {
  std::cout << "use: numerals [-option] ... value ...\n"
               "\t-c use the checked decoder, report overflow per value\n"
               "\t-e encode every value (an integer)\n"
               "\t-h print this help and stop\n"
               "\t-l print Roman numerals in lowercase\n"
               "\t-r decode every value (numeral text)\n"
               "\t-t use balanced ternary (digits -, 0, +) instead of Roman\n"
               "\t-v verbose, log every conversion\n"
               "\t-V print version number and stop\n"
               "\t-- end of options\n"
               "without -e or -r, integers are encoded and anything else is "
               "decoded"
            << std::endl;
}

void PrintVersion() {
  std::cout << fmt::format("numerals version {}", kVersion) << std::endl;
}
