#include "fatal.hpp"

#include <cstdlib>
#include <fmt/core.h>
#include <iostream>

namespace loger {

static int nr_errs = 0;

void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2) {
  std::cout << fmt::format("numerals: Error: {}{}", s1, s2.value_or(""));
  std::cout << std::endl;
  nr_errs++;
}

void fatal(const std::string_view &s1, const std::optional<std::string> &s2) {
  non_fatal(s1, s2);
  std::exit(1);
}

int ErrorCount() { return nr_errs; }

void ResetErrorCount() { nr_errs = 0; }

} // namespace loger
