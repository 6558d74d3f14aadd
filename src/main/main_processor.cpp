#include "main_processor.hpp"

#include "../fatal/fatal.hpp"
#include "../numerals.hpp"
#include "../utils/verbose/verbose.hpp"
#include "arguments_parser.hpp"
#include "help.hpp"
#include <algorithm>
#include <charconv>
#include <fmt/core.h>
#include <iostream>
#include <limits>
#include <stdexcept>

int MainProcessor::main(int argc, char *argv[]) {
  ArgumentsParser parser;
  launch_settings_ = parser.Parse(argc, argv);
  if (HandleLaunchSettings()) {
    return 0;
  }
  if (launch_settings_.values.empty()) {
    loger::fatal("no values to convert", std::string(" (try -h)"));
  }

  bool all_ok = true;
  for (const auto &value : launch_settings_.values) {
    all_ok = ConvertValue(value) && all_ok;
  }
  return all_ok ? 0 : 1;
}

bool MainProcessor::HandleLaunchSettings() {
  if (launch_settings_.need_to_print_help_and_stop) {
    PrintHelp();
    return true;
  }
  if (launch_settings_.need_to_print_version_and_stop) {
    PrintVersion();
    return true;
  }
  return false;
}

std::optional<std::int64_t>
MainProcessor::ParseInteger(const std::string &value) {
  const char *first = value.data();
  const char *last = value.data() + value.size();
  if (first != last && *first == '+') {
    first++;
    if (first != last && *first == '-') {
      return std::nullopt;
    }
  }
  if (first == last) {
    return std::nullopt;
  }
  std::int64_t result = 0;
  auto [ptr, ec] = std::from_chars(first, last, result);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return result;
}

bool MainProcessor::NeedToEncode(const std::string &value) const {
  switch (launch_settings_.mode) {
  case ConversionMode::kEncode:
    return true;
  case ConversionMode::kDecode:
    return false;
  case ConversionMode::kAuto:
    break;
  }
  if (launch_settings_.need_balanced_ternary) {
    // "0", "-" and "+" are valid trits, so only digits above zero mark an
    // integer.
    return ParseInteger(value).has_value() &&
           std::any_of(value.begin(), value.end(),
                       [](char c) { return c >= '1' && c <= '9'; });
  }
  return ParseInteger(value).has_value();
}

bool MainProcessor::ConvertValue(const std::string &value) {
  const bool encode = NeedToEncode(value);
  try {
    if (launch_settings_.need_balanced_ternary) {
      return ConvertTernary(value, encode);
    }
    return ConvertRoman(value, encode);
  } catch (const std::runtime_error &error) {
    loger::non_fatal(error.what());
    return false;
  }
}

bool MainProcessor::ConvertRoman(const std::string &value, bool encode) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (encode) {
    auto number = ParseInteger(value);
    if (!number.has_value()) {
      throw std::runtime_error(fmt::format("'{}' is not an integer", value));
    }
    if (number.value() < std::numeric_limits<std::int16_t>::min() ||
        number.value() > std::numeric_limits<std::int16_t>::max()) {
      throw std::runtime_error(fmt::format(
          "{} is outside the 16-bit range of Roman numerals", number.value()));
    }
    if (verbose_flags.NeedToPrintVerbose()) {
      std::cout << fmt::format("numerals: encoding {} as a Roman numeral",
                               number.value())
                << std::endl;
    }
    auto roman = numerals::Roman::FromInt(
        static_cast<std::int16_t>(number.value()));
    std::cout << (launch_settings_.need_lowercase_output ? roman.ToLower()
                                                         : roman.ToUpper())
              << std::endl;
    return true;
  }

  if (verbose_flags.NeedToPrintVerbose()) {
    std::cout << fmt::format("numerals: decoding Roman numeral '{}'", value)
              << std::endl;
  }
  auto roman = numerals::Roman::Parse(value);
  if (launch_settings_.need_checked_decode) {
    auto number = roman.ValueChecked();
    if (!number.has_value()) {
      loger::non_fatal(fmt::format("'{}' overflows a 16-bit integer", value));
      return false;
    }
    std::cout << number.value() << std::endl;
    return true;
  }
  try {
    std::cout << roman.Value() << std::endl;
  } catch (const numerals::OverflowError &) {
    loger::non_fatal(fmt::format("'{}' overflows a 16-bit integer", value));
    return false;
  }
  return true;
}

bool MainProcessor::ConvertTernary(const std::string &value, bool encode) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (encode) {
    auto number = ParseInteger(value);
    if (!number.has_value()) {
      throw std::runtime_error(
          fmt::format("'{}' is not a 64-bit integer", value));
    }
    if (verbose_flags.NeedToPrintVerbose()) {
      std::cout << fmt::format("numerals: encoding {} in balanced ternary",
                               number.value())
                << std::endl;
    }
    std::cout << numerals::BalancedTernary::FromInt(number.value()).ToString()
              << std::endl;
    return true;
  }

  if (verbose_flags.NeedToPrintVerbose()) {
    std::cout << fmt::format("numerals: decoding balanced ternary '{}'", value)
              << std::endl;
  }
  auto ternary = numerals::BalancedTernary::Parse(value);
  if (launch_settings_.need_checked_decode) {
    auto number = ternary.ValueChecked();
    if (!number.has_value()) {
      loger::non_fatal(fmt::format("'{}' overflows a 64-bit integer", value));
      return false;
    }
    std::cout << number.value() << std::endl;
    return true;
  }
  try {
    std::cout << ternary.Value() << std::endl;
  } catch (const numerals::OverflowError &) {
    loger::non_fatal(fmt::format("'{}' overflows a 64-bit integer", value));
    return false;
  }
  return true;
}
