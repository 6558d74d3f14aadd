#include "arguments_parser.hpp"

#include "../utils/verbose/verbose.hpp"
#include <cctype>
#include <cstring>
#include <iostream>
#include <stdexcept>

static bool IsOption(const char *arg) {
  return arg[0] == '-' && std::isalpha(static_cast<unsigned char>(arg[1]));
}

LaunchSettings ArgumentsParser::Parse(int argc, char **argv) {
  LaunchSettings result;
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  while (argc > 1 && argv[1][0] == '-') {
    if (std::strcmp(argv[1], "--") == 0) {
      argc--;
      argv++;
      break;
    }
    if (!IsOption(argv[1])) {
      break;
    }
    switch (argv[1][1]) {
    case 'c': {
      result.need_checked_decode = true;
      break;
    }
    case 'e': {
      try {
        result.SetMode(ConversionMode::kEncode);
      } catch (const std::runtime_error &error) {
        std::cout << error.what() << std::endl;
        result.need_to_print_help_and_stop = true;
      }
      break;
    }
    case 'h': {
      result.need_to_print_help_and_stop = true;
      break;
    }
    case 'l': {
      result.need_lowercase_output = true;
      break;
    }
    case 'r': {
      try {
        result.SetMode(ConversionMode::kDecode);
      } catch (const std::runtime_error &error) {
        std::cout << error.what() << std::endl;
        result.need_to_print_help_and_stop = true;
      }
      break;
    }
    case 't': {
      result.need_balanced_ternary = true;
      break;
    }
    case 'v': {
      verbose_flags.SetNeedToPrintVerbose();
      break;
    }
    case 'V': {
      result.need_to_print_version_and_stop = true;
      break;
    }
    default: {
      result.need_to_print_help_and_stop = true;
      break;
    }
    }
    argc--;
    argv++;
  }
  for (int i = 1; i < argc; i++) {
    result.values.emplace_back(argv[i]);
  }
  return result;
}
