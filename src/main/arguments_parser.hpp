#pragma once
#include "launch_settings.hpp"

/**
 * @class ArgumentsParser
 * @brief Class responsible for parsing command-line arguments and generating launch settings.
 */
class ArgumentsParser {
public:
  /**
   * @brief Parses the command-line arguments and generates launch settings.
   *
   * Options come first. An argument is an option when it starts with '-'
   * followed by a letter, so "-5" and "-+0" are values. "--" ends the
   * options.
   * @param argc The number of command-line arguments.
   * @param argv The array of command-line arguments.
   * @return The generated launch settings based on the parsed command-line arguments.
   */
  LaunchSettings Parse(int argc, char **argv);
};
