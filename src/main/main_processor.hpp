#pragma once

#include "launch_settings.hpp"

#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Class representing the main processor of the program.
 */
class MainProcessor {
public:
  /**
   * @brief The main entry point of the program.
   * @param argc The number of command-line arguments.
   * @param argv An array of command-line argument strings.
   * @return 0 if every value was converted, 1 otherwise.
   */
  int main(int argc, char *argv[]);

  /**
   * @brief Parses a decimal integer with an optional sign.
   * @param value The text to parse.
   * @return The integer, or std::nullopt if the text is not a 64-bit integer.
   */
  static std::optional<std::int64_t> ParseInteger(const std::string &value);

private:
  /**
   * @brief Handles help and version requests.
   * @return True if the program should stop.
   */
  bool HandleLaunchSettings();

  /**
   * @brief Converts one command-line value and prints the result.
   * @return True on success. Failures are logged as non-fatal errors.
   */
  bool ConvertValue(const std::string &value);

  bool ConvertRoman(const std::string &value, bool encode);
  bool ConvertTernary(const std::string &value, bool encode);

  /**
   * @brief Decides the direction of a conversion for one value.
   */
  bool NeedToEncode(const std::string &value) const;

  LaunchSettings launch_settings_;
};
