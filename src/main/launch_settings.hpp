#pragma once

#include <string>
#include <vector>

/**
 * @brief Direction of a conversion requested on the command line.
 */
enum class ConversionMode {
  kAuto,   /**< Integers are encoded, anything else is decoded. */
  kDecode, /**< -r: every value is numeral text. */
  kEncode  /**< -e: every value is an integer. */
};

struct LaunchSettings {
  ConversionMode mode = ConversionMode::kAuto;
  bool need_lowercase_output = false;  // -l
  bool need_checked_decode = false;    // -c
  bool need_balanced_ternary = false;  // -t
  bool need_to_print_version_and_stop = false;
  bool need_to_print_help_and_stop = false;

  std::vector<std::string> values;

  /**
   * @brief Selects the conversion direction.
   * @param value The requested mode.
   * @throws std::runtime_error if a different explicit mode is already set.
   */
  void SetMode(ConversionMode value);
};
