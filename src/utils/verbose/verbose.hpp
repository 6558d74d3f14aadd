#pragma once

namespace utils::verbose {
/**
 * @class Flags
 * @brief Controls verbosity flags for printing conversion details.
 *
 * Use the setter to enable verbose output and NeedToPrintVerbose() to check
 * it before logging.
 */
class Flags {
private:
  /**
   * @brief Default constructor.
   */
  Flags() = default;

public:
  Flags(const Flags &other) = delete;
  Flags &operator=(const Flags &other) = delete;

  /**
   * @brief Check if the flag to print verbose information is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVerbose() const;

  /**
   * @brief Set the flag to print verbose information.
   */
  void SetNeedToPrintVerbose();

  /**
   * @brief Clean all verbosity flags.
   */
  void Clean();

  static Flags &getInstance() {
    static Flags instance;
    return instance;
  }

private:
  bool need_to_print_verbose_ = false;
};

} // namespace utils::verbose
