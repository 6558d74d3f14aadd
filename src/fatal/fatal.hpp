#ifndef FATAL_NUMERALS_H
#define FATAL_NUMERALS_H

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Namespace containing logging functions for error handling.
 *
 * The `loger` namespace reports fatal and non-fatal errors on stdout and
 * keeps count of the non-fatal ones.
 */
namespace loger {

/**
 * @brief Logs a fatal error with an optional additional message and exits
 * with status 1.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
[[noreturn]] void fatal(const std::string_view &s1,
                        const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a non-fatal error with an optional additional message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Returns the number of non-fatal errors logged so far.
 */
int ErrorCount();

/**
 * @brief Resets the non-fatal error counter.
 */
void ResetErrorCount();

} // namespace loger

#endif
