#pragma once

#include <limits>
#include <optional>
#include <type_traits>

/**
 * @brief Overflow-detecting arithmetic for fixed-width signed integers.
 *
 * Every helper returns std::nullopt instead of a wrapped result when the
 * exact value does not fit in T.
 */
namespace utils::checked {

/**
 * @brief Adds two values.
 * @return a + b, or std::nullopt if the sum does not fit in T.
 */
template <typename T> std::optional<T> Add(T a, T b) {
  static_assert(std::is_signed_v<T>, "checked math needs a signed type");
  if (b > 0 && a > std::numeric_limits<T>::max() - b) {
    return std::nullopt;
  }
  if (b < 0 && a < std::numeric_limits<T>::min() - b) {
    return std::nullopt;
  }
  return static_cast<T>(a + b);
}

/**
 * @brief Subtracts b from a.
 * @return a - b, or std::nullopt if the difference does not fit in T.
 */
template <typename T> std::optional<T> Sub(T a, T b) {
  static_assert(std::is_signed_v<T>, "checked math needs a signed type");
  if (b < 0 && a > std::numeric_limits<T>::max() + b) {
    return std::nullopt;
  }
  if (b > 0 && a < std::numeric_limits<T>::min() + b) {
    return std::nullopt;
  }
  return static_cast<T>(a - b);
}

} // namespace utils::checked
