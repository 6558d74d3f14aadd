#pragma once

#include "trit.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace numerals {

/**
 * @class BalancedTernary
 * @brief A base-3 number written with the digits {-1, 0, +1}.
 *
 * Trits are stored most significant first, the way they are written.
 */
class BalancedTernary {
public:
  /**
   * @brief Builds a number from text made of '-', '0' and '+'.
   * @param text The digits, most significant first. May be empty.
   * @throws InvalidNumeralText at the first character that is not a trit.
   */
  static BalancedTernary Parse(std::string_view text);

  /**
   * @brief Builds the canonical representation of any 64-bit value.
   *
   * Zero is written as a single '0' trit.
   */
  static BalancedTernary FromInt(std::int64_t number);

  /**
   * @brief Decodes the number.
   * @throws OverflowError if the value does not fit in 64 bits.
   */
  std::int64_t Value() const;

  /**
   * @brief Decodes the number with overflow checks.
   * @return The value, or std::nullopt if it does not fit in 64 bits.
   */
  std::optional<std::int64_t> ValueChecked() const;

  std::string ToString() const;

  const std::vector<Trit> &Trits() const;

  bool operator==(const BalancedTernary &other) const;
  bool operator!=(const BalancedTernary &other) const;

private:
  explicit BalancedTernary(std::vector<Trit> trits);

  std::vector<Trit> trits_;
};

} // namespace numerals
