#pragma once

#include <cstdint>
#include <optional>

namespace numerals {

/**
 * @brief A balanced-ternary digit.
 */
enum class Trit : std::int8_t { kMinus = -1, kZero = 0, kPlus = 1 };

/**
 * @brief Returns -1, 0 or +1.
 */
int TritValue(Trit trit);

/**
 * @brief Renders a trit as '-', '0' or '+'.
 */
char TritToChar(Trit trit);

/**
 * @brief Maps '-', '0' or '+' to a trit.
 * @param value The character to map.
 * @return The trit, or std::nullopt for any other character.
 */
std::optional<Trit> TritFromChar(char value);

} // namespace numerals
