#pragma once

#include <cstdint>
#include <optional>

namespace numerals {

/**
 * @brief The seven atomic Roman symbols.
 *
 * Enumerator order carries no meaning; use NumeralWeight() to compare.
 */
enum class Numeral : std::uint8_t { kI, kV, kX, kL, kC, kD, kM };

/**
 * @brief Letter case used when rendering a symbol.
 */
enum class LetterCase : std::uint8_t { kUpper, kLower };

/**
 * @brief Returns the fixed weight of a symbol.
 * @param numeral The symbol.
 * @return One of 1, 5, 10, 50, 100, 500, 1000.
 */
std::int16_t NumeralWeight(Numeral numeral);

/**
 * @brief Maps a character to its symbol, ignoring case.
 * @param value The character to map.
 * @return The symbol, or std::nullopt if the character is not a numeral.
 */
std::optional<Numeral> NumeralFromChar(char value);

/**
 * @brief Renders a symbol as a single ASCII letter.
 * @param numeral The symbol.
 * @param letter_case Whether the letter is upper- or lowercase.
 */
char NumeralToChar(Numeral numeral, LetterCase letter_case);

} // namespace numerals
