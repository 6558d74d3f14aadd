#pragma once

#include "../symbol/numeral.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace numerals {

/**
 * @class Roman
 * @brief An ordered sequence of Roman symbols.
 *
 * The sequence is not required to be canonical: any ordering of symbols can
 * be decoded. Values live in the 16-bit signed domain.
 */
class Roman {
public:
  /**
   * @brief Builds a sequence from text, one symbol per character.
   * @param text Upper- or lowercase numeral text. May be empty.
   * @return The parsed sequence, in input order.
   * @throws InvalidNumeralText at the first character that is not a numeral.
   */
  static Roman Parse(std::string_view text);

  /**
   * @brief Builds the canonical subtractive sequence for a value.
   * @param number The value to encode, must be positive.
   * @return The canonical sequence. Values above a few thousand become long
   * runs of M.
   * @throws NonPositiveInput if number <= 0.
   */
  static Roman FromInt(std::int16_t number);

  /**
   * @brief Decodes the sequence.
   * @return The value of the sequence. An empty sequence is worth 0.
   * @throws OverflowError if the running total leaves the 16-bit range. The
   * message quotes the uppercase rendering of the sequence.
   */
  std::int16_t Value() const;

  /**
   * @brief Decodes the sequence with overflow checks.
   * @return The value, or std::nullopt if the running total leaves the
   * 16-bit range.
   */
  std::optional<std::int16_t> ValueChecked() const;

  /**
   * @brief Renders the sequence with uppercase letters.
   */
  std::string ToUpper() const;

  /**
   * @brief Renders the sequence with lowercase letters.
   */
  std::string ToLower() const;

  const std::vector<Numeral> &Numerals() const;

  bool operator==(const Roman &other) const;
  bool operator!=(const Roman &other) const;

private:
  explicit Roman(std::vector<Numeral> numerals);

  std::string Render(LetterCase letter_case) const;

  std::vector<Numeral> numerals_; /**< Symbols in writing order. */
};

} // namespace numerals
