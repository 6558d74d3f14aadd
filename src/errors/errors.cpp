#include "errors.hpp"

#include <cctype>
#include <fmt/core.h>
#include <string>

namespace numerals {

// Bytes outside printable ASCII, such as one half of a UTF-8 sequence, are
// written as \xNN.
static std::string DescribeCharacter(char character) {
  const auto byte = static_cast<unsigned char>(character);
  if (byte < 0x80 && std::isprint(byte)) {
    return std::string(1, character);
  }
  return fmt::format("\\x{:02x}", static_cast<unsigned>(byte));
}

InvalidNumeralText::InvalidNumeralText(std::size_t position, char character)
    : NumeralError(fmt::format("invalid numeral character '{}' at position {}",
                               DescribeCharacter(character), position)),
      position_(position), character_(character) {}

std::size_t InvalidNumeralText::Position() const { return position_; }

char InvalidNumeralText::Character() const { return character_; }

NonPositiveInput::NonPositiveInput(std::int64_t input)
    : NumeralError(fmt::format(
          "cannot encode non-positive value {} as a Roman numeral", input)),
      input_(input) {}

std::int64_t NonPositiveInput::Input() const { return input_; }

} // namespace numerals
