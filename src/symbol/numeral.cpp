#include "numeral.hpp"

#include <cctype>
#include <unordered_map>

namespace numerals {

const std::unordered_map<char, Numeral> kNumerals{
    {'I', Numeral::kI}, {'i', Numeral::kI}, {'V', Numeral::kV},
    {'v', Numeral::kV}, {'X', Numeral::kX}, {'x', Numeral::kX},
    {'L', Numeral::kL}, {'l', Numeral::kL}, {'C', Numeral::kC},
    {'c', Numeral::kC}, {'D', Numeral::kD}, {'d', Numeral::kD},
    {'M', Numeral::kM}, {'m', Numeral::kM},
};

std::int16_t NumeralWeight(Numeral numeral) {
  switch (numeral) {
  case Numeral::kI:
    return 1;
  case Numeral::kV:
    return 5;
  case Numeral::kX:
    return 10;
  case Numeral::kL:
    return 50;
  case Numeral::kC:
    return 100;
  case Numeral::kD:
    return 500;
  case Numeral::kM:
    return 1000;
  }
  return 0;
}

std::optional<Numeral> NumeralFromChar(char value) {
  auto it = kNumerals.find(value);
  if (it == kNumerals.end()) {
    return std::nullopt;
  }
  return it->second;
}

char NumeralToChar(Numeral numeral, LetterCase letter_case) {
  char upper = 'I';
  switch (numeral) {
  case Numeral::kI:
    upper = 'I';
    break;
  case Numeral::kV:
    upper = 'V';
    break;
  case Numeral::kX:
    upper = 'X';
    break;
  case Numeral::kL:
    upper = 'L';
    break;
  case Numeral::kC:
    upper = 'C';
    break;
  case Numeral::kD:
    upper = 'D';
    break;
  case Numeral::kM:
    upper = 'M';
    break;
  }
  if (letter_case == LetterCase::kLower) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(upper)));
  }
  return upper;
}

} // namespace numerals
