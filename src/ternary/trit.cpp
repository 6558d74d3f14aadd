#include "trit.hpp"

namespace numerals {

int TritValue(Trit trit) {
  switch (trit) {
  case Trit::kMinus:
    return -1;
  case Trit::kZero:
    return 0;
  case Trit::kPlus:
    return 1;
  }
  return 0;
}

char TritToChar(Trit trit) {
  switch (trit) {
  case Trit::kMinus:
    return '-';
  case Trit::kZero:
    return '0';
  case Trit::kPlus:
    return '+';
  }
  return '0';
}

std::optional<Trit> TritFromChar(char value) {
  switch (value) {
  case '-':
    return Trit::kMinus;
  case '0':
    return Trit::kZero;
  case '+':
    return Trit::kPlus;
  default:
    return std::nullopt;
  }
}

} // namespace numerals
