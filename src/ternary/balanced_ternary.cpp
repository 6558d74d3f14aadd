#include "balanced_ternary.hpp"

#include "../errors/errors.hpp"
#include "../utils/checked/checked.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <utility>

namespace numerals {

BalancedTernary::BalancedTernary(std::vector<Trit> trits)
    : trits_(std::move(trits)) {}

BalancedTernary BalancedTernary::Parse(std::string_view text) {
  std::vector<Trit> trits;
  trits.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    auto trit = TritFromChar(text[i]);
    if (!trit.has_value()) {
      throw InvalidNumeralText(i, text[i]);
    }
    trits.push_back(trit.value());
  }
  return BalancedTernary(std::move(trits));
}

BalancedTernary BalancedTernary::FromInt(std::int64_t number) {
  if (number == 0) {
    return BalancedTernary({Trit::kZero});
  }
  // Division truncates toward zero, so remainders are in [-2, 2]. A remainder
  // of +-2 becomes -+1 with the carry applied to the quotient.
  std::vector<Trit> trits;
  while (number != 0) {
    const std::int64_t remainder = number % 3;
    number /= 3;
    switch (remainder) {
    case 0:
      trits.push_back(Trit::kZero);
      break;
    case 1:
      trits.push_back(Trit::kPlus);
      break;
    case -1:
      trits.push_back(Trit::kMinus);
      break;
    case 2:
      trits.push_back(Trit::kMinus);
      number += 1;
      break;
    case -2:
      trits.push_back(Trit::kPlus);
      number -= 1;
      break;
    }
  }
  std::reverse(trits.begin(), trits.end());
  return BalancedTernary(std::move(trits));
}

std::int64_t BalancedTernary::Value() const {
  auto value = ValueChecked();
  if (!value.has_value()) {
    throw OverflowError(fmt::format(
        "value of '{}' does not fit in a 64-bit integer", ToString()));
  }
  return value.value();
}

std::optional<std::int64_t> BalancedTernary::ValueChecked() const {
  // total * 3 + trit is summed as trit + total + total + total, so every
  // partial sum lies between the trit and the next total.
  std::int64_t total = 0;
  for (auto trit : trits_) {
    std::optional<std::int64_t> next = TritValue(trit);
    for (int i = 0; i < 3 && next.has_value(); ++i) {
      next = utils::checked::Add<std::int64_t>(next.value(), total);
    }
    if (!next.has_value()) {
      return std::nullopt;
    }
    total = next.value();
  }
  return total;
}

std::string BalancedTernary::ToString() const {
  std::string result;
  result.reserve(trits_.size());
  for (auto trit : trits_) {
    result.push_back(TritToChar(trit));
  }
  return result;
}

const std::vector<Trit> &BalancedTernary::Trits() const { return trits_; }

bool BalancedTernary::operator==(const BalancedTernary &other) const {
  return trits_ == other.trits_;
}

bool BalancedTernary::operator!=(const BalancedTernary &other) const {
  return !(*this == other);
}

} // namespace numerals
