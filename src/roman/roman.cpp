#include "roman.hpp"

#include "../errors/errors.hpp"
#include "../utils/checked/checked.hpp"

#include <algorithm>
#include <array>
#include <fmt/core.h>
#include <utility>

namespace numerals {

namespace {
// (secondary, primary): secondary written before primary is worth
// primary - secondary.
constexpr std::array<std::pair<Numeral, Numeral>, 6> kSubtractivePairs{{
    {Numeral::kC, Numeral::kM},
    {Numeral::kC, Numeral::kD},
    {Numeral::kX, Numeral::kC},
    {Numeral::kX, Numeral::kL},
    {Numeral::kI, Numeral::kX},
    {Numeral::kI, Numeral::kV},
}};
} // namespace

Roman::Roman(std::vector<Numeral> numerals) : numerals_(std::move(numerals)) {}

Roman Roman::Parse(std::string_view text) {
  std::vector<Numeral> numerals;
  numerals.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    auto numeral = NumeralFromChar(text[i]);
    if (!numeral.has_value()) {
      throw InvalidNumeralText(i, text[i]);
    }
    numerals.push_back(numeral.value());
  }
  return Roman(std::move(numerals));
}

Roman Roman::FromInt(std::int16_t number) {
  if (number <= 0) {
    throw NonPositiveInput(number);
  }
  std::vector<Numeral> numerals;
  int rest = number;
  for (const auto &[secondary, primary] : kSubtractivePairs) {
    const int primary_weight = NumeralWeight(primary);
    while (rest >= primary_weight) {
      rest -= primary_weight;
      numerals.push_back(primary);
    }

    const int difference = primary_weight - NumeralWeight(secondary);
    if (rest >= difference) {
      rest -= difference;
      numerals.push_back(secondary);
      numerals.push_back(primary);
    }
  }
  numerals.insert(numerals.end(), static_cast<std::size_t>(rest), Numeral::kI);
  return Roman(std::move(numerals));
}

std::int16_t Roman::Value() const {
  auto value = ValueChecked();
  if (!value.has_value()) {
    throw OverflowError(fmt::format(
        "value of '{}' does not fit in a 16-bit integer", ToUpper()));
  }
  return value.value();
}

std::optional<std::int16_t> Roman::ValueChecked() const {
  std::int16_t total = 0;
  std::int16_t max_seen = 0;
  for (auto it = numerals_.rbegin(); it != numerals_.rend(); ++it) {
    const std::int16_t weight = NumeralWeight(*it);
    auto next = weight >= max_seen ? utils::checked::Add(total, weight)
                                   : utils::checked::Sub(total, weight);
    if (!next.has_value()) {
      return std::nullopt;
    }
    total = next.value();
    max_seen = std::max(max_seen, weight);
  }
  return total;
}

std::string Roman::ToUpper() const { return Render(LetterCase::kUpper); }

std::string Roman::ToLower() const { return Render(LetterCase::kLower); }

std::string Roman::Render(LetterCase letter_case) const {
  std::string result;
  result.reserve(numerals_.size());
  for (auto numeral : numerals_) {
    result.push_back(NumeralToChar(numeral, letter_case));
  }
  return result;
}

const std::vector<Numeral> &Roman::Numerals() const { return numerals_; }

bool Roman::operator==(const Roman &other) const {
  return numerals_ == other.numerals_;
}

bool Roman::operator!=(const Roman &other) const { return !(*this == other); }

} // namespace numerals
