#include "core/fixed_point.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

namespace yield_oracle::core {

model::rate_t saturate(const wide_t value) noexcept {
  constexpr model::rate_t kMax = std::numeric_limits<model::rate_t>::max();
  return value > kMax ? kMax : static_cast<model::rate_t>(value);
}

model::rate_t parse_fixed(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("fixed point value must not be empty");
  }

  wide_t integer_part = 0;
  wide_t fraction_part = 0;
  std::uint32_t fraction_digits = 0;
  bool seen_dot = false;
  bool seen_digit = false;

  for (const char c : text) {
    if (c == '.') {
      if (seen_dot) {
        throw std::invalid_argument("fixed point value has more than one '.': " + text);
      }
      seen_dot = true;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      throw std::invalid_argument("fixed point value must be a plain decimal: " + text);
    }
    seen_digit = true;
    const auto digit = static_cast<wide_t>(c - '0');
    if (!seen_dot) {
      integer_part = integer_part * 10U + digit;
      if (integer_part > std::numeric_limits<model::rate_t>::max()) {
        throw std::invalid_argument("fixed point value out of range: " + text);
      }
      continue;
    }
    if (fraction_digits == kRateDecimals) {
      throw std::invalid_argument("fixed point value has more than 18 decimals: " + text);
    }
    fraction_part = fraction_part * 10U + digit;
    ++fraction_digits;
  }

  if (!seen_digit) {
    throw std::invalid_argument("fixed point value has no digits: " + text);
  }

  while (fraction_digits < kRateDecimals) {
    fraction_part *= 10U;
    ++fraction_digits;
  }

  const wide_t value = integer_part * kRateScale + fraction_part;
  if (value > std::numeric_limits<model::rate_t>::max()) {
    throw std::invalid_argument("fixed point value out of range: " + text);
  }
  return static_cast<model::rate_t>(value);
}

std::string format_fixed(const model::rate_t value) {
  std::string fraction = std::to_string(value % kRateScale);
  fraction.insert(0, kRateDecimals - fraction.size(), '0');
  return std::to_string(value / kRateScale) + "." + fraction;
}

double annualized_percent(const model::rate_t per_second_rate) noexcept {
  return static_cast<double>(per_second_rate) / static_cast<double>(kRateScale) *
         static_cast<double>(kSecondsPerYear) * 100.0;
}

}  // namespace yield_oracle::core
