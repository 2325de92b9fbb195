#pragma once

#include <cstdint>
#include <string>

#include "model/snapshot.hpp"

namespace yield_oracle::core {

using wide_t = unsigned __int128;

inline constexpr model::rate_t kRateScale = 1'000'000'000'000'000'000ULL;
inline constexpr std::uint32_t kRateDecimals = 18;
inline constexpr std::uint64_t kSecondsPerYear = 365ULL * 24ULL * 60ULL * 60ULL;

// a * b / 1e18, truncating, kept wide so sums of products can be checked once.
inline constexpr wide_t mul_fixed_wide(const model::rate_t a, const model::rate_t b) noexcept {
  return (static_cast<wide_t>(a) * static_cast<wide_t>(b)) / kRateScale;
}

// Clamps a wide intermediate to the largest representable rate.
model::rate_t saturate(wide_t value) noexcept;

// Truncating (a + b) / 2 without intermediate overflow.
inline constexpr model::rate_t midpoint(const model::rate_t a, const model::rate_t b) noexcept {
  return static_cast<model::rate_t>((static_cast<wide_t>(a) + static_cast<wide_t>(b)) / 2U);
}

// Parses "0.05", "12", "1.5e-9" is not accepted. Throws std::invalid_argument.
model::rate_t parse_fixed(const std::string& text);

// Renders with all 18 decimals, e.g. "0.050000000000000000".
std::string format_fixed(model::rate_t value);

// Per-second rate rendered as an annual percentage, for human-facing output only.
double annualized_percent(model::rate_t per_second_rate) noexcept;

}  // namespace yield_oracle::core
